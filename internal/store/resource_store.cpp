#include "internal/store/resource_store.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <set>
#include <utility>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace vera::store {

using model::Resource;
using model::ResourceType;
using model::ResourceTypeDescriptor;

// ------------------------------------------------------------
// Undo log
// ------------------------------------------------------------

/*
  Writes made inside one transaction, oldest first. Rolling back walks it in
  reverse so every entry is undone against the state it produced.
*/
struct UndoLog {
  enum class Kind { kCreated, kUpdated, kDeleted };

  struct Entry {
    Kind     kind;
    Resource prior;                     // kCreated: only type and id are set
    std::size_t           position = 0; // kDeleted: slot in the type's order
    std::set<std::string> referrers;    // kDeleted: dropped reverse index entry
  };

  std::vector<Entry> entries;
};

// ------------------------------------------------------------
// StoreView
// ------------------------------------------------------------

std::vector<const Resource*> StoreView::List(ResourceType type) const {
  std::vector<const Resource*> out;
  const auto*                  table = store_.FindTable(type);
  if (!table) return out;

  out.reserve(table->order.size());
  for (const auto& id : table->order) {
    out.push_back(&table->by_id.at(id));
  }
  return out;
}

const Resource* StoreView::Find(ResourceType type, std::string_view id) const {
  return store_.FindLocked(type, id);
}

const Resource& StoreView::Get(ResourceType type, const std::string& id) const {
  const auto* resource = store_.FindLocked(type, id);
  if (!resource) store_.ThrowNotFound(type, id);
  return *resource;
}

const Resource* StoreView::FindAny(std::string_view id) const {
  return store_.FindAnyLocked(id);
}

std::vector<std::string> StoreView::ReferencersOf(const std::string& id) const {
  const auto it = store_.referrers_.find(id);
  if (it == store_.referrers_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

// ------------------------------------------------------------
// StoreTransaction
// ------------------------------------------------------------

StoreTransaction::StoreTransaction(ResourceStore& store, UndoLog& log) : StoreView(store), writer_(store), log_(log) {
}

Resource StoreTransaction::Create(ResourceType type, model::Value attributes, std::vector<model::Tag> tags) {
  return writer_.CreateLocked(type, std::move(attributes), std::move(tags), log_);
}

Resource StoreTransaction::Update(ResourceType type, const std::string& id, const Mutator& mutator) {
  return writer_.UpdateLocked(type, id, mutator, log_);
}

void StoreTransaction::Delete(ResourceType type, const std::string& id, const std::function<void(const StoreView&)>& precondition) {
  writer_.DeleteLocked(type, id, precondition, log_);
}

// ------------------------------------------------------------
// ResourceStore
// ------------------------------------------------------------

ResourceStore::ResourceStore(std::shared_ptr<const model::ResourceTypeRegistry> registry, StoreOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {
  if (!options_.id_source) {
    options_.id_source = [](std::size_t length) { return util::RandomHex(length); };
  }
  if (options_.id_max_attempts == 0) {
    options_.id_max_attempts = 1;
  }
}

void ResourceStore::Transact(const std::function<void(StoreTransaction&)>& body) {
  UndoLog log;
  {
    std::unique_lock lock(mutex_);
    StoreTransaction transaction(*this, log);
    try {
      body(transaction);
    } catch (...) {
      Rollback(log);
      throw;
    }
  }
  RecordChanges(log);
}

Resource ResourceStore::Create(ResourceType type, model::Value attributes, std::vector<model::Tag> tags, const Precondition& precondition) {
  Resource created;
  Transact([&](StoreTransaction& transaction) {
    if (precondition) precondition(transaction);
    created = transaction.Create(type, std::move(attributes), std::move(tags));
  });
  return created;
}

Resource ResourceStore::Get(ResourceType type, const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto*      resource = FindLocked(type, id);
  if (!resource) ThrowNotFound(type, id);
  return *resource;
}

std::optional<Resource> ResourceStore::Lookup(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto*      resource = FindAnyLocked(id);
  if (!resource) return std::nullopt;
  return *resource;
}

std::vector<Resource> ResourceStore::List(ResourceType type) const {
  std::shared_lock      lock(mutex_);
  std::vector<Resource> out;
  const auto*           table = FindTable(type);
  if (!table) return out;

  out.reserve(table->order.size());
  for (const auto& id : table->order) {
    out.push_back(table->by_id.at(id));
  }
  return out;
}

Resource ResourceStore::Update(ResourceType type, const std::string& id, const Mutator& mutator) {
  Resource updated;
  Transact([&](StoreTransaction& transaction) { updated = transaction.Update(type, id, mutator); });
  return updated;
}

void ResourceStore::Delete(ResourceType type, const std::string& id, const Precondition& precondition) {
  Transact([&](StoreTransaction& transaction) { transaction.Delete(type, id, precondition); });
}

Resource ResourceStore::TagResource(const std::string& id, const std::vector<model::Tag>& tags) {
  std::unique_lock lock(mutex_);
  auto*            resource = FindAnyLocked(id);
  if (!resource) ThrowNotFound(std::nullopt, id);

  model::MergeTags(resource->tags, tags);
  return *resource;
}

Resource ResourceStore::UntagResource(const std::string& id, const std::vector<TagSelector>& selectors) {
  std::unique_lock lock(mutex_);
  auto*            resource = FindAnyLocked(id);
  if (!resource) ThrowNotFound(std::nullopt, id);

  auto& tags = resource->tags;
  for (const auto& selector : selectors) {
    tags.erase(std::remove_if(tags.begin(), tags.end(),
                              [&](const model::Tag& tag) {
                                return tag.key == selector.key && (!selector.value || *selector.value == tag.value);
                              }),
               tags.end());
  }
  return *resource;
}

Resource ResourceStore::UntagResource(const std::string& id, const std::vector<std::string>& keys) {
  std::vector<TagSelector> selectors;
  selectors.reserve(keys.size());
  for (const auto& key : keys) {
    selectors.push_back({key, std::nullopt});
  }
  return UntagResource(id, selectors);
}

std::vector<std::string> ResourceStore::ReferencersOf(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto       it = referrers_.find(id);
  if (it == referrers_.end()) return {};
  return {it->second.begin(), it->second.end()};
}

std::vector<std::pair<ResourceType, std::size_t>> ResourceStore::Counts() const {
  std::shared_lock                                  lock(mutex_);
  std::vector<std::pair<ResourceType, std::size_t>> out;
  for (const auto& descriptor : registry_->All()) {
    const auto* table = FindTable(descriptor.type);
    out.emplace_back(descriptor.type, table ? table->order.size() : 0);
  }
  return out;
}

void ResourceStore::Reset() {
  std::unique_lock lock(mutex_);
  // Ids stay unique for the life of the process, across resets too.
  for (const auto& [id, type] : id_index_) {
    retired_ids_.insert(id);
  }
  tables_.clear();
  id_index_.clear();
  referrers_.clear();
}

// ------------------------------------------------------------
// Internals (caller holds the lock)
// ------------------------------------------------------------

ResourceStore::Table& ResourceStore::TableFor(ResourceType type) {
  return tables_[type];
}

const ResourceStore::Table* ResourceStore::FindTable(ResourceType type) const {
  const auto it = tables_.find(type);
  return it == tables_.end() ? nullptr : &it->second;
}

Resource& ResourceStore::FindOrThrow(ResourceType type, const std::string& id) {
  auto& table = TableFor(type);
  auto  it    = table.by_id.find(id);
  if (it == table.by_id.end()) ThrowNotFound(type, id);
  return it->second;
}

const Resource* ResourceStore::FindLocked(ResourceType type, std::string_view id) const {
  const auto* table = FindTable(type);
  if (!table) return nullptr;
  const auto it = table->by_id.find(std::string(id));
  return it == table->by_id.end() ? nullptr : &it->second;
}

Resource* ResourceStore::FindAnyLocked(std::string_view id) {
  return const_cast<Resource*>(std::as_const(*this).FindAnyLocked(id));
}

const Resource* ResourceStore::FindAnyLocked(std::string_view id) const {
  const auto it = id_index_.find(std::string(id));
  if (it == id_index_.end()) return nullptr;
  return FindLocked(it->second, id);
}

Resource& ResourceStore::CreateLocked(ResourceType type, model::Value attributes, std::vector<model::Tag> tags, UndoLog& log) {
  const auto& descriptor = registry_->Get(type);
  if (!attributes.IsMap()) {
    throw util::ValidationFailed("InvalidParameterValue", "attributes of a " + descriptor.name + " must be a mapping");
  }

  Resource resource;
  resource.type       = type;
  resource.attributes = std::move(attributes);
  resource.created_at = util::Now();
  resource.state      = descriptor.initial_state;
  model::MergeTags(resource.tags, tags);

  const auto refs = ExtractReferences(resource);
  VerifyReferences(resource, {});

  resource.id = AllocateId(descriptor);
  resource.attributes.Set(descriptor.id_attribute, resource.id);

  Resource marker;
  marker.type = type;
  marker.id   = resource.id;
  log.entries.push_back({UndoLog::Kind::kCreated, std::move(marker)});

  auto& table = TableFor(type);
  table.order.push_back(resource.id);
  id_index_.emplace(resource.id, type);
  IndexReferences(resource.id, refs);

  const auto [it, inserted] = table.by_id.emplace(resource.id, std::move(resource));
  return it->second;
}

Resource& ResourceStore::UpdateLocked(ResourceType type, const std::string& id, const Mutator& mutator, UndoLog& log) {
  const auto& descriptor = registry_->Get(type);
  auto&       existing   = FindOrThrow(type, id);

  // The mutator works on a copy; nothing changes until every check passed.
  Resource working = existing;
  mutator(working);

  if (working.id != existing.id || working.type != existing.type || working.created_at != existing.created_at) {
    throw util::InternalError("update of " + id + " attempted to change the resource identity");
  }
  if (!working.attributes.IsMap()) {
    throw util::InternalError("update of " + id + " replaced the attribute mapping");
  }
  if (!descriptor.IsValidState(working.state)) {
    throw util::InternalError("state '" + working.state + "' is not valid for a " + descriptor.name);
  }

  // A terminal resource may keep references to resources deleted since; it
  // must therefore stay terminal.
  const bool was_terminal = descriptor.IsTerminalState(existing.state);
  if (was_terminal && !descriptor.IsTerminalState(working.state)) {
    throw util::ValidationFailed("IncorrectState", "The " + descriptor.name + " '" + id + "' is " + existing.state + " and cannot change to " + working.state);
  }
  working.attributes.Set(descriptor.id_attribute, working.id);

  const auto old_refs = ExtractReferences(existing);
  const auto new_refs = IndexableReferences(working);
  VerifyReferences(working, was_terminal ? old_refs : ReferenceSet{});

  log.entries.push_back({UndoLog::Kind::kUpdated, existing});
  UnindexReferences(id, old_refs);
  IndexReferences(id, new_refs);
  existing = std::move(working);
  return existing;
}

void ResourceStore::DeleteLocked(ResourceType type, const std::string& id, const Precondition& precondition, UndoLog& log) {
  const auto& target = FindOrThrow(type, id);

  if (precondition) {
    precondition(StoreView(*this));
  }

  std::vector<const Resource*> doomed{&target};
  CollectCascade(target, target, doomed);

  // Copy keys first: erasing invalidates the pointers in `doomed`.
  std::vector<std::pair<ResourceType, std::string>> keys;
  keys.reserve(doomed.size());
  for (const auto* resource : doomed) {
    keys.emplace_back(resource->type, resource->id);
  }

  for (const auto& [doomed_type, doomed_id] : keys) {
    auto& table = TableFor(doomed_type);
    auto  it    = table.by_id.find(doomed_id);
    if (it == table.by_id.end()) continue;

    UndoLog::Entry entry{UndoLog::Kind::kDeleted, it->second};
    const auto     slot = std::find(table.order.begin(), table.order.end(), doomed_id);
    entry.position      = static_cast<std::size_t>(slot - table.order.begin());
    if (auto refs = referrers_.find(doomed_id); refs != referrers_.end()) entry.referrers = refs->second;
    log.entries.push_back(std::move(entry));

    UnindexReferences(doomed_id, ExtractReferences(it->second));
    referrers_.erase(doomed_id);
    id_index_.erase(doomed_id);
    retired_ids_.insert(doomed_id);
    if (slot != table.order.end()) table.order.erase(slot);
    table.by_id.erase(it);
  }
}

void ResourceStore::Rollback(UndoLog& log) {
  for (auto entry = log.entries.rbegin(); entry != log.entries.rend(); ++entry) {
    auto&             table = TableFor(entry->prior.type);
    const std::string id    = entry->prior.id;

    switch (entry->kind) {
      case UndoLog::Kind::kCreated: {
        auto it = table.by_id.find(id);
        if (it == table.by_id.end()) break;
        UnindexReferences(id, ExtractReferences(it->second));
        referrers_.erase(id);
        id_index_.erase(id);
        table.order.erase(std::remove(table.order.begin(), table.order.end(), id), table.order.end());
        table.by_id.erase(it);
        break;
      }
      case UndoLog::Kind::kUpdated: {
        auto it = table.by_id.find(id);
        if (it == table.by_id.end()) break;
        UnindexReferences(id, ExtractReferences(it->second));
        IndexReferences(id, IndexableReferences(entry->prior));
        it->second = std::move(entry->prior);
        break;
      }
      case UndoLog::Kind::kDeleted: {
        const auto position = std::min(entry->position, table.order.size());
        table.order.insert(table.order.begin() + static_cast<std::ptrdiff_t>(position), id);
        id_index_.emplace(id, entry->prior.type);
        retired_ids_.erase(id);
        IndexReferences(id, ExtractReferences(entry->prior));
        if (!entry->referrers.empty()) referrers_[id] = std::move(entry->referrers);
        table.by_id.emplace(id, std::move(entry->prior));
        break;
      }
    }
  }
  log.entries.clear();
}

void ResourceStore::RecordChanges(const UndoLog& log) const {
  for (const auto& entry : log.entries) {
    if (entry.kind == UndoLog::Kind::kUpdated) continue;
    observability::Metrics::Instance().RecordResourceChange(registry_->Get(entry.prior.type).name,
                                                            entry.kind == UndoLog::Kind::kCreated ? "create" : "delete");
  }
}

std::string ResourceStore::AllocateId(const ResourceTypeDescriptor& descriptor) const {
  const auto length = model::SuffixLength(descriptor.id_style);
  for (std::size_t attempt = 0; attempt < options_.id_max_attempts; ++attempt) {
    auto id = descriptor.id_prefix + "-" + options_.id_source(length);
    if (!id_index_.contains(id) && !retired_ids_.contains(id)) return id;
  }
  throw util::InternalError("could not allocate a unique " + descriptor.name + " id after " + std::to_string(options_.id_max_attempts) +
                            " attempts");
}

ResourceStore::ReferenceSet ResourceStore::ExtractReferences(const Resource& resource) const {
  ReferenceSet refs;
  const auto&  descriptor = registry_->Get(resource.type);
  for (const auto& field : descriptor.references) {
    std::vector<std::string> values;
    model::CollectScalars(resource.attributes, field.path, values);
    for (auto& value : values) {
      if (!value.empty()) refs.insert(std::move(value));
    }
  }
  return refs;
}

ResourceStore::ReferenceSet ResourceStore::IndexableReferences(const Resource& resource) const {
  auto refs = ExtractReferences(resource);
  // Dead targets of a terminal resource stay out of the reverse index.
  if (registry_->Get(resource.type).IsTerminalState(resource.state)) {
    std::erase_if(refs, [&](const std::string& target) { return !id_index_.contains(target); });
  }
  return refs;
}

void ResourceStore::VerifyReferences(const Resource& resource, const ReferenceSet& already_indexed) const {
  const auto& descriptor = registry_->Get(resource.type);
  for (const auto& field : descriptor.references) {
    std::vector<std::string> values;
    model::CollectScalars(resource.attributes, field.path, values);
    for (const auto& value : values) {
      // References that were valid when first recorded stay valid even if the
      // target has since been removed underneath a terminal resource.
      if (value.empty() || already_indexed.contains(value)) continue;
      if (!FindLocked(field.target, value)) ThrowNotFound(field.target, value);
    }
  }
}

void ResourceStore::IndexReferences(const std::string& id, const ReferenceSet& refs) {
  for (const auto& target : refs) {
    referrers_[target].insert(id);
  }
}

void ResourceStore::UnindexReferences(const std::string& id, const ReferenceSet& refs) {
  for (const auto& target : refs) {
    auto it = referrers_.find(target);
    if (it == referrers_.end()) continue;
    it->second.erase(id);
    if (it->second.empty()) referrers_.erase(it);
  }
}

void ResourceStore::CollectCascade(const Resource& target, const Resource& root, std::vector<const Resource*>& doomed) const {
  const auto it = referrers_.find(target.id);
  if (it == referrers_.end()) return;

  const auto& target_descriptor = registry_->Get(target.type);
  for (const auto& referrer_id : it->second) {
    const auto type_it = id_index_.find(referrer_id);
    if (type_it == id_index_.end()) continue;
    const auto* referrer = FindLocked(type_it->second, referrer_id);
    if (!referrer) continue;

    if (registry_->Get(referrer->type).IsTerminalState(referrer->state)) continue;
    if (std::find(doomed.begin(), doomed.end(), referrer) != doomed.end()) continue;

    const bool cascades = std::any_of(target_descriptor.cascades.begin(), target_descriptor.cascades.end(), [&](const model::CascadeRule& rule) {
      if (rule.type != referrer->type) return false;
      if (rule.path.empty()) return true;
      std::vector<std::string> values;
      model::CollectScalars(referrer->attributes, rule.path, values);
      return std::find(values.begin(), values.end(), rule.equals) != values.end();
    });

    if (!cascades) {
      const auto& root_descriptor = registry_->Get(root.type);
      throw util::DependencyViolation("The " + root_descriptor.name + " '" + root.id + "' has dependencies and cannot be deleted.");
    }

    doomed.push_back(referrer);
    CollectCascade(*referrer, root, doomed);
  }
}

void ResourceStore::ThrowNotFound(std::optional<ResourceType> type, const std::string& id) const {
  if (!type) {
    if (const auto* descriptor = registry_->FindByIdPrefix(id)) type = descriptor->type;
  }
  const std::string name = type ? registry_->Get(*type).name : std::string("resource");
  throw util::NotFound(type, id, "The " + name + " ID '" + id + "' does not exist");
}

} // namespace vera::store
