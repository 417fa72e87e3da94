#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/model/resource.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/model/value.hpp"

namespace vera::store {

class ResourceStore;
struct UndoLog;

using Mutator = std::function<void(model::Resource&)>;

/*
  Read-only view handed to preconditions and transactions. Valid only for the
  duration of the callback; the store's write lock is held while it runs.
  Pointers it returns are invalidated by the next write.
*/
class StoreView {
 public:
  std::vector<const model::Resource*> List(model::ResourceType type) const;
  const model::Resource*              Find(model::ResourceType type, std::string_view id) const;
  // Like Find, but a missing resource is NotFound.
  const model::Resource& Get(model::ResourceType type, const std::string& id) const;
  // Resource with `id` whatever its type.
  const model::Resource*   FindAny(std::string_view id) const;
  std::vector<std::string> ReferencersOf(const std::string& id) const;

 protected:
  friend class ResourceStore;
  explicit StoreView(const ResourceStore& store) : store_(store) {
  }

  const ResourceStore& store_;
};

/*
  Write access inside ResourceStore::Transact. Each call applies at once and
  sees the writes made before it. When the transaction body throws, every
  write made through the transaction is undone before the lock is released,
  so readers observe the store either before or after the whole body.

  The body runs under the write lock: it must not call back into the
  ResourceStore itself.
*/
class StoreTransaction : public StoreView {
 public:
  model::Resource Create(model::ResourceType type, model::Value attributes, std::vector<model::Tag> tags = {});
  model::Resource Update(model::ResourceType type, const std::string& id, const Mutator& mutator);
  void            Delete(model::ResourceType type, const std::string& id, const std::function<void(const StoreView&)>& precondition = {});

 private:
  friend class ResourceStore;
  StoreTransaction(ResourceStore& store, UndoLog& log);

  ResourceStore& writer_;
  UndoLog&       log_;
};

struct StoreOptions {
  // Attempts before id allocation gives up with InternalError.
  std::size_t id_max_attempts = 16;
  // Produces the random hex suffix of a new id. Defaults to util::RandomHex.
  std::function<std::string(std::size_t)> id_source;
};

// Removal request for UntagResource. With a value, the tag is removed only
// when its current value matches.
struct TagSelector {
  std::string                key;
  std::optional<std::string> value;
};

/*
  ResourceStore

  Owns every emulated resource. All mutation goes through these primitives
  so invariants are enforced in one place:

  - ids are allocated here and never reused within the process, not even
    after the resource was deleted or the store Reset
  - reference fields declared by the resource type are validated on
    create/update and tracked in a reverse index
  - Delete refuses while live resources outside the type's cascade rules
    reference the target
  - a resource in a terminal state never leaves it, so references it kept
    to since-deleted resources are never revived

  One reader/writer lock guards the whole store. Every check and the
  mutation it protects run in a single critical section, so a delete racing
  a create that references the same resource resolves to exactly one
  failure.
*/
class ResourceStore {
 public:
  using Precondition = std::function<void(const StoreView&)>;
  using Mutator      = store::Mutator;

  explicit ResourceStore(std::shared_ptr<const model::ResourceTypeRegistry> registry, StoreOptions options = {});

  ResourceStore(const ResourceStore&)            = delete;
  ResourceStore& operator=(const ResourceStore&) = delete;

  model::Resource Create(model::ResourceType type, model::Value attributes, std::vector<model::Tag> tags = {},
                         const Precondition& precondition = {});

  // Runs `body` as one atomic write. Exceptions from the body propagate
  // after its writes were rolled back.
  void Transact(const std::function<void(StoreTransaction&)>& body);

  model::Resource                Get(model::ResourceType type, const std::string& id) const;
  std::optional<model::Resource> Lookup(const std::string& id) const;
  std::vector<model::Resource>   List(model::ResourceType type) const;

  model::Resource Update(model::ResourceType type, const std::string& id, const Mutator& mutator);

  // The precondition runs under the write lock after the target was found and
  // before the cascade walk.
  void Delete(model::ResourceType type, const std::string& id, const Precondition& precondition = {});

  model::Resource TagResource(const std::string& id, const std::vector<model::Tag>& tags);
  model::Resource UntagResource(const std::string& id, const std::vector<TagSelector>& selectors);
  model::Resource UntagResource(const std::string& id, const std::vector<std::string>& keys);

  // Ids of resources whose reference fields point at `id`.
  std::vector<std::string> ReferencersOf(const std::string& id) const;

  std::vector<std::pair<model::ResourceType, std::size_t>> Counts() const;
  void                                                     Reset();

  const model::ResourceTypeRegistry& registry() const {
    return *registry_;
  }

 private:
  friend class StoreView;
  friend class StoreTransaction;

  struct Table {
    std::unordered_map<std::string, model::Resource> by_id;
    std::vector<std::string>                         order;
  };

  using ReferenceSet = std::set<std::string>;

  Table&                 TableFor(model::ResourceType type);
  const Table*           FindTable(model::ResourceType type) const;
  model::Resource&       FindOrThrow(model::ResourceType type, const std::string& id);
  const model::Resource* FindLocked(model::ResourceType type, std::string_view id) const;
  model::Resource*       FindAnyLocked(std::string_view id);
  const model::Resource* FindAnyLocked(std::string_view id) const;

  model::Resource& CreateLocked(model::ResourceType type, model::Value attributes, std::vector<model::Tag> tags, UndoLog& log);
  model::Resource& UpdateLocked(model::ResourceType type, const std::string& id, const Mutator& mutator, UndoLog& log);
  void             DeleteLocked(model::ResourceType type, const std::string& id, const Precondition& precondition, UndoLog& log);
  void             Rollback(UndoLog& log);
  void             RecordChanges(const UndoLog& log) const;

  std::string  AllocateId(const model::ResourceTypeDescriptor& descriptor) const;
  ReferenceSet ExtractReferences(const model::Resource& resource) const;
  ReferenceSet IndexableReferences(const model::Resource& resource) const;
  void         VerifyReferences(const model::Resource& resource, const ReferenceSet& already_indexed) const;
  void         IndexReferences(const std::string& id, const ReferenceSet& refs);
  void         UnindexReferences(const std::string& id, const ReferenceSet& refs);
  void         CollectCascade(const model::Resource& target, const model::Resource& root,
                              std::vector<const model::Resource*>& doomed) const;
  [[noreturn]] void ThrowNotFound(std::optional<model::ResourceType> type, const std::string& id) const;

  std::shared_ptr<const model::ResourceTypeRegistry> registry_;
  StoreOptions                                       options_;

  mutable std::shared_mutex                                  mutex_;
  std::unordered_map<model::ResourceType, Table>             tables_;
  std::unordered_map<std::string, model::ResourceType>       id_index_;
  std::unordered_map<std::string, ReferenceSet>              referrers_;
  // Ids of deleted resources; AllocateId never hands them out again.
  std::unordered_set<std::string> retired_ids_;
};

} // namespace vera::store
