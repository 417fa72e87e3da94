#include "internal/util/cidr.hpp"

#include <charconv>

namespace vera::util {

std::uint32_t Ipv4Cidr::Mask() const {
  return prefix == 0 ? 0 : ~std::uint32_t{0} << (32 - prefix);
}

std::uint64_t Ipv4Cidr::Size() const {
  return std::uint64_t{1} << (32 - prefix);
}

bool Ipv4Cidr::Contains(const Ipv4Cidr& other) const {
  return other.prefix >= prefix && (other.network & Mask()) == network;
}

bool Ipv4Cidr::Overlaps(const Ipv4Cidr& other) const {
  return Contains(other) || other.Contains(*this);
}

std::string Ipv4Cidr::ToString() const {
  return FormatIpv4(network) + "/" + std::to_string(prefix);
}

std::optional<std::uint32_t> ParseIpv4(std::string_view text) {
  std::uint32_t address = 0;
  for (int octet = 0; octet < 4; ++octet) {
    if (octet > 0) {
      if (text.empty() || text.front() != '.') return std::nullopt;
      text.remove_prefix(1);
    }
    unsigned value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    const auto digits    = static_cast<std::size_t>(end - text.data());
    if (ec != std::errc{} || digits == 0 || digits > 3 || value > 255) return std::nullopt;
    address = (address << 8) | value;
    text.remove_prefix(digits);
  }
  if (!text.empty()) return std::nullopt;
  return address;
}

std::string FormatIpv4(std::uint32_t address) {
  return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) + "." + std::to_string((address >> 8) & 0xFF) +
         "." + std::to_string(address & 0xFF);
}

std::optional<Ipv4Cidr> ParseIpv4Cidr(std::string_view text) {
  const auto slash = text.find('/');
  if (slash == std::string_view::npos) return std::nullopt;

  const auto address = ParseIpv4(text.substr(0, slash));
  if (!address) return std::nullopt;

  const auto prefix_text = text.substr(slash + 1);
  int        prefix      = 0;
  const auto [end, ec]   = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
  if (ec != std::errc{} || end != prefix_text.data() + prefix_text.size() || prefix < 0 || prefix > 32) return std::nullopt;

  Ipv4Cidr cidr{*address, prefix};
  if ((cidr.network & cidr.Mask()) != cidr.network) return std::nullopt;
  return cidr;
}

} // namespace vera::util
