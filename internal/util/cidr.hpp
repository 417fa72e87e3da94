#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vera::util {

// IPv4 network in CIDR notation. Host bits are always zero.
struct Ipv4Cidr {
  std::uint32_t network = 0;
  int           prefix  = 0;

  std::uint32_t Mask() const;
  // Number of addresses in the block.
  std::uint64_t Size() const;
  bool          Contains(const Ipv4Cidr& other) const;
  bool          Overlaps(const Ipv4Cidr& other) const;
  std::string   ToString() const;
};

// Dotted quad only; no shorthand forms.
std::optional<std::uint32_t> ParseIpv4(std::string_view text);
std::string                  FormatIpv4(std::uint32_t address);

// Rejects malformed input and blocks with host bits set.
std::optional<Ipv4Cidr> ParseIpv4Cidr(std::string_view text);

} // namespace vera::util
