#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace relay::network {

// Host byte order throughout.
struct Cidr {
  uint32_t base   = 0;
  uint8_t  prefix = 0;

  uint32_t Mask() const {
    return prefix == 0 ? 0u : ~uint32_t{0} << (32 - prefix);
  }
  uint32_t First() const {
    return base & Mask();
  }
  uint32_t Last() const {
    return First() | ~Mask();
  }
  bool Contains(uint32_t address) const {
    return (address & Mask()) == First();
  }
};

// Throw util::InvalidArgument on malformed input.
uint32_t ParseAddress(std::string_view text);
Cidr     ParseCidr(std::string_view text);

std::string FormatAddress(uint32_t address);
std::string FormatCidr(const Cidr& cidr);

bool Overlaps(const Cidr& a, const Cidr& b);

} // namespace relay::network
