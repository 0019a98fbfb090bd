#include "ipv4.hpp"

#include <arpa/inet.h>

#include <charconv>

#include "internal/util/errors.hpp"

namespace relay::network {

uint32_t ParseAddress(std::string_view text) {
  const std::string s(text);
  in_addr           addr{};
  if (inet_pton(AF_INET, s.c_str(), &addr) != 1) {
    throw util::InvalidArgument("invalid IPv4 address: " + s);
  }
  return ntohl(addr.s_addr);
}

Cidr ParseCidr(std::string_view text) {
  const auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    throw util::InvalidArgument("invalid CIDR (missing prefix): " + std::string(text));
  }

  const auto prefix_text = text.substr(slash + 1);
  unsigned   prefix      = 0;
  auto [ptr, ec]         = std::from_chars(prefix_text.data(), prefix_text.data() + prefix_text.size(), prefix);
  if (ec != std::errc{} || ptr != prefix_text.data() + prefix_text.size() || prefix > 32) {
    throw util::InvalidArgument("invalid CIDR prefix: " + std::string(text));
  }

  Cidr c;
  c.prefix = static_cast<uint8_t>(prefix);
  c.base   = ParseAddress(text.substr(0, slash)) & c.Mask();
  return c;
}

std::string FormatAddress(uint32_t address) {
  in_addr addr{};
  addr.s_addr = htonl(address);
  char buf[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
    throw util::InvalidArgument("unformattable IPv4 address");
  }
  return buf;
}

std::string FormatCidr(const Cidr& cidr) {
  return FormatAddress(cidr.First()) + "/" + std::to_string(cidr.prefix);
}

bool Overlaps(const Cidr& a, const Cidr& b) {
  return a.First() <= b.Last() && b.First() <= a.Last();
}

} // namespace relay::network
