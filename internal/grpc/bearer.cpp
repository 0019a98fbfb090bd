#include "bearer.hpp"

#include <string_view>

namespace relay::grpc {

std::string BearerSecret(const ::grpc::ServerContextBase& ctx) {
  const auto& md = ctx.client_metadata();
  auto        it = md.find("authorization");
  if (it == md.end()) return {};

  std::string value(it->second.data(), it->second.size());
  constexpr std::string_view kPrefix = "Bearer ";
  if (value.compare(0, kPrefix.size(), kPrefix) == 0) {
    value.erase(0, kPrefix.size());
  }
  return value;
}

} // namespace relay::grpc
