#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

namespace relay::grpc {

// Secret from "authorization: Bearer <secret>"; empty when absent.
std::string BearerSecret(const ::grpc::ServerContextBase& ctx);

} // namespace relay::grpc
