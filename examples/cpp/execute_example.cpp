#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/relay_client.h"
#include "internal/crypto/cipher_service.hpp"

// Creates a tenant, asks for a move_mouse unit and opens it locally with the key it carries.
int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  relay::client::RelayClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  try {
    const auto tenant = client.CreateTenant("example");
    client.SetSecret(tenant.secret());
    std::cout << "tenant " << tenant.tenant_id() << '\n';

    google::protobuf::Struct args;
    (*args.mutable_fields())["x"].set_number_value(100);
    (*args.mutable_fields())["y"].set_number_value(200);

    const auto unit = client.Execute("move_mouse", args);
    std::cout << "script=" << unit.script_name() << " helpers=" << unit.helper_scripts_size() << " args=";
    for (const auto& arg : unit.arguments()) std::cout << arg << ' ';
    std::cout << '\n';

    relay::crypto::CipherService cipher;
    const auto key    = relay::crypto::KeyFromHex(unit.decryption().key());
    const auto script = cipher.DecryptHex(unit.encrypted_script(), unit.iv(), unit.auth_tag(), key);
    std::cout << "decrypted " << script.size() << " bytes\n";
  } catch (const relay::client::RpcError& e) {
    std::cerr << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "local decrypt failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
