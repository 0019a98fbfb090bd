#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "client/cpp/relay_client.h"

using relay::client::RelayClient;
using relay::client::RpcError;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl <addr> health\n"
            << "  relayctl <addr> tools\n"
            << "  relayctl <addr> execute <tool> [key=value ...]\n"
            << "  relayctl <addr> run <agent_id> <tool> [key=value ...]\n"
            << "  relayctl <addr> send <agent_id> <type> [json_payload]\n"
            << "  relayctl <addr> agents\n"
            << "  relayctl <addr> agent <agent_id>\n"
            << "  relayctl <addr> allocate|attach|release|teardown|network <tenant_id>\n"
            << "  relayctl <addr> networks\n"
            << "  relayctl <addr> stats\n"
            << "  relayctl <addr> create-tenant <name> [resource_name]\n"
            << "  relayctl <addr> invalidate [secret]\n"
            << "\n"
            << "The tenant secret is read from RELAY_SECRET.\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

// "key=value": value is taken as JSON when it parses, else as a plain string.
static google::protobuf::Struct ParseArguments(const std::vector<std::string>& pairs) {
  google::protobuf::Struct args;
  for (const auto& pair : pairs) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid argument '" << pair << "', expected key=value\n";
      std::exit(1);
    }

    const std::string key  = pair.substr(0, eq);
    const std::string text = pair.substr(eq + 1);

    google::protobuf::Value value;
    if (!google::protobuf::util::JsonStringToMessage(text, &value).ok()) {
      value.set_string_value(text);
    }
    (*args.mutable_fields())[key] = value;
  }
  return args;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];
  const std::vector<std::string> rest(argv + 3, argv + argc);

  const char* secret = std::getenv("RELAY_SECRET");

  RelayClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()), secret ? secret : "");
  client.SetDeadline(std::chrono::seconds(30));

  try {
    if (cmd == "health") {
      Print(client.Health());
      return 0;
    }

    if (cmd == "tools") {
      Print(client.ListTools());
      return 0;
    }

    if (cmd == "execute") {
      if (rest.empty()) return 1;
      Print(client.Execute(rest[0], ParseArguments({rest.begin() + 1, rest.end()})));
      return 0;
    }

    if (cmd == "run") {
      if (rest.size() < 2) return 1;
      Print(client.Run(rest[0], rest[1], ParseArguments({rest.begin() + 2, rest.end()})));
      return 0;
    }

    if (cmd == "send") {
      if (rest.size() < 2) return 1;

      google::protobuf::Value payload;
      if (rest.size() >= 3 && !google::protobuf::util::JsonStringToMessage(rest[2], &payload).ok()) {
        std::cerr << "payload is not valid JSON\n";
        return 1;
      }
      Print(client.SendCommand(rest[0], rest[1], payload));
      return 0;
    }

    if (cmd == "agents") {
      Print(client.ListAgents());
      return 0;
    }

    if (cmd == "agent") {
      if (rest.empty()) return 1;
      Print(client.GetAgent(rest[0]));
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "allocate" || cmd == "attach" || cmd == "release" || cmd == "teardown" || cmd == "network") {
      if (rest.empty()) return 1;

      const auto& tenant = rest[0];
      if (cmd == "allocate") Print(client.Allocate(tenant));
      if (cmd == "attach") Print(client.AttachRelay(tenant));
      if (cmd == "release") Print(client.Release(tenant));
      if (cmd == "teardown") Print(client.ConfirmTeardown(tenant));
      if (cmd == "network") Print(client.GetAllocation(tenant));
      return 0;
    }

    if (cmd == "networks") {
      Print(client.ListAllocations());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      Print(client.Stats());
      return 0;
    }

    if (cmd == "create-tenant") {
      if (rest.empty()) return 1;
      Print(client.CreateTenant(rest[0], rest.size() >= 2 ? rest[1] : ""));
      return 0;
    }

    if (cmd == "invalidate") {
      client.InvalidateCredential(rest.empty() ? "" : rest[0]);
      std::cout << "invalidated\n";
      return 0;
    }
  } catch (const RpcError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
