#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace flakeid::server {

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Method registry
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    std::cerr << "Received: " << request.method << "\n";

    // Dispatch via method registry
    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      if (request.is_notification) {
        std::cerr << "Error: unknown notification: " << request.method << "\n";
        continue;
      }
      out << make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method)
          << "\n"
          << std::flush;
      continue;
    }

    const auto outcome = it->second(request, ctx);
    if (request.is_notification) {
      if (!outcome.has_value()) {
        std::cerr << "Error: " << request.method << ": " << outcome.error().message << "\n";
      }
      continue;
    }
    if (outcome.has_value()) {
      out << make_response(request.id, outcome.value()) << "\n" << std::flush;
    } else {
      const auto& error = outcome.error();
      std::cerr << "Error: " << request.method << ": " << error.message << "\n";
      out << make_error_response(request.id, error.code, error.message, error.data) << "\n"
          << std::flush;
    }
  }

  std::cerr << "flakeid server shutting down\n";
}

}  // namespace flakeid::server
