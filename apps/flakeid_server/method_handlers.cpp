#include "method_handlers.h"

#include "flakeid/core/version.h"

#include "handlers/id_methods.h"

namespace flakeid::server {

using json = nlohmann::json;

MethodOutcome handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  return MethodOutcome::ok(json{
      {"serverInfo", {{"name", "flakeid"}, {"version", core::kBuildVersion}}},
      {"methods", json::array({"initialize", "id/generate", "id/decode", "id/info"})},
      {"max_batch", ctx.config.max_batch},
  });
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"id/generate", handlers::handle_generate},
      {"id/decode", handlers::handle_decode},
      {"id/info", handlers::handle_info},
  };
}

}  // namespace flakeid::server
