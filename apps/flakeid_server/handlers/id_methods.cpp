#include "id_methods.h"

#include "flakeid/core/version.h"
#include "flakeid/id/id_json.h"

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::server::handlers {

using json = nlohmann::json;

namespace {

MethodOutcome invalid_params(const std::string& message) {
  return MethodOutcome::err(MethodError{kInvalidParams, message, json::object()});
}

}  // namespace

MethodOutcome handle_generate(const JsonRpcRequest& req, ServerContext& ctx) {
  std::int64_t count = 1;
  if (req.params.contains("count")) {
    const auto& count_json = req.params["count"];
    if (!count_json.is_number_integer()) {
      return invalid_params("count must be an integer");
    }
    count = count_json.get<std::int64_t>();
  }
  if (count < 1 || count > ctx.config.max_batch) {
    return invalid_params("count must be between 1 and " + std::to_string(ctx.config.max_batch));
  }

  json ids = json::array();
  for (std::int64_t i = 0; i < count; ++i) {
    const auto generated = ctx.generator.generate();
    if (!generated.has_value()) {
      return MethodOutcome::err(
          MethodError{kClockRegressionError, "System clock moved backwards; retry later",
                      json{{"error", std::string(core::to_string(generated.error()))}}});
    }
    ids.push_back(std::to_string(generated.value()));
  }

  return MethodOutcome::ok(json{{"node_id", ctx.generator.node_id()}, {"ids", ids}});
}

MethodOutcome handle_decode(const JsonRpcRequest& req, ServerContext& /*ctx*/) {
  if (!req.params.contains("id")) {
    return invalid_params("missing required parameter: id");
  }

  const auto& id_json = req.params["id"];
  std::optional<std::uint64_t> parsed;
  if (id_json.is_string()) {
    parsed = id::parse_id(id_json.get<std::string>());
  } else if (id_json.is_number_unsigned()) {
    parsed = id_json.get<std::uint64_t>();
  }

  if (!parsed.has_value()) {
    return invalid_params("id must be a decimal or 0x-prefixed hex string");
  }

  return MethodOutcome::ok(id::id_to_json(parsed.value()));
}

MethodOutcome handle_info(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  return MethodOutcome::ok(json{
      {"version", core::kBuildVersion},
      {"node", id::node_id_resolution_to_json(ctx.generator.node_id_resolution())},
      {"layout", id::layout_to_json()},
  });
}

}  // namespace flakeid::server::handlers
