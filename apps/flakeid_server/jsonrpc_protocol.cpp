#include "jsonrpc_protocol.h"

#include <cstdint>
#include <string>

namespace flakeid::server {

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  try {
    auto json = nlohmann::json::parse(json_str);
    if (!json.is_object()) {
      return std::nullopt;
    }

    JsonRpcRequest request;
    request.jsonrpc = json.value("jsonrpc", "2.0");

    if (json.contains("id")) {
      const auto& id_field = json["id"];
      if (id_field.is_string()) {
        request.id = id_field.get<std::string>();
      } else if (id_field.is_number_unsigned()) {
        request.id = std::to_string(id_field.get<std::uint64_t>());
      } else if (id_field.is_number_integer()) {
        request.id = std::to_string(id_field.get<std::int64_t>());
      }
    } else {
      request.is_notification = true;
    }

    request.method = json.value("method", "");
    request.params = json.value("params", nlohmann::json::object());

    return request;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

std::string make_response(const std::optional<std::string>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (id.has_value()) {
    response["id"] = id.value();
  } else {
    response["id"] = nullptr;
  }
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<std::string>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (id.has_value()) {
    response["id"] = id.value();
  } else {
    response["id"] = nullptr;
  }
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace flakeid::server
