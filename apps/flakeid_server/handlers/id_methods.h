#pragma once

#include <nlohmann/json.hpp>

#include "../method_handlers.h"

namespace flakeid::server::handlers {

// id/generate {count?: 1..max_batch} -> {node_id, ids: [decimal string...]}
// All-or-nothing: a clock regression part-way through discards the batch.
MethodOutcome handle_generate(const JsonRpcRequest& req, ServerContext& ctx);

// id/decode {id: decimal string | 0x hex string | integer} -> decoded fields
MethodOutcome handle_decode(const JsonRpcRequest& req, ServerContext& ctx);

// id/info {} -> node id resolution and bit layout
MethodOutcome handle_info(const JsonRpcRequest& req, ServerContext& ctx);

}  // namespace flakeid::server::handlers
