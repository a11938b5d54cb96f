#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"

#include <string>
#include <vector>

using namespace flakeid::server;

namespace {

ServerConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "flakeid_server");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

// ── Defaults ────────────────────────────────────────────────────────────────

TEST_CASE("parse_args: no flags means auto node id and default batch", "[startup][config]") {
  const auto config = parse({});
  CHECK_FALSE(config.node_id.has_value());
  CHECK(config.max_batch == kDefaultMaxBatch);
  CHECK(config.arg_errors.empty());
  CHECK(validate_server_config(config).empty());

  const auto setting = node_id_setting(config);
  REQUIRE(setting.has_value());
  CHECK(setting.value().is_auto());
}

TEST_CASE("parse_args: explicit node id and batch", "[startup][config]") {
  const auto config = parse({"--node-id", "17", "--max-batch", "256"});
  REQUIRE(config.node_id.has_value());
  CHECK(config.node_id.value() == "17");
  CHECK(config.max_batch == 256);
  CHECK(validate_server_config(config).empty());
}

TEST_CASE("parse_args: -1 is accepted as the auto sentinel", "[startup][config]") {
  const auto config = parse({"--node-id", "-1"});
  CHECK(validate_server_config(config).empty());
  CHECK(node_id_setting(config).value().is_auto());
}

// ── Rejections ──────────────────────────────────────────────────────────────

TEST_CASE("validate_server_config: node id out of range returns error", "[startup][config]") {
  CHECK_FALSE(validate_server_config(parse({"--node-id", "1024"})).empty());
  CHECK_FALSE(validate_server_config(parse({"--node-id", "-2"})).empty());
}

TEST_CASE("validate_server_config: non-numeric node id returns error", "[startup][config]") {
  CHECK_FALSE(validate_server_config(parse({"--node-id", "node-a"})).empty());
}

TEST_CASE("validate_server_config: max batch outside 1..4096 returns error",
          "[startup][config]") {
  CHECK_FALSE(validate_server_config(parse({"--max-batch", "0"})).empty());
  CHECK_FALSE(validate_server_config(parse({"--max-batch", "4097"})).empty());
  CHECK_FALSE(validate_server_config(parse({"--max-batch", "many"})).empty());
}

TEST_CASE("validate_server_config: unknown flag or missing value returns error",
          "[startup][config]") {
  CHECK_FALSE(validate_server_config(parse({"--db", "x.db"})).empty());
  CHECK_FALSE(validate_server_config(parse({"--node-id"})).empty());
  CHECK_FALSE(validate_server_config(parse({"stray"})).empty());
}
