#include "runtime/tensors/tensor_codec.h"
#include "server/http/http_server.h"
#include "server/node_runtime.h"
#include "tests/unit/test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;
using json = nlohmann::json;

namespace {

struct ServerFixture {
  testing::TempDir dir;
  NodeConfig config;
  std::unique_ptr<NodeRuntime> runtime;
  MetricsRegistry metrics;

  explicit ServerFixture(bool licensed = false) {
    testing::WritePlainGraphs(dir.path() / "blocks", testing::ThreeBlockChain());
    config.node_id = "node_a";
    config.warmup_runs = 0;
    config.scheduler = SchedulerPolicy{};
    config.license.enabled = licensed;

    NodeRuntimeParts parts;
    parts.network =
        ParseNetworkConfig(testing::SingleNodeNetworkJson(), dir.path());
    parts.metadata = testing::ThreeBlockMetadata();
    parts.backend = std::make_shared<testing::StubBackend>(parts.metadata);
    parts.telemetry_source = std::make_unique<testing::StubTelemetrySource>();
    parts.pipeline.memory_yield_ms = 0;
    runtime = std::make_unique<NodeRuntime>(config, std::move(parts));
  }
};

std::string StepBody(const std::string &session) {
  return json{{"session_id", session},
              {"step", 0},
              {"input_tensors",
               {{"input_ids",
                 TensorCodec::Encode(testing::InputIds({1, 2}))}}}}
      .dump();
}

} // namespace

TEST_CASE("HttpServer: health, metrics and stats endpoints", "[http]") {
  ServerFixture fx;
  fx.metrics.SetNodeId("node_a");
  HttpServer server("127.0.0.1", 0, fx.runtime.get(), &fx.metrics);

  HttpReply live = server.Dispatch("GET", "/livez", "");
  REQUIRE(live.status == 200);
  REQUIRE(json::parse(live.body)["status"] == "ok");

  HttpReply health = server.Dispatch("GET", "/healthz", "");
  REQUIRE(health.status == 200);
  REQUIRE(json::parse(health.body)["node_id"] == "node_a");

  HttpReply metrics = server.Dispatch("GET", "/metrics", "");
  REQUIRE(metrics.status == 200);
  REQUIRE(metrics.content_type.find("text/plain") == 0);
  REQUIRE(metrics.body.find("node=\"node_a\"") != std::string::npos);

  HttpReply stats = server.Dispatch("GET", "/v1/admin/stats", "");
  REQUIRE(stats.status == 200);
  REQUIRE(json::parse(stats.body).contains("kv_cache"));

  fx.runtime->Shutdown();
  REQUIRE(server.Dispatch("GET", "/healthz", "").status == 503);
}

TEST_CASE("HttpServer: pipeline step", "[http]") {
  ServerFixture fx;
  HttpServer server("127.0.0.1", 0, fx.runtime.get(), &fx.metrics);

  HttpReply ok = server.Dispatch("POST", "/v1/pipeline/step", StepBody("s1"));
  REQUIRE(ok.status == 200);
  json body = json::parse(ok.body);
  REQUIRE(body["status"] == "success");
  REQUIRE(TensorCodec::IsEncodedTensor(body["outputs"]["logits"]));

  SECTION("invalid JSON") {
    HttpReply bad = server.Dispatch("POST", "/v1/pipeline/step", "{nope");
    REQUIRE(bad.status == 400);
    REQUIRE(json::parse(bad.body)["error_type"] == "json_decode_error");
  }
  SECTION("missing fields") {
    HttpReply bad = server.Dispatch("POST", "/v1/pipeline/step",
                                    R"({"session_id": "s1"})");
    REQUIRE(bad.status == 400);
    json err = json::parse(bad.body);
    REQUIRE(err["error_type"] == "input_preparation_error");
    REQUIRE(err["session_id"] == "s1");
  }
  SECTION("undecodable tensor") {
    HttpReply bad = server.Dispatch(
        "POST", "/v1/pipeline/step",
        R"({"session_id": "s1", "input_tensors": {"input_ids":
            {"_tensor_": true, "dtype": "int64", "shape": [1, 2],
             "data_b64": "abc"}}})");
    REQUIRE(bad.status == 400);
    REQUIRE(json::parse(bad.body)["error_type"] == "format_error");
  }
  SECTION("failed step") {
    json request = json::parse(StepBody("s1"));
    request["target_block_id"] = "block_9";
    HttpReply failed =
        server.Dispatch("POST", "/v1/pipeline/step", request.dump());
    REQUIRE(failed.status == 500);
    REQUIRE(json::parse(failed.body)["error_type"] ==
            "input_preparation_error");
  }
  SECTION("wrong method") {
    REQUIRE(server.Dispatch("GET", "/v1/pipeline/step", "").status == 405);
  }
  SECTION("unknown route") {
    HttpReply missing = server.Dispatch("GET", "/v1/models", "");
    REQUIRE(missing.status == 404);
    REQUIRE(json::parse(missing.body)["error_type"] == "not_found");
  }
}

TEST_CASE("HttpServer: session authorization routes", "[http]") {
  ServerFixture fx(true);
  HttpServer server("127.0.0.1", 0, fx.runtime.get(), &fx.metrics);

  HttpReply denied =
      server.Dispatch("POST", "/v1/pipeline/step", StepBody("s1"));
  REQUIRE(denied.status == 403);
  REQUIRE(json::parse(denied.body)["error_type"] == "license_error");

  HttpReply no_key =
      server.Dispatch("POST", "/v1/sessions/s1/authorize", "{}");
  REQUIRE(no_key.status == 403);

  HttpReply authorized = server.Dispatch(
      "POST", "/v1/sessions/s1/authorize", R"({"license_key": "k-123"})");
  REQUIRE(authorized.status == 200);
  REQUIRE(json::parse(authorized.body)["status"] == "authorized");
  REQUIRE(server.Dispatch("POST", "/v1/pipeline/step", StepBody("s1")).status ==
          200);

  HttpReply revoked = server.Dispatch("DELETE", "/v1/sessions/s1", "");
  REQUIRE(revoked.status == 200);
  json body = json::parse(revoked.body);
  REQUIRE(body["status"] == "revoked");
  REQUIRE(body["was_authorized"] == true);
  REQUIRE(server.Dispatch("POST", "/v1/pipeline/step", StepBody("s1")).status ==
          403);
}

TEST_CASE("HttpServer: no runtime attached", "[http]") {
  MetricsRegistry metrics;
  HttpServer server("127.0.0.1", 0, nullptr, &metrics);
  REQUIRE(server.Dispatch("GET", "/livez", "").status == 200);
  REQUIRE(server.Dispatch("GET", "/healthz", "").status == 503);
  REQUIRE(server.Dispatch("POST", "/v1/pipeline/step", "{}").status == 503);
}
