#include "bridge/cat_engine_bridge.h"

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace {

using cat_test::TestSuite;

// Takes ownership of a bridge string and parses it.
nlohmann::json take(char* raw) {
  if (!raw) {
    return nullptr;
  }
  std::string text(raw);
  cat_free_string(raw);
  return nlohmann::json::parse(text);
}

bool is_ok(const nlohmann::json& payload) {
  return payload.is_object() && payload.value("status", std::string()) == "ok";
}

bool is_error(const nlohmann::json& payload, const std::string& kind) {
  return payload.is_object() && payload.value("status", std::string()) == "error" &&
         payload.value("kind", std::string()) == kind;
}

const char* kBank = R"({
  "items": [
    {"id": "q1", "stem": "s1", "format": "true_false", "topic": "t", "parameter": {"difficulty": -1.0}},
    {"id": "q2", "stem": "s2", "format": "true_false", "topic": "t", "parameter": {"difficulty": 0.0}},
    {"id": "q3", "stem": "s3", "format": "true_false", "topic": "t", "parameter": {"difficulty": 1.0}},
    {"id": "q4", "stem": "s4", "format": "true_false", "topic": "t", "parameter": {"difficulty": 2.0}}
  ]
})";

void test_requires_bank(TestSuite& suite) {
  auto payload = take(cat_start_session(R"({"learner": {"id": "l1", "name": "Kim"}})"));
  suite.require(is_error(payload, "NoItemBank"), "starting before loading a bank should fail");
}

void test_flow(TestSuite& suite) {
  auto loaded = take(cat_load_item_bank(kBank, nullptr));
  suite.require(is_ok(loaded) && loaded.at("item_count").get<int>() == 4,
                "bank should load through the bridge");

  auto started = take(cat_start_session(
      R"({"learner": {"id": "l1", "name": "Kim"},
          "criteria": {"target_standard_error": 0.0, "max_items": 4, "mastery_theta": null,
                       "max_stall_count": 100}})"));
  suite.require(is_ok(started), "session should start");
  const auto session_id = started.value("session_id", std::string());
  suite.require(!session_id.empty(), "start should return a session id");

  auto next = take(cat_next_item(session_id.c_str()));
  suite.require(is_ok(next) && next.value("type", std::string()) == "item",
                "next should return an item");

  const auto item_id = next.at("item").at("id").get<std::string>();
  nlohmann::json submission = {{"item_id", item_id}, {"is_correct", true},
                               {"response_time_ms", 1500}};
  auto after = take(cat_submit_response(session_id.c_str(), submission.dump().c_str()));
  suite.require(is_ok(after) && after.value("type", std::string()) == "item",
                "submit should return the next item");

  auto duplicate = take(cat_submit_response(session_id.c_str(), submission.dump().c_str()));
  suite.require(is_error(duplicate, "UnknownOrDuplicateItem"),
                "resubmitting should produce an error envelope");

  auto checkpoint = take(cat_serialize_checkpoint(session_id.c_str()));
  suite.require(is_ok(checkpoint) && checkpoint.contains("snapshot"),
                "checkpoint should carry a snapshot");

  auto report = take(cat_session_report(session_id.c_str()));
  suite.require(is_ok(report) && report.at("report").at("total_count").get<int>() == 1,
                "report should count one response");

  auto ended = take(cat_end_session(session_id.c_str()));
  suite.require(is_ok(ended) && ended.at("report").at("correct_count").get<int>() == 1,
                "end should return the final report");

  auto gone = take(cat_next_item(session_id.c_str()));
  suite.require(is_error(gone, "UnknownSession"), "ended sessions should be unknown");

  const auto snapshot_text = checkpoint.at("snapshot").dump();
  auto restored = take(cat_deserialize_checkpoint(snapshot_text.c_str()));
  suite.require(is_ok(restored) && restored.value("session_id", std::string()) == session_id,
                "checkpoint should restore under its id");
  auto resumed = take(cat_next_item(session_id.c_str()));
  suite.require(is_ok(resumed) && resumed.value("type", std::string()) == "item" &&
                    resumed.at("item").at("id").get<std::string>() ==
                        after.at("item").at("id").get<std::string>(),
                "restored session should offer the same next item");
}

void test_bad_input(TestSuite& suite) {
  auto malformed = take(cat_start_session("{not json"));
  suite.require(is_error(malformed, "InvalidJson"), "malformed json should be reported");

  auto missing = take(cat_next_item(nullptr));
  suite.require(is_error(missing, "InvalidArgument"), "null session ids should be reported");

  auto bad_snapshot = take(cat_deserialize_checkpoint(R"({"schema_version": 1})"));
  suite.require(is_error(bad_snapshot, "InvalidSnapshot"),
                "incomplete snapshots should be rejected");

  auto garbage_snapshot = take(cat_deserialize_checkpoint("[[["));
  suite.require(is_error(garbage_snapshot, "InvalidSnapshot"),
                "unparsable snapshots should be rejected");

  auto empty_topic = take(cat_start_session(
      R"({"learner": {"name": "Kim"}, "topic": "history"})"));
  suite.require(is_error(empty_topic, "ItemPoolEmpty"), "empty topics should be reported");

  auto bad_bank = take(cat_load_item_bank(R"({"items": [{"id": "x"}]})", nullptr));
  suite.require(is_error(bad_bank, "InvalidArgument"), "invalid banks should be reported");
}

} // namespace

int main() {
  TestSuite suite;
  test_requires_bank(suite);
  test_flow(suite);
  test_bad_input(suite);
  if (!suite.ok) {
    return 1;
  }
  std::cout << "test_bridge passed" << std::endl;
  return 0;
}
