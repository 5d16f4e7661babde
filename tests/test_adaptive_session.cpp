#include "cat/adaptive_session.hpp"
#include "cat/session_report.hpp"

#include "irt/ability_estimator.hpp"
#include "src/json_bridge.hpp"
#include "test_support.hpp"

#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using cat_test::near;
using cat_test::TestSuite;
using cat_test::throws_cat_error;

cat::TerminationCriteria criteria(double target_se, int max_items, std::optional<double> mastery,
                                  int max_stall) {
  cat::TerminationCriteria c;
  c.target_standard_error = target_se;
  c.max_items = max_items;
  c.mastery_theta = mastery;
  c.max_stall_count = max_stall;
  return c;
}

// Answers the offered items until the session completes. Returns the ids
// administered, in order.
std::vector<std::string> drive(cat::AdaptiveSession& session,
                               const std::function<bool(const cat::ItemTemplate&)>& answer,
                               int response_time_ms = 1000) {
  std::vector<std::string> seen;
  while (!session.is_complete()) {
    auto item = session.advance_to_next_item();
    if (!item) {
      break;
    }
    const bool correct = answer(*item);
    session.record_response(item->id, correct, correct ? 1.0 : 0.0, response_time_ms, "");
    seen.push_back(item->id);
  }
  return seen;
}

bool always(const cat::ItemTemplate&) { return true; }
bool never(const cat::ItemTemplate&) { return false; }

void test_defaults(TestSuite& suite) {
  const auto defaults = cat::TerminationCriteria::defaults();
  suite.require(defaults == criteria(0.3, 25, 1.2, 3),
                "default termination criteria should be {0.3, 25, 1.2, 3}");
  cat::SessionConfig config;
  suite.require(config.prior_theta == -1.5 && config.prior_standard_error == 1.0,
                "default prior should be N(-1.5, 1)");
  suite.require(config.mastery_min_items == 5, "mastery floor should default to five items");
}

void test_state_errors(TestSuite& suite) {
  cat::AdaptiveSession session("s-1");
  suite.require(session.state() == cat::SessionState::NotStarted, "new session is NotStarted");
  suite.require(throws_cat_error([&] { session.advance_to_next_item(); },
                                 cat::ErrorKind::InvalidSessionState),
                "advance before start should fail");
  suite.require(throws_cat_error([&] { session.record_response("item-01", true, 1.0, 0, ""); },
                                 cat::ErrorKind::InvalidSessionState),
                "record before start should fail");
  suite.require(throws_cat_error([&] { session.current_ability(); },
                                 cat::ErrorKind::InvalidSessionState),
                "current ability before start should fail");

  suite.require(throws_cat_error([&] { session.start(cat_test::make_learner(), {}); },
                                 cat::ErrorKind::ItemPoolEmpty),
                "starting with an empty pool should fail with ItemPoolEmpty");
  suite.require(session.state() == cat::SessionState::NotStarted,
                "failed start should leave the session NotStarted");

  suite.require(cat_test::throws<std::invalid_argument>([&] {
                  session.start(cat_test::make_learner("x", "   "),
                                cat_test::to_pool(cat_test::spread_items(3)));
                }),
                "blank learner name should be rejected");

  const auto pool = cat_test::to_pool(cat_test::spread_items(5));
  session.start(cat_test::make_learner(), pool);
  suite.require(session.state() == cat::SessionState::InProgress, "start moves to InProgress");
  suite.require(session.ability_history().size() == 1 &&
                    session.current_ability().method == cat::estimation_method::kPrior,
                "start should seed the prior estimate");
  suite.require(session.criteria() == cat::TerminationCriteria::defaults(),
                "absent criteria should resolve to the defaults");
  suite.require(throws_cat_error([&] { session.start(cat_test::make_learner(), pool); },
                                 cat::ErrorKind::InvalidSessionState),
                "starting twice should fail");
}

void test_item_errors_leave_state_unchanged(TestSuite& suite) {
  cat::AdaptiveSession session("s-2");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)));

  auto first = session.advance_to_next_item();
  suite.require(first && first->id == "item-05",
                "first item should be the most informative at the prior");
  session.record_response(first->id, true, 1.0, 1200, "a");
  const auto before = cat::bridge::to_json(session.snapshot());

  suite.require(throws_cat_error([&] { session.record_response("nope", true, 1.0, 0, ""); },
                                 cat::ErrorKind::UnknownOrDuplicateItem),
                "unknown item should be rejected");
  suite.require(throws_cat_error([&] { session.record_response("item-05", true, 1.0, 0, ""); },
                                 cat::ErrorKind::UnknownOrDuplicateItem),
                "repeated item should be rejected");
  auto offered = session.advance_to_next_item();
  const std::string other = offered->id == "item-20" ? "item-19" : "item-20";
  suite.require(throws_cat_error([&] { session.record_response(other, true, 1.0, 0, ""); },
                                 cat::ErrorKind::UnknownOrDuplicateItem),
                "an item other than the offered one should be rejected");
  suite.require(cat_test::throws<std::invalid_argument>(
                    [&] { session.record_response(offered->id, true, 1.5, 0, ""); }),
                "score above 1 should be rejected");
  suite.require(cat_test::throws<std::invalid_argument>(
                    [&] { session.record_response(offered->id, true, 1.0, -1, ""); }),
                "negative response time should be rejected");

  suite.require(cat::bridge::to_json(session.snapshot()) == before,
                "rejected responses should leave the session unchanged");
  suite.require(session.advance_to_next_item() == offered,
                "advance should keep offering the same item until it is answered");
}

void test_max_items(TestSuite& suite) {
  cat::AdaptiveSession session("s-3");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)),
                criteria(0.0, 5, std::nullopt, 100));
  const auto seen = drive(session, always);
  suite.require(seen.size() == 5, "max items should stop after five responses");
  suite.require(session.completion_reason() == cat::CompletionReason::MaxItems,
                "completion reason should be MaxItems");
  suite.require(std::set<std::string>(seen.begin(), seen.end()).size() == seen.size(),
                "no item should be administered twice");
  suite.require(session.ability_history().size() == session.responses().size() + 1,
                "ability history should hold the prior plus one entry per response");

  double previous = session.ability_history().front().theta;
  bool rising = true;
  for (const auto& response : session.responses()) {
    if (response.ability_after.theta <= previous) {
      rising = false;
    }
    previous = response.ability_after.theta;
  }
  suite.require(rising, "all-correct responses should raise theta every time");

  suite.require(throws_cat_error([&] { session.advance_to_next_item(); },
                                 cat::ErrorKind::InvalidSessionState),
                "advance after completion should fail");
  suite.require(throws_cat_error([&] { session.record_response("item-20", true, 1.0, 0, ""); },
                                 cat::ErrorKind::InvalidSessionState),
                "record after completion should fail");

  int counter = 0;
  const std::vector<std::function<bool(const cat::ItemTemplate&)>> patterns = {
      never,
      [&](const cat::ItemTemplate&) { return ++counter % 2 == 0; },
      [](const cat::ItemTemplate& item) { return item.parameter.difficulty < -1.0; }};
  for (std::size_t i = 0; i < patterns.size(); ++i) {
    cat::AdaptiveSession patterned("s-3-" + std::to_string(i));
    patterned.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)),
                    criteria(0.0, 5, std::nullopt, 100));
    drive(patterned, patterns[i]);
    suite.require(patterned.responses().size() == 5 &&
                      patterned.completion_reason() == cat::CompletionReason::MaxItems,
                  "max items should stop every response pattern after five responses");
  }
}

void test_all_incorrect_stalls(TestSuite& suite) {
  cat::AdaptiveSession session("s-4");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)));
  const auto seen = drive(session, never);
  suite.require(session.completion_reason() == cat::CompletionReason::Stalled,
                "all-incorrect run should stall");
  suite.require(session.stall_count() == session.criteria().max_stall_count,
                "stall count should reach the configured maximum");
  suite.require(seen.size() < 20, "stalled run should stop before the pool runs out");
  const auto& first = session.responses().front().ability_after;
  suite.require(first.theta < session.config().prior_theta,
                "a first incorrect answer should lower theta below the prior");
  suite.require(first.method == cat::estimation_method::kBayesModal,
                "uniform patterns should be estimated by the fallback");
  suite.require(session.current_ability().theta >= -4.0, "theta should stay within range");
}

void test_mastery(TestSuite& suite) {
  cat::AdaptiveSession floor_session("s-5");
  floor_session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)),
                      criteria(0.0, 25, -2.0, 100));
  drive(floor_session, always);
  suite.require(floor_session.completion_reason() == cat::CompletionReason::Mastery,
                "theta above the mastery level should complete with Mastery");
  suite.require(floor_session.responses().size() == 5,
                "mastery should not fire before five responses");

  cat::AdaptiveSession session("s-6");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)));
  drive(session, always);
  suite.require(session.completion_reason() == cat::CompletionReason::Mastery,
                "all-correct run should reach mastery");
  suite.require(session.current_ability().theta >= 1.2, "mastery needs theta >= 1.2");
}

void test_mixed_pattern_uses_mle(TestSuite& suite) {
  cat::AdaptiveSession session("s-7");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)),
                criteria(0.0, 2, std::nullopt, 100));
  int count = 0;
  drive(session, [&](const cat::ItemTemplate&) { return ++count % 2 == 1; });
  suite.require(session.responses().size() == 2, "two responses expected");
  suite.require(session.current_ability().method == cat::estimation_method::kMle,
                "a mixed pattern should be estimated by maximum likelihood");
}

void test_learner_above_prior_uses_mle(TestSuite& suite) {
  cat::AdaptiveSession session("s-7b");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(20)));
  drive(session, [](const cat::ItemTemplate& item) { return item.parameter.difficulty < 1.0; });
  suite.require(session.is_complete(), "session should complete");

  int mle_updates = 0;
  std::vector<cat::irt::Observation> history;
  for (const auto& response : session.responses()) {
    if (response.ability_after.method == cat::estimation_method::kMle) {
      ++mle_updates;
    }
    for (const auto& item : session.item_pool()) {
      if (item->id == response.item_id) {
        history.push_back({item->parameter, response.is_correct});
      }
    }
  }
  suite.require(mle_updates > 0, "a learner above the prior should get MLE estimates");
  suite.require(session.current_ability().method == cat::estimation_method::kMle,
                "the final estimate of a mixed pattern should be MLE");

  double best_theta = -4.0;
  double best = cat::irt::log_likelihood(history, best_theta);
  for (double theta = -4.0; theta <= 4.0; theta += 0.001) {
    const double value = cat::irt::log_likelihood(history, theta);
    if (value > best) {
      best = value;
      best_theta = theta;
    }
  }
  suite.require(near(session.current_ability().theta, best_theta, 0.005),
                "final theta should be the maximum of the response likelihood");
  suite.require(session.current_ability().theta > 0.5 && session.current_ability().theta < 1.2,
                "final theta should sit near the learner's threshold");
}

void test_pool_exhaustion(TestSuite& suite) {
  cat::AdaptiveSession session("s-8");
  session.start(cat_test::make_learner(), cat_test::to_pool(cat_test::spread_items(3)),
                criteria(0.0, 25, std::nullopt, 100));
  const auto seen = drive(session, always);
  suite.require(seen.size() == 3, "every item should be administered once");
  suite.require(session.is_complete(), "an exhausted pool should complete the session");
  suite.require(session.completion_reason() == cat::CompletionReason::PoolExhausted,
                "completion reason should be PoolExhausted");
  suite.require(session.remaining_item_count() == 0, "no items should remain");
}

void test_report(TestSuite& suite) {
  std::vector<cat::ItemTemplate> items = cat_test::spread_items(4);
  items[0].topic = "geometry";
  items[1].topic = "geometry";
  items[2].topic = "";
  auto pool = cat_test::to_pool(items);

  cat::AdaptiveSession session("s-9");
  session.start(cat_test::make_learner("l-9", "Grace"), pool, criteria(0.0, 3, std::nullopt, 100));
  const int times[] = {1000, 2000, 3000};
  const bool answers[] = {true, false, true};
  const double scores[] = {1.0, 0.0, 0.5};
  for (int i = 0; i < 3; ++i) {
    auto item = session.advance_to_next_item();
    session.record_response(item->id, answers[i], scores[i], times[i], "");
  }

  const auto report = cat::build_report(session);
  suite.require(report.session_id == "s-9" && report.learner_name == "Grace",
                "report should name the session and learner");
  suite.require(report.total_count == 3 && report.correct_count == 2,
                "report should count responses");
  suite.require(near(report.accuracy_percent(), 200.0 / 3.0),
                "accuracy should be correct/total * 100");
  suite.require(near(report.average_response_time_ms, 2000.0),
                "average response time should be the mean");
  suite.require(report.is_complete && report.completion_reason == cat::CompletionReason::MaxItems,
                "report should carry the completion state");
  suite.require(report.final_theta == session.current_ability().theta &&
                    report.standard_error == session.current_ability().standard_error,
                "report should carry the latest estimate");

  for (const auto& [key, value] : report.topic_performance) {
    suite.require(value >= 0.0 && value <= 1.0, "topic performance should be an average score");
    suite.require(key == "geometry" || key == "algebra" || key == "item-03",
                  "blank topics should be keyed by item id");
  }
  double score_total = 0.0;
  for (const auto& response : session.responses()) {
    score_total += response.score;
  }
  suite.require(near(score_total, 1.5), "scores should be recorded as given");

  cat::AdaptiveSession empty("s-10");
  const auto empty_report = cat::build_report(empty);
  suite.require(empty_report.total_count == 0 && empty_report.accuracy_percent() == 0.0,
                "a session without responses should report zero accuracy");
}

void test_snapshot_round_trip(TestSuite& suite) {
  const auto pool = cat_test::to_pool(cat_test::spread_items(12));
  cat::AdaptiveSession session("s-11");
  session.start(cat_test::make_learner(), pool, criteria(0.0, 10, std::nullopt, 100));
  for (int i = 0; i < 4; ++i) {
    auto item = session.advance_to_next_item();
    session.record_response(item->id, i % 2 == 0, i % 2 == 0 ? 1.0 : 0.0, 500 + i, "r");
  }

  const auto json = cat::bridge::to_json(session.snapshot());
  const auto parsed = cat::bridge::session_snapshot_from_json(nlohmann::json::parse(json.dump()));
  cat::AdaptiveSession restored(parsed, pool);
  suite.require(cat::bridge::to_json(restored.snapshot()) == json,
                "restored session should serialise identically");
  suite.require(restored.advance_to_next_item() == session.advance_to_next_item(),
                "restored session should offer the same next item");

  cat::AdaptiveSession fresh("s-12");
  cat::AdaptiveSession fresh_restored(fresh.snapshot(), pool);
  suite.require(fresh_restored.state() == cat::SessionState::NotStarted,
                "an unstarted session should round-trip");

  auto bad_version = parsed;
  bad_version.schema_version = 2;
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(bad_version, pool); },
                                 cat::ErrorKind::InvalidSnapshot),
                "unknown schema version should be rejected");

  auto foreign_item = parsed;
  foreign_item.administered_item_ids[1] = "ghost";
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(foreign_item, pool); },
                                 cat::ErrorKind::InvalidSnapshot),
                "administered ids outside the pool should be rejected");

  auto short_history = parsed;
  short_history.ability_history.pop_back();
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(short_history, pool); },
                                 cat::ErrorKind::InvalidSnapshot),
                "history length mismatch should be rejected");

  auto inconsistent = parsed;
  inconsistent.is_complete = true;
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(inconsistent, pool); },
                                 cat::ErrorKind::InvalidSnapshot),
                "completion flag must agree with state");

  auto repeated = parsed;
  repeated.administered_item_ids[1] = repeated.administered_item_ids[0];
  repeated.responses[1].item_id = repeated.administered_item_ids[0];
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(repeated, pool); },
                                 cat::ErrorKind::InvalidSnapshot),
                "repeated administered ids should be rejected");

  const auto smaller_bank = cat_test::to_pool(cat_test::spread_items(6));
  suite.require(throws_cat_error([&] { cat::AdaptiveSession s(parsed, smaller_bank); },
                                 cat::ErrorKind::InvalidSnapshot),
                "pool ids missing from the bank should be rejected");
}

} // namespace

int main() {
  TestSuite suite;
  test_defaults(suite);
  test_state_errors(suite);
  test_item_errors_leave_state_unchanged(suite);
  test_max_items(suite);
  test_all_incorrect_stalls(suite);
  test_mastery(suite);
  test_mixed_pattern_uses_mle(suite);
  test_learner_above_prior_uses_mle(suite);
  test_pool_exhaustion(suite);
  test_report(suite);
  test_snapshot_round_trip(suite);
  if (!suite.ok) {
    return 1;
  }
  std::cout << "test_adaptive_session passed" << std::endl;
  return 0;
}
