#include "adapt/ranking.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

template <typename Fn>
bool throws_invalid(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

adapt::RankingRequest make_request() {
  adapt::RankingRequest request;
  request.ability = 0.4;
  request.topic = "Backtracking";
  request.recent.attempts = 4;
  request.recent.correct = 3;
  request.candidates = {
      {"N-Queens", 1.5, "Place N queens."},
      {"Subsets", 0.5, "List every subset."},
      {"Permutations", -0.5, "List every permutation."},
  };
  return request;
}

class CountingRanker : public adapt::RankingCollaborator {
public:
  CountingRanker(int failures, std::chrono::milliseconds delay) : failures_(failures), delay_(delay) {}

  std::string name() const override { return "counting"; }

  adapt::RankingResponse rank(const adapt::RankingRequest& request) override {
    const int call = ++calls_;
    if (delay_.count() > 0 && call <= failures_) {
      std::this_thread::sleep_for(delay_);
    } else if (call <= failures_) {
      throw std::runtime_error("backend unavailable");
    }
    return adapt::RankingResponse{request.candidates.back().id, "picked last"};
  }

  int calls() const { return calls_.load(); }

private:
  int failures_;
  std::chrono::milliseconds delay_;
  std::atomic<int> calls_{0};
};

class CallerThreadRanker : public adapt::ClosestDifficultyRanker {
public:
  adapt::RankingResponse rank(const adapt::RankingRequest& request) override {
    ran_on = std::this_thread::get_id();
    return adapt::ClosestDifficultyRanker::rank(request);
  }

  std::thread::id ran_on;
};

void test_closest_difficulty(TestSuite& suite) {
  const auto request = make_request();
  const auto response = adapt::closest_difficulty(request);
  suite.require(response.selected_id == "Subsets", "closest difficulty to 0.4 is Subsets");
  suite.require(response.explanation == adapt::kMatchedLevelExplanation, "fallback uses the matched-level text");

  adapt::RankingRequest tie = request;
  tie.ability = 0.0;
  suite.require(adapt::closest_difficulty(tie).selected_id == "Subsets", "ties keep the first candidate");

  adapt::RankingRequest empty;
  suite.require(throws_invalid([&] { adapt::closest_difficulty(empty); }), "no candidates should throw");
}

void test_reply_parsing(TestSuite& suite) {
  const auto fenced = adapt::parse_ranking_reply(
      "```json\n{\"selected_question\": \"Subsets\", \"explanation\": \"Good fit.\"}\n```");
  suite.require(fenced.selected_id == "Subsets", "fenced reply should parse");
  suite.require(fenced.explanation == "Good fit.", "explanation should be kept");

  const auto bare = adapt::parse_ranking_reply("{\"selected_id\": \" N-Queens \"}");
  suite.require(bare.selected_id == "N-Queens", "selected_id alias should parse and be trimmed");
  suite.require(bare.explanation.empty(), "missing explanation stays empty");

  const auto long_reply = adapt::parse_ranking_reply(
      "{\"selected_question\": \"Subsets\", \"explanation\": \"One. Two. Three. Four. Five.\"}");
  suite.require(long_reply.explanation == "One. Two. Three.", "explanation should keep three sentences");

  suite.require(throws_invalid([] { adapt::parse_ranking_reply("not json"); }), "prose should be rejected");
  suite.require(throws_invalid([] { adapt::parse_ranking_reply("[1, 2]"); }), "arrays should be rejected");
  suite.require(throws_invalid([] { adapt::parse_ranking_reply("{\"explanation\": \"x\"}"); }),
                "a reply without a selection should be rejected");
  suite.require(throws_invalid([] { adapt::parse_ranking_reply("   "); }), "blank replies should be rejected");
}

void test_request_json(TestSuite& suite) {
  const auto json = adapt::ranking_request_json(make_request());
  suite.require(json["level"] == "intermediate", "0.4 should be described as intermediate");
  suite.require(json["candidates"].size() == 3, "every candidate should be sent");
  suite.require(json["candidates"][0]["relative_difficulty"] == "harder than current level",
                "relative difficulty should describe the gap");
  suite.require(json["recent_performance"]["correct_attempts"] == 3, "recent performance should be sent");

  suite.require(adapt::preview(std::string(200, 'x')).size() == 153, "preview should cut at 150 plus ellipsis");
  suite.require(adapt::describe_level(-2.0) == "beginner" && adapt::describe_level(1.5) == "advanced",
                "level descriptions should follow the ability bands");
}

void test_reply_ranker(TestSuite& suite) {
  nlohmann::json seen;
  adapt::ReplyParsingRanker ranker([&](const nlohmann::json& request) {
    seen = request;
    return std::string("{\"selected_question\": \"Permutations\", \"explanation\": \"Warm up.\"}");
  });
  const auto response = ranker.rank(make_request());
  suite.require(response.selected_id == "Permutations", "reply ranker should return the parsed pick");
  suite.require(seen["topic"] == "Backtracking", "transport should receive the request JSON");

  suite.require(throws_invalid([] { adapt::ReplyParsingRanker missing(nullptr); }),
                "reply ranker requires a transport");
  suite.require(adapt::make_ranker("local")->name() == "local", "local backend should be selectable");
  suite.require(throws_invalid([] { adapt::make_ranker("oracle"); }), "unknown backends should be rejected");
}

void test_deadline(TestSuite& suite) {
  const auto request = make_request();

  auto flaky = std::make_shared<CountingRanker>(1, std::chrono::milliseconds(0));
  const auto retried = adapt::rank_with_deadline(flaky, request, std::chrono::milliseconds(500), 1);
  suite.require(retried.has_value() && retried->selected_id == "Permutations", "one retry should recover");
  suite.require(flaky->calls() == 2, "the retry should be the second call");

  auto broken = std::make_shared<CountingRanker>(5, std::chrono::milliseconds(0));
  const auto failed = adapt::rank_with_deadline(broken, request, std::chrono::milliseconds(500), 1);
  suite.require(!failed.has_value(), "persistent failures should give up");
  suite.require(broken->calls() == 2, "at most one retry should be attempted");

  auto slow = std::make_shared<CountingRanker>(5, std::chrono::milliseconds(300));
  const auto start = std::chrono::steady_clock::now();
  const auto timed_out = adapt::rank_with_deadline(slow, request, std::chrono::milliseconds(30), 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  suite.require(!timed_out.has_value(), "slow rankers should time out");
  suite.require(elapsed < std::chrono::milliseconds(250), "waiting should be bounded by the timeout");

  auto local = std::make_shared<CallerThreadRanker>();
  const auto direct = adapt::rank_with_deadline(local, request, std::chrono::milliseconds(50), 1);
  suite.require(direct.has_value() && direct->selected_id == "Subsets", "non-blocking rankers should answer");
  suite.require(local->ran_on == std::this_thread::get_id(), "non-blocking rankers run on the calling thread");

  auto bounded = std::make_shared<CountingRanker>(0, std::chrono::milliseconds(0));
  suite.require(throws_invalid([&] {
                  adapt::rank_with_deadline(bounded, request, std::chrono::milliseconds(0), 0);
                }),
                "a zero timeout cannot bound a blocking ranker");
  suite.require(bounded->calls() == 0, "a rejected deadline should not call the ranker");
  suite.require(adapt::ClosestDifficultyRanker().blocking() == false, "the local ranker never blocks");

  suite.require(!adapt::rank_with_deadline(nullptr, request, std::chrono::milliseconds(10), 1).has_value(),
                "no ranker means no ranking");

  // Let abandoned workers finish before the process exits.
  std::this_thread::sleep_for(std::chrono::milliseconds(700));
}

} // namespace

int main() {
  TestSuite suite;

  test_closest_difficulty(suite);
  test_reply_parsing(suite);
  test_request_json(suite);
  test_reply_ranker(suite);
  test_deadline(suite);

  if (!suite.ok) {
    std::cerr << "Ranking tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Ranking tests passed" << std::endl;
  return 0;
}
