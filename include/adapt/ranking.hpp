#pragma once

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

struct CandidateSummary {
  std::string id;
  double difficulty = 0.0;
  std::string description;
};

struct RankingRequest {
  double ability = 0.0;
  std::string topic;
  RecentPerformance recent;
  std::vector<CandidateSummary> candidates;
};

struct RankingResponse {
  std::string selected_id;
  std::string explanation;
};

/**
 * Picks one of a handful of finalists and justifies the pick. Implementations
 * may block and may throw; the selection policy bounds the call with a
 * timeout and treats any exception as a failed ranking.
 */
class RankingCollaborator {
public:
  virtual ~RankingCollaborator() = default;

  virtual std::string name() const = 0;
  virtual RankingResponse rank(const RankingRequest& request) = 0;
  // False for in-process rankers that return promptly; those skip the worker
  // thread and are called inline.
  virtual bool blocking() const { return true; }
};

// Closest difficulty to the learner's ability; never fails.
class ClosestDifficultyRanker : public RankingCollaborator {
public:
  std::string name() const override { return "local"; }
  RankingResponse rank(const RankingRequest& request) override;
  bool blocking() const override { return false; }
};

// Sends the request as JSON and returns the raw reply text.
using RankingTransport = std::function<std::string(const nlohmann::json& request)>;

class ReplyParsingRanker : public RankingCollaborator {
public:
  explicit ReplyParsingRanker(RankingTransport transport);

  std::string name() const override { return "reply"; }
  RankingResponse rank(const RankingRequest& request) override;

private:
  RankingTransport transport_;
};

// "local" or "reply"; "reply" requires a transport.
std::unique_ptr<RankingCollaborator> make_ranker(const std::string& backend,
                                                 RankingTransport transport = nullptr);

extern const char* const kMatchedLevelExplanation;

// Deterministic fallback pick among the request's candidates. Throws
// std::invalid_argument when there are none.
RankingResponse closest_difficulty(const RankingRequest& request);

// beginner below -1, intermediate below 1, advanced otherwise.
std::string describe_level(double ability);
std::string relative_difficulty(double difficulty, double ability);
std::string preview(const std::string& text, std::size_t limit = 150);

nlohmann::json ranking_request_json(const RankingRequest& request);

// Accepts a JSON object, optionally wrapped in Markdown code fences, with
// "selected_question" (or "selected_id") and "explanation". Throws
// std::invalid_argument on anything else.
RankingResponse parse_ranking_reply(const std::string& reply);

std::string first_sentences(const std::string& text, std::size_t max_sentences = 3);

// Calls a blocking `ranker` on a worker thread, waiting at most `timeout` per
// attempt and making at most 1 + `retries` attempts; non-blocking rankers are
// called inline. Throws std::invalid_argument for a non-positive timeout.
// Returns nullopt when every attempt failed or timed out.
std::optional<RankingResponse> rank_with_deadline(const std::shared_ptr<RankingCollaborator>& ranker,
                                                  const RankingRequest& request,
                                                  std::chrono::milliseconds timeout,
                                                  int retries);

} // namespace adapt
