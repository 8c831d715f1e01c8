#include "adapt/ranking.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace adapt {

const char* const kMatchedLevelExplanation =
    "This question matches your current skill level and will help you progress in your learning journey.";

namespace {

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_code_fence(std::string text) {
  text = trim(text);
  if (starts_with(text, "```json")) {
    text = text.substr(7);
  } else if (starts_with(text, "```")) {
    text = text.substr(3);
  }
  if (ends_with(text, "```")) {
    text = text.substr(0, text.size() - 3);
  }
  return trim(text);
}

RankingResponse invoke_ranker(RankingCollaborator& ranker, const RankingRequest& request) {
  return ranker.rank(request);
}

} // namespace

RankingResponse closest_difficulty(const RankingRequest& request) {
  if (request.candidates.empty()) {
    throw std::invalid_argument("Ranking request has no candidates");
  }
  const CandidateSummary* best = &request.candidates.front();
  double best_gap = std::fabs(best->difficulty - request.ability);
  for (const auto& candidate : request.candidates) {
    const double gap = std::fabs(candidate.difficulty - request.ability);
    if (gap < best_gap) {
      best = &candidate;
      best_gap = gap;
    }
  }
  return RankingResponse{best->id, kMatchedLevelExplanation};
}

RankingResponse ClosestDifficultyRanker::rank(const RankingRequest& request) {
  return closest_difficulty(request);
}

ReplyParsingRanker::ReplyParsingRanker(RankingTransport transport) : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("ReplyParsingRanker requires a transport");
  }
}

RankingResponse ReplyParsingRanker::rank(const RankingRequest& request) {
  const std::string reply = transport_(ranking_request_json(request));
  return parse_ranking_reply(reply);
}

std::unique_ptr<RankingCollaborator> make_ranker(const std::string& backend, RankingTransport transport) {
  if (backend.empty() || backend == "local") {
    return std::make_unique<ClosestDifficultyRanker>();
  }
  if (backend == "reply") {
    return std::make_unique<ReplyParsingRanker>(std::move(transport));
  }
  throw std::invalid_argument("Unknown ranking backend: " + backend);
}

std::string describe_level(double ability) {
  if (ability < -1.0) {
    return "beginner";
  }
  if (ability < 1.0) {
    return "intermediate";
  }
  return "advanced";
}

std::string relative_difficulty(double difficulty, double ability) {
  const double delta = difficulty - ability;
  if (delta < -0.5) {
    return "easier than current level";
  }
  if (delta > 0.5) {
    return "harder than current level";
  }
  return "well-matched to current level";
}

std::string preview(const std::string& text, std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

nlohmann::json ranking_request_json(const RankingRequest& request) {
  nlohmann::json candidates = nlohmann::json::array();
  for (const auto& candidate : request.candidates) {
    candidates.push_back({
        {"name", candidate.id},
        {"difficulty", candidate.difficulty},
        {"relative_difficulty", relative_difficulty(candidate.difficulty, request.ability)},
        {"description", preview(candidate.description)},
    });
  }
  return {
      {"ability", request.ability},
      {"level", describe_level(request.ability)},
      {"topic", request.topic},
      {"recent_performance",
       {{"total_attempts", request.recent.attempts}, {"correct_attempts", request.recent.correct}}},
      {"candidates", std::move(candidates)},
  };
}

std::string first_sentences(const std::string& text, std::size_t max_sentences) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto dot = text.find('.', start);
    if (dot == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, dot - start));
    start = dot + 1;
  }
  if (parts.size() <= max_sentences) {
    return trim(text);
  }
  std::string out;
  for (std::size_t i = 0; i < max_sentences; ++i) {
    if (!out.empty()) {
      out += ' ';
    }
    out += trim(parts[i]) + ".";
  }
  return out;
}

RankingResponse parse_ranking_reply(const std::string& reply) {
  const std::string body = strip_code_fence(reply);
  if (body.empty()) {
    throw std::invalid_argument("Empty ranking reply");
  }
  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("Ranking reply is not JSON: ") + ex.what());
  }
  if (!parsed.is_object()) {
    throw std::invalid_argument("Ranking reply must be a JSON object");
  }

  RankingResponse response;
  const char* id_key = parsed.contains("selected_question") ? "selected_question" : "selected_id";
  if (!parsed.contains(id_key) || !parsed[id_key].is_string()) {
    throw std::invalid_argument("Ranking reply has no selected_question");
  }
  response.selected_id = trim(parsed[id_key].get<std::string>());
  if (parsed.contains("explanation")) {
    if (!parsed["explanation"].is_string()) {
      throw std::invalid_argument("Expected string for field 'explanation'");
    }
    response.explanation = first_sentences(parsed["explanation"].get<std::string>());
  }
  return response;
}

std::optional<RankingResponse> rank_with_deadline(const std::shared_ptr<RankingCollaborator>& ranker,
                                                  const RankingRequest& request,
                                                  std::chrono::milliseconds timeout,
                                                  int retries) {
  if (!ranker) {
    return std::nullopt;
  }
  if (timeout.count() <= 0) {
    throw std::invalid_argument("Ranking timeout must be positive");
  }
  const int attempts = 1 + std::max(0, std::min(retries, 1));
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      if (!ranker->blocking()) {
        return invoke_ranker(*ranker, request);
      }

      // The worker owns everything it touches so an abandoned call can
      // finish after we stop waiting.
      auto promise = std::make_shared<std::promise<RankingResponse>>();
      std::future<RankingResponse> future = promise->get_future();
      std::thread([ranker, request, promise]() {
        try {
          promise->set_value(invoke_ranker(*ranker, request));
        } catch (...) {
          promise->set_exception(std::current_exception());
        }
      }).detach();

      if (future.wait_for(timeout) != std::future_status::ready) {
        debug::log(debug::Channel::Ranking,
                   ranker->name() + " timed out after " + std::to_string(timeout.count()) +
                       "ms (attempt " + std::to_string(attempt) + ")");
        continue;
      }
      return future.get();
    } catch (const std::exception& ex) {
      debug::log(debug::Channel::Ranking, ranker->name() + " failed (attempt " +
                                              std::to_string(attempt) + "): " + ex.what());
    }
  }
  return std::nullopt;
}

} // namespace adapt
