#include "adapt/selection_policy.hpp"

#include "adapt/item_response.hpp"
#include "debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace adapt {

const char* const kFirstAttemptExplanation =
    "This is your first question in this topic. It's designed to assess your current understanding.";
const char* const kSingleFinalistExplanation = "This is the next question in your learning path.";

namespace {

constexpr double kBandHalfWidth = 0.5;

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return text;
}

const ItemHistory* find_history(const std::vector<ItemHistory>& history, const std::string& id) {
  for (const auto& entry : history) {
    if (entry.item_id == id) {
      return &entry;
    }
  }
  return nullptr;
}

std::string selection_reason(DifficultyBand band, double probability, double information) {
  const char* info_desc = "moderately informative";
  if (information > 1.0) {
    info_desc = "very informative";
  } else if (information > 0.5) {
    info_desc = "informative";
  }
  const char* prob_desc = "challenging";
  if (probability > 0.8) {
    prob_desc = "high chance of success";
  } else if (probability > 0.5) {
    prob_desc = "good chance of success";
  }
  std::ostringstream oss;
  oss << "This " << to_string(band) << " question is " << info_desc
      << " for your current level and offers a " << prob_desc
      << ". It will help us better understand your abilities.";
  return oss.str();
}

} // namespace

std::string to_string(SelectionSource source) {
  switch (source) {
    case SelectionSource::FirstAttempt: return "first_attempt";
    case SelectionSource::Ranked: return "ranked";
    case SelectionSource::SingleFinalist: return "single_finalist";
    case SelectionSource::RankingFallback: return "ranking_fallback";
    case SelectionSource::ShortlistExhausted: return "shortlist_exhausted";
  }
  return "ranked";
}

std::string to_string(DifficultyBand band) {
  switch (band) {
    case DifficultyBand::Easy: return "easy";
    case DifficultyBand::Medium: return "medium";
    case DifficultyBand::Hard: return "hard";
  }
  return "medium";
}

DifficultyBand difficulty_band_from_string(const std::string& value) {
  if (value == "easy") {
    return DifficultyBand::Easy;
  }
  if (value == "medium") {
    return DifficultyBand::Medium;
  }
  if (value == "hard") {
    return DifficultyBand::Hard;
  }
  throw std::invalid_argument("Unknown difficulty band: " + value);
}

DifficultyBand difficulty_band(double difficulty, double theta) {
  const double delta = difficulty - theta;
  if (delta < -kBandHalfWidth) {
    return DifficultyBand::Easy;
  }
  if (delta > kBandHalfWidth) {
    return DifficultyBand::Hard;
  }
  return DifficultyBand::Medium;
}

SelectionPolicy::SelectionPolicy(const ItemCatalog& catalog,
                                 LearnerState& learner,
                                 SelectionConfig config,
                                 std::shared_ptr<RankingCollaborator> ranker,
                                 Clock clock)
    : catalog_(catalog),
      learner_(learner),
      config_(std::move(config)),
      ranker_(std::move(ranker)),
      clock_(clock ? std::move(clock) : Clock(system_now)) {
  config_.validate();
}

std::optional<TopicChoice> SelectionPolicy::select_topic() const {
  if (auto focus = learner_.focus_topic()) {
    return TopicChoice{*focus, false};
  }
  const auto mastered = learner_.mastered_topics();
  if (!mastered.empty()) {
    return TopicChoice{mastered.front(), true};
  }
  return std::nullopt;
}

std::vector<ShortlistEntry> SelectionPolicy::shortlist(const std::string& topic) const {
  const double theta = learner_.theta(topic);
  auto ranked = irt::rank_by_information(theta, catalog_.items_for_topic(topic));
  const std::size_t k = std::min(ranked.size(), static_cast<std::size_t>(config_.shortlist_size));
  std::vector<ShortlistEntry> out;
  out.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    out.push_back(ShortlistEntry{ranked[i].item, ranked[i].information});
  }
  return out;
}

std::vector<ItemHistory> SelectionPolicy::item_history(const std::string& topic) const {
  std::vector<ItemHistory> out;
  for (const Outcome* outcome : learner_.topic_history(topic)) {
    auto it = std::find_if(out.begin(), out.end(),
                           [&](const ItemHistory& entry) { return entry.item_id == outcome->item_id; });
    if (it == out.end()) {
      out.push_back(ItemHistory{outcome->item_id, std::nullopt, std::nullopt, 0, 0});
      it = std::prev(out.end());
    }
    if (auto ts = parse_iso8601(outcome->timestamp)) {
      if (!it->last_attempt || *ts >= *it->last_attempt) {
        it->last_attempt = *ts;
        it->last_correct = outcome->correct;
      }
    }
    if (outcome->correct) {
      ++it->correct;
    } else {
      ++it->wrong;
    }
  }
  return out;
}

std::optional<std::string> SelectionPolicy::last_attempted(const std::vector<ItemHistory>& history) const {
  std::optional<std::string> last_id;
  std::optional<TimePoint> last_time;
  for (const auto& entry : history) {
    if (entry.last_attempt && (!last_time || *entry.last_attempt > *last_time)) {
      last_id = entry.item_id;
      last_time = entry.last_attempt;
    }
  }
  return last_id;
}

double SelectionPolicy::priority(const ItemHistory* entry, TimePoint now) const {
  if (!entry || !entry->last_attempt) {
    return std::numeric_limits<double>::infinity();
  }
  const double age = std::chrono::duration<double>(now - *entry->last_attempt).count();
  double multiplier = 1.0;
  if (entry->last_correct && !*entry->last_correct) {
    multiplier *= config_.wrong_recency_multiplier;
  }
  multiplier *= 1.0 + config_.wrong_count_weight * entry->wrong;
  return age * multiplier;
}

std::vector<FinalistEntry> SelectionPolicy::finalists(const std::vector<const Item*>& candidates,
                                                      const std::vector<ItemHistory>& history) const {
  const TimePoint now = clock_();
  std::vector<FinalistEntry> scored;
  scored.reserve(candidates.size());
  for (const Item* item : candidates) {
    scored.push_back(FinalistEntry{item, priority(find_history(history, item->id), now)});
  }
  std::sort(scored.begin(), scored.end(), [](const FinalistEntry& lhs, const FinalistEntry& rhs) {
    if (lhs.priority != rhs.priority) {
      return lhs.priority > rhs.priority;
    }
    return lhs.item->id > rhs.item->id;
  });
  const std::size_t keep = std::min(scored.size(), static_cast<std::size_t>(config_.finalist_count));
  scored.resize(keep);
  return scored;
}

RecentPerformance SelectionPolicy::recent_performance(const std::string& topic) const {
  return learner_.topic_performance(topic, config_.performance_window);
}

const Item* SelectionPolicy::match_reply(const std::string& selected_id,
                                         const std::vector<FinalistEntry>& finalists) const {
  for (const auto& finalist : finalists) {
    if (finalist.item->id == selected_id) {
      return finalist.item;
    }
  }
  if (!selected_id.empty()) {
    const std::string wanted = lowercase(selected_id);
    for (const auto& finalist : finalists) {
      const std::string name = lowercase(finalist.item->id);
      if (name.find(wanted) != std::string::npos || wanted.find(name) != std::string::npos) {
        debug::log(debug::Channel::Ranking,
                   "reply '" + selected_id + "' matched " + finalist.item->id + " by substring");
        return finalist.item;
      }
    }
  }
  debug::log(debug::Channel::Ranking,
             "reply '" + selected_id + "' matched no finalist; using " + finalists.front().item->id);
  return finalists.front().item;
}

Selection SelectionPolicy::finish(Selection selection) {
  last_explanation_ = selection.explanation;
  if (debug::enabled(debug::Channel::Selection)) {
    std::ostringstream oss;
    oss << "selected " << selection.item->id << " from " << selection.topic << " ("
        << to_string(selection.source) << (selection.review ? ", review" : "") << ")";
    debug::log(debug::Channel::Selection, oss.str());
  }
  return selection;
}

Next SelectionPolicy::select_next() {
  learner_.refresh_unlocks();

  const auto choice = select_topic();
  if (!choice) {
    debug::log(debug::Channel::Selection, "no topic available");
    return NoSelection{std::nullopt, "No topics available"};
  }
  const std::string& topic = choice->topic;
  const auto topic_items = catalog_.items_for_topic(topic);
  if (topic_items.empty()) {
    debug::log(debug::Channel::Selection, "no items for topic " + topic);
    return NoSelection{topic, "No items available for topic '" + topic + "'"};
  }

  const double theta = learner_.theta(topic);
  Selection selection;
  selection.topic = topic;
  selection.review = choice->review;
  selection.shortlist = shortlist(topic);

  const auto history = item_history(topic);
  if (history.empty()) {
    selection.item = selection.shortlist.front().item;
    selection.explanation = kFirstAttemptExplanation;
    selection.source = SelectionSource::FirstAttempt;
    return finish(std::move(selection));
  }

  const auto last_id = last_attempted(history);
  std::vector<const Item*> remaining;
  for (const auto& entry : selection.shortlist) {
    if (!last_id || entry.item->id != *last_id) {
      remaining.push_back(entry.item);
    }
  }
  if (remaining.empty()) {
    debug::log(debug::Channel::Selection,
               "shortlist exhausted after removing " + last_id.value_or("") + "; using best topic item");
    selection.item = irt::most_informative(theta, topic_items);
    selection.explanation = kMatchedLevelExplanation;
    selection.source = SelectionSource::ShortlistExhausted;
    return finish(std::move(selection));
  }

  selection.finalists = finalists(remaining, history);
  if (selection.finalists.size() == 1) {
    selection.item = selection.finalists.front().item;
    selection.explanation = kSingleFinalistExplanation;
    selection.source = SelectionSource::SingleFinalist;
    return finish(std::move(selection));
  }

  RankingRequest request;
  request.ability = theta;
  request.topic = topic;
  request.recent = recent_performance(topic);
  for (const auto& finalist : selection.finalists) {
    request.candidates.push_back(
        CandidateSummary{finalist.item->id, finalist.item->params.b, finalist.item->description});
  }

  const auto response =
      rank_with_deadline(ranker_, request, config_.ranking_timeout, config_.ranking_retries);
  if (!response) {
    if (ranker_) {
      debug::log(debug::Channel::Selection, "ranking failed; choosing closest difficulty");
    }
    const RankingResponse local = closest_difficulty(request);
    for (const auto& finalist : selection.finalists) {
      if (finalist.item->id == local.selected_id) {
        selection.item = finalist.item;
        break;
      }
    }
    selection.explanation = local.explanation;
    selection.source = SelectionSource::RankingFallback;
    return finish(std::move(selection));
  }

  selection.item = match_reply(response->selected_id, selection.finalists);
  // Passed through as given, even when empty.
  selection.explanation = response->explanation;
  selection.source = SelectionSource::Ranked;
  return finish(std::move(selection));
}

std::vector<const Item*> SelectionPolicy::recommended_items(const std::string& topic, int n) const {
  if (n <= 0) {
    return {};
  }
  const auto ranked = irt::rank_by_information(learner_.theta(topic), catalog_.items_for_topic(topic));

  std::vector<std::string> recent;
  const auto history = learner_.topic_history(topic);
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (recent.size() >= static_cast<std::size_t>(config_.recent_exclusion_window)) {
      break;
    }
    if (std::find(recent.begin(), recent.end(), (*it)->item_id) == recent.end()) {
      recent.push_back((*it)->item_id);
    }
  }

  std::vector<const Item*> filtered;
  for (const auto& entry : ranked) {
    if (std::find(recent.begin(), recent.end(), entry.item->id) == recent.end()) {
      filtered.push_back(entry.item);
    }
  }
  if (filtered.size() < static_cast<std::size_t>(n)) {
    filtered.clear();
    for (const auto& entry : ranked) {
      filtered.push_back(entry.item);
    }
  }
  if (filtered.size() > static_cast<std::size_t>(n)) {
    filtered.resize(static_cast<std::size_t>(n));
  }
  return filtered;
}

std::vector<const Item*> SelectionPolicy::items_by_difficulty(const std::string& topic,
                                                              DifficultyBand band) const {
  const double theta = learner_.theta(topic);
  std::vector<const Item*> out;
  for (const Item* item : catalog_.items_for_topic(topic)) {
    if (difficulty_band(item->params.b, theta) == band) {
      out.push_back(item);
    }
  }
  return out;
}

bool SelectionPolicy::should_move_to_next_topic(const std::string& topic) const {
  return learner_.theta(topic) >= learner_.mastery_threshold();
}

SelectionExplanation SelectionPolicy::explain(const Item& item) const {
  SelectionExplanation out;
  out.item_id = item.id;
  out.topic = item.topic;
  out.ability = learner_.theta(item.topic);
  out.difficulty = item.params.b;
  out.band = difficulty_band(item.params.b, out.ability);
  out.probability_correct = irt::probability_correct(out.ability, item.params);
  out.information = irt::information(out.ability, item.params);
  out.difficulty_match = irt::difficulty_match(out.ability, item.params);
  out.reason = selection_reason(out.band, out.probability_correct, out.information);
  return out;
}

TopicReadiness SelectionPolicy::topic_readiness(const std::string& topic) const {
  TopicReadiness out;
  out.topic = topic;
  out.status = learner_.status(topic);
  out.theta = learner_.theta(topic);
  out.prerequisites = learner_.graph().prerequisites(topic);
  out.prerequisites_met = learner_.graph().can_unlock(topic, learner_.statuses());
  out.can_start = out.status != ConceptStatus::Locked;

  const double threshold = learner_.mastery_threshold();
  if (out.status == ConceptStatus::Mastered) {
    out.readiness_score = 100.0;
  } else if (out.status == ConceptStatus::Opened) {
    const double ratio = threshold != 0.0 ? out.theta / threshold : (out.theta >= 0.0 ? 1.0 : 0.0);
    out.readiness_score = std::clamp(50.0 + std::min(50.0, ratio * 50.0), 0.0, 100.0);
  }
  return out;
}

} // namespace adapt
