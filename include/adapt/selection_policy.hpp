#pragma once

#include "engine_config.hpp"
#include "item_catalog.hpp"
#include "learner_state.hpp"
#include "ranking.hpp"
#include "timestamp.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace adapt {

enum class SelectionSource {
  FirstAttempt,
  Ranked,
  SingleFinalist,
  RankingFallback,
  ShortlistExhausted
};

std::string to_string(SelectionSource source);

enum class DifficultyBand {
  Easy,
  Medium,
  Hard
};

std::string to_string(DifficultyBand band);
DifficultyBand difficulty_band_from_string(const std::string& value);
DifficultyBand difficulty_band(double difficulty, double theta);

struct ShortlistEntry {
  const Item* item = nullptr;
  double information = 0.0;
};

struct FinalistEntry {
  const Item* item = nullptr;
  double priority = 0.0;
};

struct Selection {
  const Item* item = nullptr;
  std::string topic;
  std::string explanation;
  SelectionSource source = SelectionSource::FirstAttempt;
  // True when every concept is mastered and the topic is revisited.
  bool review = false;
  std::vector<ShortlistEntry> shortlist;
  std::vector<FinalistEntry> finalists;
};

struct NoSelection {
  std::optional<std::string> topic;
  std::string reason;
};

using Next = std::variant<Selection, NoSelection>;

struct TopicChoice {
  std::string topic;
  bool review = false;
};

// Per-item attempt statistics for one topic, in first-attempt order.
struct ItemHistory {
  std::string item_id;
  std::optional<TimePoint> last_attempt;
  std::optional<bool> last_correct;
  int wrong = 0;
  int correct = 0;
};

struct SelectionExplanation {
  std::string item_id;
  std::string topic;
  double ability = 0.0;
  double difficulty = 0.0;
  DifficultyBand band = DifficultyBand::Medium;
  double probability_correct = 0.0;
  double information = 0.0;
  double difficulty_match = 0.0;
  std::string reason;
};

struct TopicReadiness {
  std::string topic;
  ConceptStatus status = ConceptStatus::Locked;
  double theta = 0.0;
  double readiness_score = 0.0;
  bool prerequisites_met = false;
  std::vector<std::string> prerequisites;
  bool can_start = false;
};

extern const char* const kFirstAttemptExplanation;
extern const char* const kSingleFinalistExplanation;

/**
 * Three-stage item selection:
 *   1. topic: next concept to learn, else the first mastered one (review);
 *   2. shortlist: the K most informative topic items at the current ability;
 *   3. final pick: drop the last attempted item, keep the finalists with the
 *      highest history priority and let the ranking collaborator choose.
 *
 * select_next() never throws for selection logic; collaborator failures fall
 * back to the finalist whose difficulty is closest to the ability.
 */
class SelectionPolicy {
public:
  SelectionPolicy(const ItemCatalog& catalog,
                  LearnerState& learner,
                  SelectionConfig config,
                  std::shared_ptr<RankingCollaborator> ranker = nullptr,
                  Clock clock = system_now);

  const SelectionConfig& config() const noexcept { return config_; }
  const std::shared_ptr<RankingCollaborator>& ranker() const { return ranker_; }

  Next select_next();

  std::optional<TopicChoice> select_topic() const;
  std::vector<ShortlistEntry> shortlist(const std::string& topic) const;
  std::vector<ItemHistory> item_history(const std::string& topic) const;
  std::optional<std::string> last_attempted(const std::vector<ItemHistory>& history) const;

  // age * (multiplier if last wrong) * (1 + weight * wrong); unseen is +inf.
  double priority(const ItemHistory* entry, TimePoint now) const;
  std::vector<FinalistEntry> finalists(const std::vector<const Item*>& candidates,
                                       const std::vector<ItemHistory>& history) const;

  RecentPerformance recent_performance(const std::string& topic) const;

  std::vector<const Item*> recommended_items(const std::string& topic, int n = 5) const;
  std::vector<const Item*> items_by_difficulty(const std::string& topic, DifficultyBand band) const;
  bool should_move_to_next_topic(const std::string& topic) const;
  SelectionExplanation explain(const Item& item) const;
  TopicReadiness topic_readiness(const std::string& topic) const;

  const std::optional<std::string>& last_explanation() const { return last_explanation_; }

private:
  Selection finish(Selection selection);
  const Item* match_reply(const std::string& selected_id, const std::vector<FinalistEntry>& finalists) const;

  const ItemCatalog& catalog_;
  LearnerState& learner_;
  SelectionConfig config_;
  std::shared_ptr<RankingCollaborator> ranker_;
  Clock clock_;
  std::optional<std::string> last_explanation_;
};

} // namespace adapt
