#pragma once

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

class ProfileStore {
public:
  virtual ~ProfileStore() = default;

  // nullopt when nothing has been saved yet.
  virtual std::optional<LearnerProfile> load() = 0;
  virtual void save(const LearnerProfile& profile) = 0;
  // Forgets the stored profile so the next load() starts afresh.
  virtual void reset() = 0;
};

/**
 * One learner profile per JSON file. Saves go to a temp file beside the
 * target and are renamed over it, so readers never see a partial write.
 * I/O failures and malformed content throw.
 */
class JsonFileProfileStore : public ProfileStore {
public:
  explicit JsonFileProfileStore(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

  std::optional<LearnerProfile> load() override;
  void save(const LearnerProfile& profile) override;
  void reset() override;

private:
  std::filesystem::path path_;
};

// One host-visible event, e.g. "code_submit" or "feedback_submit".
struct Interaction {
  std::string timestamp;
  std::string action;
  nlohmann::json details = nlohmann::json::object();
};

class InteractionLog {
public:
  virtual ~InteractionLog() = default;

  virtual void append(const Interaction& interaction) = 0;
  virtual std::vector<Interaction> entries() const = 0;
};

// Keeps every interaction in a JSON array rewritten atomically on each
// append. An entry is only kept in memory once it has been written.
class JsonFileInteractionLog : public InteractionLog {
public:
  // Loads existing entries; throws std::invalid_argument for malformed files.
  explicit JsonFileInteractionLog(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

  void append(const Interaction& interaction) override;
  std::vector<Interaction> entries() const override { return entries_; }

private:
  std::filesystem::path path_;
  std::vector<Interaction> entries_;
};

} // namespace adapt
