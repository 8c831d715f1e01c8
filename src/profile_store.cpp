#include "adapt/profile_store.hpp"

#include "json_bridge.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace adapt {

namespace fs = std::filesystem;

namespace {

nlohmann::json read_json_file(const fs::path& path, const char* what) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error(std::string("Failed to open ") + what + ": " + path.string());
  }
  nlohmann::json data;
  try {
    in >> data;
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("Malformed ") + what + " " + path.string() + ": " + ex.what());
  }
  return data;
}

void write_atomically(const fs::path& path, const std::string& content) {
  // filename.<ticks>.tmp next to the target so the rename stays on one filesystem.
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path temp_path = path;
  temp_path += "." + std::to_string(ticks) + ".tmp";

  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Failed to open temp file: " + temp_path.string());
    }
    out << content;
    out.flush();
    if (out.fail()) {
      out.close();
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      throw std::runtime_error("Write failed: " + temp_path.string());
    }
  }

  std::error_code ec;
  fs::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    throw std::runtime_error("Rename failed for " + path.string() + ": " + ec.message());
  }
}

} // namespace

JsonFileProfileStore::JsonFileProfileStore(fs::path path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("Profile path must not be empty");
  }
}

std::optional<LearnerProfile> JsonFileProfileStore::load() {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return std::nullopt;
  }
  const nlohmann::json data = read_json_file(path_, "profile");
  return bridge::learner_profile_from_json(data);
}

void JsonFileProfileStore::save(const LearnerProfile& profile) {
  write_atomically(path_, bridge::to_json(profile).dump(2));
}

void JsonFileProfileStore::reset() {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    throw std::runtime_error("Failed to remove profile " + path_.string() + ": " + ec.message());
  }
}

JsonFileInteractionLog::JsonFileInteractionLog(fs::path path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("Interaction log path must not be empty");
  }
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return;
  }
  const nlohmann::json data = read_json_file(path_, "interaction log");
  if (!data.is_array()) {
    throw std::invalid_argument("Interaction log must be a JSON array: " + path_.string());
  }
  for (const auto& entry : data) {
    entries_.push_back(bridge::interaction_from_json(entry));
  }
}

void JsonFileInteractionLog::append(const Interaction& interaction) {
  nlohmann::json data = nlohmann::json::array();
  for (const auto& entry : entries_) {
    data.push_back(bridge::to_json(entry));
  }
  data.push_back(bridge::to_json(interaction));
  write_atomically(path_, data.dump(2));
  entries_.push_back(interaction);
}

} // namespace adapt
