#include "debug_log.hpp"

#include <array>
#include <cstdlib>
#include <iostream>

namespace adapt::debug {
namespace {

constexpr std::size_t kChannelCount = 4;

const char* channel_name(Channel channel) {
  switch (channel) {
    case Channel::Estimator: return "estimator";
    case Channel::Learner: return "learner";
    case Channel::Selection: return "selection";
    case Channel::Ranking: return "ranking";
  }
  return "adapt";
}

const char* channel_env(Channel channel) {
  switch (channel) {
    case Channel::Estimator: return "ADAPT_DEBUG_ESTIMATOR";
    case Channel::Learner: return "ADAPT_DEBUG_LEARNER";
    case Channel::Selection: return "ADAPT_DEBUG_SELECTION";
    case Channel::Ranking: return "ADAPT_DEBUG_RANKING";
  }
  return "ADAPT_DEBUG";
}

bool env_flag(const char* env) {
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

bool read_flag(Channel channel) {
  const char* env = std::getenv(channel_env(channel));
  if (!env) {
    env = std::getenv("ADAPT_DEBUG");
  }
  if (!env) {
    return false;
  }
  return env_flag(env);
}

} // namespace

bool enabled(Channel channel) {
  static const std::array<bool, kChannelCount> flags = [] {
    std::array<bool, kChannelCount> out{};
    out[0] = read_flag(Channel::Estimator);
    out[1] = read_flag(Channel::Learner);
    out[2] = read_flag(Channel::Selection);
    out[3] = read_flag(Channel::Ranking);
    return out;
  }();
  return flags[static_cast<std::size_t>(channel)];
}

void log(Channel channel, const std::string& message) {
  if (enabled(channel)) {
    std::cerr << "[" << channel_name(channel) << "] " << message << std::endl;
  }
}

} // namespace adapt::debug
