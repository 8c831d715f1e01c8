#pragma once

#include <string>

namespace adapt::debug {

enum class Channel {
  Estimator,
  Learner,
  Selection,
  Ranking
};

// Enabled by ADAPT_DEBUG_<CHANNEL> or ADAPT_DEBUG; "", "0", "false" disable.
bool enabled(Channel channel);

void log(Channel channel, const std::string& message);

} // namespace adapt::debug
