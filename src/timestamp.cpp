#include "adapt/timestamp.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace adapt {
namespace {

bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(const std::string& text, std::size_t& pos, char ch) {
  if (pos >= text.size() || text[pos] != ch) {
    return false;
  }
  ++pos;
  return true;
}

} // namespace

TimePoint system_now() {
  return std::chrono::system_clock::now();
}

std::string format_iso8601(TimePoint time) {
  const auto micros_total =
      std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
  long long seconds = micros_total / 1000000;
  long long micros = micros_total % 1000000;
  if (micros < 0) {
    micros += 1000000;
    seconds -= 1;
  }
  const std::time_t as_time = static_cast<std::time_t>(seconds);
  std::tm parts{};
  gmtime_r(&as_time, &parts);

  std::ostringstream oss;
  oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
  std::size_t pos = 0;
  std::tm parts{};
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !read_digits(text, pos, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return std::nullopt;
  }

  long long micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 6; ++i) {
      micros *= 10;
    }
  }

  long long offset_seconds = 0;
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z' && pos + 1 == text.size()) {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      ++pos;
      int off_h = 0, off_m = 0;
      if (!read_digits(text, pos, 2, off_h) || !expect(text, pos, ':') ||
          !read_digits(text, pos, 2, off_m)) {
        return std::nullopt;
      }
      offset_seconds = (off_h * 3600LL + off_m * 60LL) * (sign == '+' ? 1 : -1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  parts.tm_year = year - 1900;
  parts.tm_mon = month - 1;
  parts.tm_mday = day;
  parts.tm_hour = hour;
  parts.tm_min = minute;
  parts.tm_sec = second;
  const std::time_t utc = timegm(&parts);
  const long long epoch_seconds = static_cast<long long>(utc) - offset_seconds;
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::seconds(epoch_seconds) + std::chrono::microseconds(micros)));
}

} // namespace adapt
