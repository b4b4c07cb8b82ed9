/*
 * 설명: ISO-8601/DB 타임스탬프 파싱과 포맷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/time_util_test.cpp
 */
#include "scheduler/time_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace scheduler {
namespace {
using std::chrono::milliseconds;

bool ParseCalendar(std::string_view text, const char* format, std::tm& tm) {
  std::istringstream iss{std::string(text)};
  iss >> std::get_time(&tm, format);
  return !iss.fail();
}

// ".250" 같은 소수 초를 밀리초로 읽는다. 네 번째 자리부터는 버린다.
bool ParseFraction(std::string_view text, std::size_t& pos, int& millis) {
  millis = 0;
  if (pos >= text.size() || text[pos] != '.') {
    return true;
  }
  ++pos;
  int digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    if (digits < 3) {
      millis = millis * 10 + (text[pos] - '0');
    }
    ++digits;
    ++pos;
  }
  if (digits == 0) {
    return false;
  }
  for (int i = digits; i < 3; ++i) {
    millis *= 10;
  }
  return true;
}

bool ParseZone(std::string_view text, std::size_t& pos, int& offset_seconds) {
  offset_seconds = 0;
  if (pos >= text.size()) {
    return false;
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
    return true;
  }
  if (text[pos] != '+' && text[pos] != '-') {
    return false;
  }
  if (text.size() - pos != 6 || text[pos + 3] != ':') {
    return false;
  }
  int sign = text[pos] == '-' ? -1 : 1;
  auto digit = [&](std::size_t idx) -> int {
    char c = text[idx];
    return std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : -1;
  };
  int h1 = digit(pos + 1);
  int h2 = digit(pos + 2);
  int m1 = digit(pos + 4);
  int m2 = digit(pos + 5);
  if (h1 < 0 || h2 < 0 || m1 < 0 || m2 < 0) {
    return false;
  }
  int hours = h1 * 10 + h2;
  int minutes = m1 * 10 + m2;
  if (hours > 23 || minutes > 59) {
    return false;
  }
  offset_seconds = sign * (hours * 3600 + minutes * 60);
  pos += 6;
  return true;
}

Timestamp FromUtcCalendar(std::tm& tm, int millis) {
  std::time_t seconds = timegm(&tm);
  return std::chrono::system_clock::from_time_t(seconds) + milliseconds(millis);
}
}  // namespace

Timestamp TruncateToMillis(Timestamp tp) { return std::chrono::time_point_cast<milliseconds>(tp); }

std::optional<Timestamp> ParseIsoTimestamp(std::string_view text) {
  constexpr std::size_t kDateTimeLength = 19;
  if (text.size() < kDateTimeLength || (text[10] != 'T' && text[10] != 't')) {
    return std::nullopt;
  }
  std::tm tm{};
  if (!ParseCalendar(text.substr(0, kDateTimeLength), "%Y-%m-%dT%H:%M:%S", tm)) {
    return std::nullopt;
  }
  std::size_t pos = kDateTimeLength;
  int millis = 0;
  if (!ParseFraction(text, pos, millis)) {
    return std::nullopt;
  }
  int offset_seconds = 0;
  if (!ParseZone(text, pos, offset_seconds) || pos != text.size()) {
    return std::nullopt;
  }
  return FromUtcCalendar(tm, millis) - std::chrono::seconds(offset_seconds);
}

std::optional<Timestamp> ParseLocalDate(std::string_view text) {
  if (text.size() != 10) {
    return std::nullopt;
  }
  std::tm tm{};
  if (!ParseCalendar(text, "%Y-%m-%d", tm)) {
    return std::nullopt;
  }
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  std::time_t local = std::mktime(&tm);
  if (local == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(local);
}

std::string ToIsoString(Timestamp tp) {
  auto truncated = std::chrono::time_point_cast<milliseconds>(tp);
  auto since_epoch = truncated.time_since_epoch().count();
  auto millis = static_cast<int>(((since_epoch % 1000) + 1000) % 1000);
  std::time_t tt = std::chrono::system_clock::to_time_t(truncated - milliseconds(millis));
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string ToSqlDateTime(Timestamp tp) {
  auto truncated = std::chrono::time_point_cast<milliseconds>(tp);
  auto since_epoch = truncated.time_since_epoch().count();
  auto millis = static_cast<int>(((since_epoch % 1000) + 1000) % 1000);
  std::time_t tt = std::chrono::system_clock::to_time_t(truncated - milliseconds(millis));
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
  return oss.str();
}

std::optional<Timestamp> ParseSqlDateTime(std::string_view text) {
  constexpr std::size_t kDateTimeLength = 19;
  if (text.size() < kDateTimeLength) {
    return std::nullopt;
  }
  std::tm tm{};
  if (!ParseCalendar(text.substr(0, kDateTimeLength), "%Y-%m-%d %H:%M:%S", tm)) {
    return std::nullopt;
  }
  std::size_t pos = kDateTimeLength;
  int millis = 0;
  if (!ParseFraction(text, pos, millis) || pos != text.size()) {
    return std::nullopt;
  }
  return FromUtcCalendar(tm, millis);
}

}  // namespace scheduler
