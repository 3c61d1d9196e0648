/*
 * 설명: 경기 이벤트 엔벨로프의 JSON 변환, 타임스탬프 형식, 채널 이름 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_envelope_test.cpp
 */
#include "matchfeed/events.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace matchfeed {
namespace {
constexpr std::string_view kChannelPrefix = "match:";
constexpr std::string_view kChannelSuffix = ":events";

template <typename T>
void PutOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

bool ReadOptionalInt(const nlohmann::json& body, const char* key, std::optional<std::int32_t>& dest,
                     std::string& error_message) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    error_message = std::string(key) + " 필드는 정수여야 합니다";
    return false;
  }
  const bool in_range =
      it->is_number_unsigned()
          ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())
          : it->get<std::int64_t>() >= std::numeric_limits<std::int32_t>::min() &&
                it->get<std::int64_t>() <= std::numeric_limits<std::int32_t>::max();
  if (!in_range) {
    error_message = std::string(key) + " 필드가 32비트 정수 범위를 벗어났습니다";
    return false;
  }
  dest = it->get<std::int32_t>();
  return true;
}

bool ReadOptionalDouble(const nlohmann::json& body, const char* key, std::optional<double>& dest,
                        std::string& error_message) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number()) {
    error_message = std::string(key) + " 필드는 숫자여야 합니다";
    return false;
  }
  dest = it->get<double>();
  return true;
}

bool ReadOptionalString(const nlohmann::json& body, const char* key, std::string& dest, std::string& error_message) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error_message = std::string(key) + " 필드는 문자열이어야 합니다";
    return false;
  }
  dest = it->get<std::string>();
  return true;
}

bool ReadNonNegativeInt(const nlohmann::json& body, const char* key, int& dest, std::string& error_message) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_number_integer() || it->get<long long>() < 0 ||
      it->get<long long>() > std::numeric_limits<int>::max()) {
    error_message = std::string(key) + " 필드는 0 이상의 정수여야 합니다";
    return false;
  }
  dest = it->get<int>();
  return true;
}

bool ParseFixedDigits(std::string_view value, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > value.size()) {
    return false;
  }
  int result = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
    result = result * 10 + (value[i] - '0');
  }
  out = result;
  return true;
}
}  // namespace

std::string_view ToString(EventType type) {
  switch (type) {
    case EventType::kMatchEvent:
      return "match_event";
    case EventType::kScoreUpdate:
      return "score_update";
    case EventType::kMatchStatus:
      return "match_status";
  }
  return "match_event";
}

std::optional<EventType> ParseEventType(std::string_view value) {
  if (value == "match_event") {
    return EventType::kMatchEvent;
  }
  if (value == "score_update") {
    return EventType::kScoreUpdate;
  }
  if (value == "match_status") {
    return EventType::kMatchStatus;
  }
  return std::nullopt;
}

std::string_view ToString(MatchStatus status) {
  switch (status) {
    case MatchStatus::kScheduled:
      return "scheduled";
    case MatchStatus::kLive:
      return "live";
    case MatchStatus::kFinished:
      return "finished";
    case MatchStatus::kPostponed:
      return "postponed";
    case MatchStatus::kCanceled:
      return "canceled";
  }
  return "scheduled";
}

std::optional<MatchStatus> ParseMatchStatus(std::string_view value) {
  if (value == "scheduled") {
    return MatchStatus::kScheduled;
  }
  if (value == "live") {
    return MatchStatus::kLive;
  }
  if (value == "finished") {
    return MatchStatus::kFinished;
  }
  if (value == "postponed") {
    return MatchStatus::kPostponed;
  }
  if (value == "canceled") {
    return MatchStatus::kCanceled;
  }
  return std::nullopt;
}

Envelope MakeMatchEventEnvelope(MatchId match_id, Timestamp timestamp, const MatchEventData& event) {
  nlohmann::json data;
  data["id"] = event.id;
  data["match_id"] = match_id;
  PutOptional(data, "team_id", event.team_id);
  PutOptional(data, "player_id", event.player_id);
  PutOptional(data, "secondary_player_id", event.secondary_player_id);
  data["event_type"] = event.event_type;
  data["minute"] = event.minute;
  if (event.extra_minute != 0) {
    data["extra_minute"] = event.extra_minute;
  }
  PutOptional(data, "position_x", event.position_x);
  PutOptional(data, "position_y", event.position_y);
  if (!event.description.empty()) {
    data["description"] = event.description;
  }
  if (!event.metadata.empty()) {
    data["metadata"] = event.metadata;
  }
  data["timestamp"] = FormatTimestamp(timestamp);
  return Envelope{.type = EventType::kMatchEvent, .match_id = match_id, .timestamp = timestamp, .data = data};
}

Envelope MakeScoreUpdateEnvelope(MatchId match_id, Timestamp timestamp, const ScoreUpdateData& update) {
  nlohmann::json data{{"match_id", match_id},
                      {"home_team_score", update.home_team_score},
                      {"away_team_score", update.away_team_score},
                      {"timestamp", FormatTimestamp(timestamp)}};
  return Envelope{.type = EventType::kScoreUpdate, .match_id = match_id, .timestamp = timestamp, .data = data};
}

Envelope MakeMatchStatusEnvelope(MatchId match_id, Timestamp timestamp, const MatchStatusData& update) {
  nlohmann::json data{{"match_id", match_id},
                      {"status", std::string(ToString(update.status))},
                      {"timestamp", FormatTimestamp(timestamp)}};
  return Envelope{.type = EventType::kMatchStatus, .match_id = match_id, .timestamp = timestamp, .data = data};
}

nlohmann::json ToJson(const Envelope& envelope) {
  nlohmann::json j;
  j["type"] = std::string(ToString(envelope.type));
  j["match_id"] = envelope.match_id;
  j["timestamp"] = FormatTimestamp(envelope.timestamp);
  j["data"] = envelope.data;
  return j;
}

std::string Serialize(const Envelope& envelope) { return ToJson(envelope).dump(); }

std::optional<Envelope> DecodeEnvelope(std::string_view raw, std::string& error_message) {
  auto j = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    error_message = "JSON 객체가 아닙니다";
    return std::nullopt;
  }
  auto type_it = j.find("type");
  if (type_it == j.end() || !type_it->is_string()) {
    error_message = "type 필드가 필요합니다";
    return std::nullopt;
  }
  auto type = ParseEventType(type_it->get<std::string>());
  if (!type) {
    error_message = "알 수 없는 type: " + type_it->get<std::string>();
    return std::nullopt;
  }
  auto match_it = j.find("match_id");
  if (match_it == j.end() || !match_it->is_number_integer() || match_it->get<long long>() <= 0 ||
      match_it->get<long long>() > std::numeric_limits<MatchId>::max()) {
    error_message = "match_id는 양의 정수여야 합니다";
    return std::nullopt;
  }
  auto ts_it = j.find("timestamp");
  if (ts_it == j.end() || !ts_it->is_string()) {
    error_message = "timestamp 필드가 필요합니다";
    return std::nullopt;
  }
  auto timestamp = ParseTimestamp(ts_it->get<std::string>());
  if (!timestamp) {
    error_message = "timestamp 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  auto data_it = j.find("data");
  if (data_it == j.end() || !data_it->is_object()) {
    error_message = "data 객체가 필요합니다";
    return std::nullopt;
  }
  return Envelope{.type = *type,
                  .match_id = match_it->get<MatchId>(),
                  .timestamp = *timestamp,
                  .data = std::move(*data_it)};
}

std::optional<MatchEventData> ParseMatchEventData(const nlohmann::json& body, std::string& error_message) {
  if (!body.is_object()) {
    error_message = "JSON 객체가 필요합니다";
    return std::nullopt;
  }
  MatchEventData event;
  auto type_it = body.find("event_type");
  if (type_it == body.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
    error_message = "event_type 필드가 필요합니다";
    return std::nullopt;
  }
  event.event_type = type_it->get<std::string>();
  if (!ReadNonNegativeInt(body, "minute", event.minute, error_message)) {
    return std::nullopt;
  }
  if (body.contains("extra_minute") &&
      !ReadNonNegativeInt(body, "extra_minute", event.extra_minute, error_message)) {
    return std::nullopt;
  }
  std::optional<std::int32_t> id;
  if (!ReadOptionalInt(body, "id", id, error_message) ||
      !ReadOptionalInt(body, "team_id", event.team_id, error_message) ||
      !ReadOptionalInt(body, "player_id", event.player_id, error_message) ||
      !ReadOptionalInt(body, "secondary_player_id", event.secondary_player_id, error_message) ||
      !ReadOptionalDouble(body, "position_x", event.position_x, error_message) ||
      !ReadOptionalDouble(body, "position_y", event.position_y, error_message) ||
      !ReadOptionalString(body, "description", event.description, error_message) ||
      !ReadOptionalString(body, "metadata", event.metadata, error_message)) {
    return std::nullopt;
  }
  event.id = id.value_or(0);
  return event;
}

std::optional<ScoreUpdateData> ParseScoreUpdateData(const nlohmann::json& body, std::string& error_message) {
  if (!body.is_object()) {
    error_message = "JSON 객체가 필요합니다";
    return std::nullopt;
  }
  ScoreUpdateData update;
  if (!ReadNonNegativeInt(body, "home_team_score", update.home_team_score, error_message) ||
      !ReadNonNegativeInt(body, "away_team_score", update.away_team_score, error_message)) {
    return std::nullopt;
  }
  return update;
}

std::optional<MatchStatusData> ParseMatchStatusData(const nlohmann::json& body, std::string& error_message) {
  if (!body.is_object()) {
    error_message = "JSON 객체가 필요합니다";
    return std::nullopt;
  }
  auto it = body.find("status");
  if (it == body.end() || !it->is_string()) {
    error_message = "status 필드가 필요합니다";
    return std::nullopt;
  }
  auto status = ParseMatchStatus(it->get<std::string>());
  if (!status) {
    error_message = "알 수 없는 status: " + it->get<std::string>();
    return std::nullopt;
  }
  return MatchStatusData{*status};
}

std::string FormatTimestamp(Timestamp tp) {
  // 정적 tm을 공유하는 gmtime 대신 달력 연산으로 분해한다. 여러 스레드에서 동시에 호출된다.
  const auto millis = std::chrono::floor<std::chrono::milliseconds>(tp);
  const auto day = std::chrono::floor<std::chrono::days>(millis);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss<std::chrono::milliseconds> hms{millis - day};
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
      << std::setw(2) << hms.hours().count() << ':' << std::setw(2) << hms.minutes().count() << ':'
      << std::setw(2) << hms.seconds().count() << '.' << std::setw(3) << hms.subseconds().count() << 'Z';
  return oss.str();
}

// YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
std::optional<Timestamp> ParseTimestamp(std::string_view value) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (value.size() < 20 || !ParseFixedDigits(value, 0, 4, year) || value[4] != '-' ||
      !ParseFixedDigits(value, 5, 2, month) || value[7] != '-' || !ParseFixedDigits(value, 8, 2, day) ||
      (value[10] != 'T' && value[10] != 't' && value[10] != ' ') || !ParseFixedDigits(value, 11, 2, hour) ||
      value[13] != ':' || !ParseFixedDigits(value, 14, 2, minute) || value[16] != ':' ||
      !ParseFixedDigits(value, 17, 2, second)) {
    return std::nullopt;
  }
  std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                  std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    std::int64_t scale = 100'000'000;
    std::size_t digits = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
      if (scale > 0) {
        fraction += std::chrono::nanoseconds((value[pos] - '0') * scale);
        scale /= 10;
      }
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  std::chrono::minutes offset{0};
  if (pos == value.size()) {
    return std::nullopt;
  }
  if (value[pos] == 'Z' || value[pos] == 'z') {
    ++pos;
  } else if (value[pos] == '+' || value[pos] == '-') {
    int off_h = 0, off_m = 0;
    if (!ParseFixedDigits(value, pos + 1, 2, off_h) || pos + 3 >= value.size() || value[pos + 3] != ':' ||
        !ParseFixedDigits(value, pos + 4, 2, off_m)) {
      return std::nullopt;
    }
    offset = std::chrono::hours(off_h) + std::chrono::minutes(off_m);
    if (value[pos] == '-') {
      offset = -offset;
    }
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != value.size()) {
    return std::nullopt;
  }

  auto tp = std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) +
            std::chrono::seconds(second) - offset;
  return std::chrono::time_point_cast<Timestamp::duration>(tp + fraction);
}

std::string EventChannel(MatchId match_id) { return "match:" + std::to_string(match_id) + ":events"; }

std::string StreamKey(MatchId match_id) { return "match:" + std::to_string(match_id) + ":stream"; }

std::string EventChannelPattern() { return "match:*:events"; }

std::optional<MatchId> MatchIdFromChannel(std::string_view channel) {
  if (channel.size() <= kChannelPrefix.size() + kChannelSuffix.size() ||
      channel.substr(0, kChannelPrefix.size()) != kChannelPrefix ||
      channel.substr(channel.size() - kChannelSuffix.size()) != kChannelSuffix) {
    return std::nullopt;
  }
  return ParseMatchId(
      channel.substr(kChannelPrefix.size(), channel.size() - kChannelPrefix.size() - kChannelSuffix.size()));
}

std::optional<MatchId> ParseMatchId(std::string_view value) {
  if (value.empty() || value.front() == '+' || value.front() == '-') {
    return std::nullopt;
  }
  MatchId parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size() || parsed <= 0) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace matchfeed
