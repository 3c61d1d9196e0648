/*
 * 설명: 경기 이벤트 도메인 타입과 실시간 엔벨로프 직렬화/역직렬화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace matchfeed {

using MatchId = std::int32_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class EventType { kMatchEvent, kScoreUpdate, kMatchStatus };

enum class MatchStatus { kScheduled, kLive, kFinished, kPostponed, kCanceled };

std::string_view ToString(EventType type);
std::optional<EventType> ParseEventType(std::string_view value);
std::string_view ToString(MatchStatus status);
std::optional<MatchStatus> ParseMatchStatus(std::string_view value);

// goal, shot, pass, card, substitution 등 경기 중 발생한 단일 이벤트.
struct MatchEventData {
  std::int32_t id{0};
  std::optional<std::int32_t> team_id;
  std::optional<std::int32_t> player_id;
  std::optional<std::int32_t> secondary_player_id;
  std::string event_type;
  int minute{0};
  int extra_minute{0};
  std::optional<double> position_x;
  std::optional<double> position_y;
  std::string description;
  std::string metadata;
};

struct ScoreUpdateData {
  int home_team_score{0};
  int away_team_score{0};
};

struct MatchStatusData {
  MatchStatus status{MatchStatus::kScheduled};
};

// 세 가지 메시지 모두가 공유하는 전송 엔벨로프. 생성 후에는 변경하지 않는다.
struct Envelope {
  EventType type;
  MatchId match_id;
  Timestamp timestamp;
  nlohmann::json data;
};

Envelope MakeMatchEventEnvelope(MatchId match_id, Timestamp timestamp, const MatchEventData& event);
Envelope MakeScoreUpdateEnvelope(MatchId match_id, Timestamp timestamp, const ScoreUpdateData& update);
Envelope MakeMatchStatusEnvelope(MatchId match_id, Timestamp timestamp, const MatchStatusData& update);

nlohmann::json ToJson(const Envelope& envelope);
std::string Serialize(const Envelope& envelope);
std::optional<Envelope> DecodeEnvelope(std::string_view raw, std::string& error_message);

std::optional<MatchEventData> ParseMatchEventData(const nlohmann::json& body, std::string& error_message);
std::optional<ScoreUpdateData> ParseScoreUpdateData(const nlohmann::json& body, std::string& error_message);
std::optional<MatchStatusData> ParseMatchStatusData(const nlohmann::json& body, std::string& error_message);

std::string FormatTimestamp(Timestamp tp);
std::optional<Timestamp> ParseTimestamp(std::string_view value);

// 브로커 키 규칙
std::string EventChannel(MatchId match_id);
std::string StreamKey(MatchId match_id);
std::string EventChannelPattern();
std::optional<MatchId> MatchIdFromChannel(std::string_view channel);
std::optional<MatchId> ParseMatchId(std::string_view value);

}  // namespace matchfeed
