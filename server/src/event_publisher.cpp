/*
 * 설명: 추가 후 발행 순서를 지키는 이벤트 발행기와 경기 캐시 무효화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_publisher_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#include "matchfeed/event_publisher.hpp"

#include <stdexcept>
#include <utility>

namespace matchfeed {
namespace {
void RequireMatchId(MatchId match_id) {
  if (match_id <= 0) {
    throw std::invalid_argument("match_id는 양의 정수여야 합니다");
  }
}
}  // namespace

EventPublisher::EventPublisher(std::shared_ptr<DurableLog> durable_log, std::shared_ptr<PubSubBroker> broker,
                               std::shared_ptr<Cache> cache, std::shared_ptr<Observability> observability,
                               Clock clock)
    : durable_log_(std::move(durable_log)), broker_(std::move(broker)), cache_(std::move(cache)),
      observability_(std::move(observability)), clock_(std::move(clock)) {}

Envelope EventPublisher::PublishMatchEvent(MatchId match_id, const MatchEventData& event) {
  RequireMatchId(match_id);
  auto envelope = AppendThenPublish(MakeMatchEventEnvelope(match_id, NextTimestamp(), event), event.event_type);
  observability_->Info("match_event_published",
                       {{"matchId", match_id}, {"eventType", event.event_type}, {"minute", event.minute}});
  return envelope;
}

Envelope EventPublisher::PublishScoreUpdate(MatchId match_id, const ScoreUpdateData& update) {
  RequireMatchId(match_id);
  auto envelope = AppendThenPublish(MakeScoreUpdateEnvelope(match_id, NextTimestamp(), update), "score_update");
  observability_->Info("score_update_published",
                       {{"matchId", match_id},
                        {"homeScore", update.home_team_score},
                        {"awayScore", update.away_team_score}});
  return envelope;
}

Envelope EventPublisher::PublishMatchStatus(MatchId match_id, const MatchStatusData& update) {
  RequireMatchId(match_id);
  auto envelope = AppendThenPublish(MakeMatchStatusEnvelope(match_id, NextTimestamp(), update), "match_status");
  observability_->Info("match_status_published",
                       {{"matchId", match_id}, {"status", std::string(ToString(update.status))}});
  return envelope;
}

std::vector<CacheInvalidation> EventPublisher::InvalidateMatchCache(MatchId match_id) {
  std::vector<CacheInvalidation> outcomes;
  for (const auto& key : CacheKeys(match_id)) {
    try {
      cache_->Delete(key);
      outcomes.push_back(CacheInvalidation{key, true, ""});
    } catch (const BrokerError& ex) {
      observability_->Error("cache_invalidation_failed", {{"key", key}, {"error", ex.what()}});
      outcomes.push_back(CacheInvalidation{key, false, ex.what()});
    }
  }
  observability_->Info("match_cache_invalidated", {{"matchId", match_id}});
  return outcomes;
}

std::vector<std::string> EventPublisher::CacheKeys(MatchId match_id) {
  const auto id = std::to_string(match_id);
  return {"match:" + id, "match:" + id + ":events", "match:" + id + ":stats"};
}

Timestamp EventPublisher::NextTimestamp() {
  std::lock_guard<std::mutex> lock(clock_mutex_);
  auto now = clock_();
  if (now < last_timestamp_) {
    now = last_timestamp_;
  }
  last_timestamp_ = now;
  return now;
}

Envelope EventPublisher::AppendThenPublish(const Envelope& envelope, const std::string& event_kind) {
  std::string payload;
  std::string data;
  try {
    payload = Serialize(envelope);
    data = envelope.data.dump();
  } catch (const nlohmann::json::exception& ex) {
    observability_->IncrementPublishFailure();
    observability_->Error("event_encode_failed", {{"matchId", envelope.match_id}, {"error", ex.what()}});
    throw PublishError(PublishError::Stage::kEncode, std::string("이벤트 직렬화 실패: ") + ex.what());
  }
  const auto unix_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(envelope.timestamp.time_since_epoch()).count();

  try {
    durable_log_->Append(StreamKey(envelope.match_id),
                         {{"event_type", event_kind}, {"data", data}, {"timestamp", std::to_string(unix_seconds)}});
  } catch (const BrokerError& ex) {
    observability_->IncrementPublishFailure();
    observability_->Error("stream_append_failed", {{"matchId", envelope.match_id}, {"error", ex.what()}});
    throw PublishError(PublishError::Stage::kAppend, std::string("스트림 추가 실패: ") + ex.what());
  }

  try {
    broker_->Publish(EventChannel(envelope.match_id), payload);
  } catch (const BrokerError& ex) {
    observability_->IncrementPublishFailure();
    observability_->Error("publish_failed", {{"matchId", envelope.match_id}, {"error", ex.what()}});
    throw PublishError(PublishError::Stage::kPublish, std::string("발행 실패: ") + ex.what());
  }

  observability_->IncrementPublished();
  return envelope;
}

}  // namespace matchfeed
