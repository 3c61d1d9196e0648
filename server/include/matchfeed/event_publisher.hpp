/*
 * 설명: 새 경기 이벤트를 경기별 내구 스트림에 추가한 뒤 Pub/Sub 채널로 발행하고 캐시를 무효화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_publisher_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "matchfeed/broker.hpp"
#include "matchfeed/events.hpp"
#include "matchfeed/observability.hpp"

namespace matchfeed {

class PublishError : public std::runtime_error {
 public:
  enum class Stage { kEncode, kAppend, kPublish };

  PublishError(Stage stage, const std::string& message) : std::runtime_error(message), stage(stage) {}
  Stage stage;
};

struct CacheInvalidation {
  std::string key;
  bool ok;
  std::string error;
};

class EventPublisher {
 public:
  using Clock = std::function<Timestamp()>;

  EventPublisher(std::shared_ptr<DurableLog> durable_log, std::shared_ptr<PubSubBroker> broker,
                 std::shared_ptr<Cache> cache, std::shared_ptr<Observability> observability,
                 Clock clock = [] { return std::chrono::system_clock::now(); });

  // 내구 추가가 실패하면 발행하지 않고 PublishError(kAppend)를 던진다.
  Envelope PublishMatchEvent(MatchId match_id, const MatchEventData& event);
  Envelope PublishScoreUpdate(MatchId match_id, const ScoreUpdateData& update);
  Envelope PublishMatchStatus(MatchId match_id, const MatchStatusData& update);

  // 최선 노력 삭제. 개별 키 실패는 결과에만 남기고 호출은 실패시키지 않는다.
  std::vector<CacheInvalidation> InvalidateMatchCache(MatchId match_id);

  static std::vector<std::string> CacheKeys(MatchId match_id);

 private:
  Timestamp NextTimestamp();
  Envelope AppendThenPublish(const Envelope& envelope, const std::string& event_kind);

  std::shared_ptr<DurableLog> durable_log_;
  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<Cache> cache_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
  std::mutex clock_mutex_;
  Timestamp last_timestamp_{};
};

}  // namespace matchfeed
