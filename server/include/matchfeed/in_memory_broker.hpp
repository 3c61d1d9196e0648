/*
 * 설명: Redis 스트림/PubSub/캐시를 프로세스 내에서 모사하는 브로커. 로컬 실행과 테스트에 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_publisher_test.cpp, server/tests/unit/broker_bridge_test.cpp,
 *         server/tests/it/live_pipeline_it_test.cpp
 */
#pragma once

#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "matchfeed/broker.hpp"

namespace matchfeed {

bool GlobMatch(std::string_view pattern, std::string_view text);

class InMemoryBroker : public DurableLog,
                       public PubSubBroker,
                       public Cache,
                       public std::enable_shared_from_this<InMemoryBroker> {
 public:
  enum class Operation { kAppend, kPublish, kDelete, kSubscribe, kReceive };
  // true를 반환하면 해당 호출이 일시 오류로 실패한다. key는 스트림/채널/캐시 키 또는 패턴이다.
  using FailureInjector = std::function<bool(Operation op, const std::string& key)>;

  struct StreamEntry {
    std::string id;
    StreamFields fields;
  };

  // 검사용 발행 기록은 최근 published_history_limit개만 보관한다.
  explicit InMemoryBroker(std::size_t published_history_limit = 1024);

  std::string Append(const std::string& stream_key, const StreamFields& fields) override;
  void Publish(const std::string& channel, const std::string& payload) override;
  std::unique_ptr<Subscription> PSubscribe(const std::string& pattern) override;
  void Delete(const std::string& key) override;

  void SetFailureInjector(FailureInjector injector);
  // 구독자에게 원시 페이로드를 그대로 밀어 넣는다. 손상된 메시지 시나리오용.
  void InjectRaw(const std::string& channel, const std::string& payload);
  void SetCacheValue(const std::string& key, const std::string& value);
  bool HasCacheKey(const std::string& key) const;

  std::vector<StreamEntry> StreamEntries(const std::string& stream_key) const;
  std::vector<BrokerMessage> PublishedMessages() const;
  std::size_t SubscriberCount() const;

 private:
  class MemorySubscription;

  bool ShouldFail(Operation op, const std::string& key) const;
  void Deliver(const std::string& channel, const std::string& payload);
  void Detach(MemorySubscription* subscription);

  mutable std::mutex mutex_;
  FailureInjector injector_;
  std::unordered_map<std::string, std::vector<StreamEntry>> streams_;
  std::unordered_map<std::string, std::string> cache_;
  const std::size_t published_history_limit_;
  std::deque<BrokerMessage> published_;
  std::set<MemorySubscription*> subscriptions_;
  std::uint64_t next_stream_seq_{1};
};

}  // namespace matchfeed
