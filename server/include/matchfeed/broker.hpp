/*
 * 설명: 내구 로그, Pub/Sub 브로커, 캐시 협력자에 대한 좁은 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_publisher_test.cpp, server/tests/unit/broker_bridge_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace matchfeed {

class BrokerError : public std::runtime_error {
 public:
  BrokerError(const std::string& message, bool retryable) : std::runtime_error(message), retryable(retryable) {}
  bool retryable;
};

using StreamFields = std::vector<std::pair<std::string, std::string>>;

struct BrokerMessage {
  std::string pattern;
  std::string channel;
  std::string payload;
};

class DurableLog {
 public:
  virtual ~DurableLog() = default;
  // 스트림 끝에 항목을 추가하고 브로커가 부여한 항목 ID를 반환한다. 실패 시 BrokerError.
  virtual std::string Append(const std::string& stream_key, const StreamFields& fields) = 0;
};

class Subscription {
 public:
  virtual ~Subscription() = default;
  // 메시지가 도착할 때까지 블록한다. Close() 이후에는 std::nullopt, 전송 오류는 BrokerError.
  virtual std::optional<BrokerMessage> Receive() = 0;
  // 다른 스레드에서 호출해 대기 중인 Receive()를 깨운다.
  virtual void Close() = 0;
};

class PubSubBroker {
 public:
  virtual ~PubSubBroker() = default;
  virtual void Publish(const std::string& channel, const std::string& payload) = 0;
  virtual std::unique_ptr<Subscription> PSubscribe(const std::string& pattern) = 0;
};

class Cache {
 public:
  virtual ~Cache() = default;
  virtual void Delete(const std::string& key) = 0;
};

}  // namespace matchfeed
