/*
 * 설명: 메시지 수와 바이트 수로 제한되는 연결별 송신 큐. 가득 차면 블록하지 않고 거절한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace matchfeed {

// 브로드캐스트 한 번에 한 번만 직렬화한 페이로드를 모든 연결이 공유한다.
using SharedMessage = std::shared_ptr<const std::string>;

class OutboundQueue {
 public:
  enum class PushResult { kAccepted, kFull, kClosed };

  OutboundQueue(std::size_t max_messages, std::size_t max_bytes);

  PushResult TryPush(SharedMessage message);
  std::optional<SharedMessage> Pop();
  // 처음 닫은 호출만 true를 반환한다. 대기 중인 메시지는 버린다.
  bool Close();
  bool IsClosed() const;
  std::size_t Size() const;
  std::size_t QueuedBytes() const;

 private:
  const std::size_t max_messages_;
  const std::size_t max_bytes_;
  mutable std::mutex mutex_;
  std::deque<SharedMessage> messages_;
  std::size_t queued_bytes_{0};
  bool closed_{false};
};

}  // namespace matchfeed
