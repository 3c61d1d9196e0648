/*
 * 설명: 한 시청자 연결의 공통 상태. 소유 경기, 시청자 ID, 송신 큐, 마지막 활동 시각을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_hub_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "matchfeed/events.hpp"
#include "matchfeed/outbound_queue.hpp"

namespace matchfeed {

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(MatchId match_id, std::optional<int> viewer_id, std::size_t max_queue_messages,
             std::size_t max_queue_bytes);
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  std::uint64_t id() const { return id_; }
  MatchId match_id() const { return match_id_; }
  std::optional<int> viewer_id() const { return viewer_id_; }

  // 허브 전용. 절대 블록하지 않는다.
  OutboundQueue::PushResult Offer(const SharedMessage& message);
  // 큐를 정확히 한 번 닫는다. 처음 닫은 호출에서만 OnQueueClosed()가 불린다.
  bool CloseQueue();
  bool IsQueueClosed() const { return queue_.IsClosed(); }
  std::size_t QueuedMessages() const { return queue_.Size(); }
  std::chrono::steady_clock::time_point LastActivity() const;

 protected:
  std::optional<SharedMessage> NextOutbound() { return queue_.Pop(); }
  void Touch();

  // 메시지가 큐에 들어간 직후 호출된다. 구현은 송신 루프를 깨우되 블록하면 안 된다.
  virtual void OnMessageQueued() {}
  virtual void OnQueueClosed() {}

 private:
  const std::uint64_t id_;
  const MatchId match_id_;
  const std::optional<int> viewer_id_;
  OutboundQueue queue_;
  std::atomic<std::chrono::steady_clock::rep> last_activity_;
};

}  // namespace matchfeed
