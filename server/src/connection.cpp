/*
 * 설명: 시청자 연결의 공통 큐 처리와 활동 시각 갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_hub_test.cpp
 */
#include "matchfeed/connection.hpp"

namespace matchfeed {
namespace {
std::atomic<std::uint64_t> next_connection_id{1};
}  // namespace

Connection::Connection(MatchId match_id, std::optional<int> viewer_id, std::size_t max_queue_messages,
                       std::size_t max_queue_bytes)
    : id_(next_connection_id.fetch_add(1)), match_id_(match_id), viewer_id_(viewer_id),
      queue_(max_queue_messages, max_queue_bytes),
      last_activity_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

OutboundQueue::PushResult Connection::Offer(const SharedMessage& message) {
  auto result = queue_.TryPush(message);
  if (result == OutboundQueue::PushResult::kAccepted) {
    OnMessageQueued();
  }
  return result;
}

bool Connection::CloseQueue() {
  if (!queue_.Close()) {
    return false;
  }
  OnQueueClosed();
  return true;
}

std::chrono::steady_clock::time_point Connection::LastActivity() const {
  return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_activity_.load()));
}

void Connection::Touch() { last_activity_.store(std::chrono::steady_clock::now().time_since_epoch().count()); }

}  // namespace matchfeed
