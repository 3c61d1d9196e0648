/*
 * 설명: 연결별 송신 큐의 비차단 삽입, 꺼내기, 닫기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#include "matchfeed/outbound_queue.hpp"

#include <utility>

namespace matchfeed {

OutboundQueue::OutboundQueue(std::size_t max_messages, std::size_t max_bytes)
    : max_messages_(max_messages), max_bytes_(max_bytes) {}

OutboundQueue::PushResult OutboundQueue::TryPush(SharedMessage message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return PushResult::kClosed;
  }
  const auto message_size = message->size();
  if (messages_.size() >= max_messages_ || queued_bytes_ + message_size > max_bytes_) {
    return PushResult::kFull;
  }
  messages_.push_back(std::move(message));
  queued_bytes_ += message_size;
  return PushResult::kAccepted;
}

std::optional<SharedMessage> OutboundQueue::Pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || messages_.empty()) {
    return std::nullopt;
  }
  auto message = std::move(messages_.front());
  messages_.pop_front();
  queued_bytes_ -= message->size();
  return message;
}

bool OutboundQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  closed_ = true;
  messages_.clear();
  queued_bytes_ = 0;
  return true;
}

bool OutboundQueue::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t OutboundQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return messages_.size();
}

std::size_t OutboundQueue::QueuedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queued_bytes_;
}

}  // namespace matchfeed
