/*
 * 설명: 프로세스 내 브로커 구현. 스트림 추가, 패턴 구독, 발행, 캐시 삭제와 장애 주입을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_publisher_test.cpp, server/tests/unit/broker_bridge_test.cpp
 */
#include "matchfeed/in_memory_broker.hpp"

#include <utility>

namespace matchfeed {

class InMemoryBroker::MemorySubscription : public Subscription {
 public:
  MemorySubscription(std::shared_ptr<InMemoryBroker> broker, std::string pattern)
      : broker_(std::move(broker)), pattern_(std::move(pattern)) {}

  ~MemorySubscription() override {
    Close();
    broker_->Detach(this);
  }

  std::optional<BrokerMessage> Receive() override {
    if (broker_->ShouldFail(Operation::kReceive, pattern_)) {
      throw BrokerError("주입된 수신 오류: " + pattern_, true);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !pending_.empty(); });
    if (closed_) {
      return std::nullopt;
    }
    auto message = std::move(pending_.front());
    pending_.pop_front();
    return message;
  }

  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  const std::string& pattern() const { return pattern_; }

  void Push(BrokerMessage message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      pending_.push_back(std::move(message));
    }
    cv_.notify_one();
  }

 private:
  std::shared_ptr<InMemoryBroker> broker_;
  std::string pattern_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<BrokerMessage> pending_;
  bool closed_{false};
};

bool GlobMatch(std::string_view pattern, std::string_view text) {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string_view::npos;
  std::size_t resume = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

InMemoryBroker::InMemoryBroker(std::size_t published_history_limit)
    : published_history_limit_(published_history_limit) {}

std::string InMemoryBroker::Append(const std::string& stream_key, const StreamFields& fields) {
  if (ShouldFail(Operation::kAppend, stream_key)) {
    throw BrokerError("주입된 스트림 추가 오류: " + stream_key, true);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = std::to_string(next_stream_seq_++) + "-0";
  streams_[stream_key].push_back(StreamEntry{id, fields});
  return id;
}

void InMemoryBroker::Publish(const std::string& channel, const std::string& payload) {
  if (ShouldFail(Operation::kPublish, channel)) {
    throw BrokerError("주입된 발행 오류: " + channel, true);
  }
  Deliver(channel, payload);
}

std::unique_ptr<Subscription> InMemoryBroker::PSubscribe(const std::string& pattern) {
  if (ShouldFail(Operation::kSubscribe, pattern)) {
    throw BrokerError("주입된 구독 오류: " + pattern, true);
  }
  auto subscription = std::make_unique<MemorySubscription>(shared_from_this(), pattern);
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.insert(subscription.get());
  return subscription;
}

void InMemoryBroker::Delete(const std::string& key) {
  if (ShouldFail(Operation::kDelete, key)) {
    throw BrokerError("주입된 캐시 삭제 오류: " + key, true);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.erase(key);
}

void InMemoryBroker::SetFailureInjector(FailureInjector injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  injector_ = std::move(injector);
}

void InMemoryBroker::InjectRaw(const std::string& channel, const std::string& payload) { Deliver(channel, payload); }

void InMemoryBroker::SetCacheValue(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_[key] = value;
}

bool InMemoryBroker::HasCacheKey(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.count(key) > 0;
}

std::vector<InMemoryBroker::StreamEntry> InMemoryBroker::StreamEntries(const std::string& stream_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = streams_.find(stream_key);
  if (it == streams_.end()) {
    return {};
  }
  return it->second;
}

std::vector<BrokerMessage> InMemoryBroker::PublishedMessages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {published_.begin(), published_.end()};
}

std::size_t InMemoryBroker::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

bool InMemoryBroker::ShouldFail(Operation op, const std::string& key) const {
  FailureInjector injector;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    injector = injector_;
  }
  return injector && injector(op, key);
}

void InMemoryBroker::Deliver(const std::string& channel, const std::string& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (published_history_limit_ > 0) {
    if (published_.size() == published_history_limit_) {
      published_.pop_front();
    }
    published_.push_back(BrokerMessage{"", channel, payload});
  }
  for (auto* subscription : subscriptions_) {
    if (GlobMatch(subscription->pattern(), channel)) {
      subscription->Push(BrokerMessage{subscription->pattern(), channel, payload});
    }
  }
}

void InMemoryBroker::Detach(MemorySubscription* subscription) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(subscription);
}

}  // namespace matchfeed
