/*
 * 설명: 브로커 패턴 구독을 수신하고 일시 오류 시 고정 백오프 후 재구독하는 브리지 루프.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broker_bridge_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#include "matchfeed/broker_bridge.hpp"

#include <utility>

namespace matchfeed {

BrokerBridge::BrokerBridge(std::shared_ptr<PubSubBroker> broker, std::shared_ptr<Observability> observability,
                           BridgeOptions options)
    : broker_(std::move(broker)), observability_(std::move(observability)), options_(std::move(options)) {}

BrokerBridge::~BrokerBridge() { Stop(); }

void BrokerBridge::Start(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  sink_ = std::move(sink);
  running_ = true;
  stopping_ = false;
  thread_ = std::thread([this]() { ReceiveLoop(); });
}

void BrokerBridge::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
    if (active_) {
      active_->Close();
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

bool BrokerBridge::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ && !stopping_;
}

bool BrokerBridge::IsSubscribed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ != nullptr;
}

bool BrokerBridge::HandleMessage(const BrokerMessage& message) {
  observability_->IncrementBridgeReceived();
  std::string error_message;
  auto envelope = DecodeEnvelope(message.payload, error_message);
  if (envelope) {
    auto channel_match = MatchIdFromChannel(message.channel);
    if (!channel_match || *channel_match != envelope->match_id) {
      envelope.reset();
      error_message = "채널과 match_id가 일치하지 않습니다";
    }
  }
  if (!envelope) {
    observability_->IncrementBridgeMalformed();
    observability_->Warn("bridge_malformed_message", {{"channel", message.channel}, {"error", error_message}});
    return false;
  }
  sink_(std::move(*envelope));
  return true;
}

void BrokerBridge::ReceiveLoop() {
  observability_->Info("bridge_started", {{"pattern", options_.pattern}});
  while (true) {
    std::unique_ptr<Subscription> subscription;
    try {
      subscription = broker_->PSubscribe(options_.pattern);
    } catch (const BrokerError& ex) {
      ReportRetry("subscribe", ex.what());
      if (!WaitBackoff()) {
        break;
      }
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        break;
      }
      active_ = subscription.get();
    }

    bool healthy = true;
    while (healthy) {
      try {
        auto message = subscription->Receive();
        if (!message) {
          std::lock_guard<std::mutex> lock(mutex_);
          if (!stopping_) {
            ReportRetry("receive", "구독이 예기치 않게 닫혔습니다");
          }
          healthy = false;
          break;
        }
        HandleMessage(*message);
      } catch (const BrokerError& ex) {
        ReportRetry("receive", ex.what());
        healthy = false;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_ = nullptr;
    }
    subscription.reset();
    if (!WaitBackoff()) {
      break;
    }
  }
  observability_->Info("bridge_stopped", {{"pattern", options_.pattern}});
}

// 백오프 동안 대기한다. 취소되면 false.
bool BrokerBridge::WaitBackoff() {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, options_.backoff, [this]() { return stopping_; });
}

void BrokerBridge::ReportRetry(const std::string& stage, const std::string& error) {
  observability_->IncrementBridgeRetry();
  observability_->Error("bridge_retry",
                        {{"stage", stage}, {"error", error}, {"backoffMs", options_.backoff.count()}});
}

}  // namespace matchfeed
