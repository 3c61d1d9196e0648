/*
 * 설명: 와일드카드 패턴 구독 하나로 모든 경기 채널을 받아 디코딩한 뒤 허브 인테이크로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broker_bridge_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "matchfeed/broker.hpp"
#include "matchfeed/events.hpp"
#include "matchfeed/observability.hpp"

namespace matchfeed {

struct BridgeOptions {
  std::string pattern{EventChannelPattern()};
  std::chrono::milliseconds backoff{std::chrono::milliseconds(1000)};
};

class BrokerBridge {
 public:
  using Sink = std::function<void(Envelope)>;

  BrokerBridge(std::shared_ptr<PubSubBroker> broker, std::shared_ptr<Observability> observability,
               BridgeOptions options);
  ~BrokerBridge();

  BrokerBridge(const BrokerBridge&) = delete;
  BrokerBridge& operator=(const BrokerBridge&) = delete;

  void Start(Sink sink);
  // 취소 신호. 대기 중인 수신과 백오프를 깨우고 수신 스레드를 합류시킨다.
  void Stop();
  bool IsRunning() const;
  // 현재 브로커 구독이 살아 있는지. 재구독 백오프 중이면 false.
  bool IsSubscribed() const;

  // 메시지 하나를 디코딩해 싱크로 전달한다. 손상된 메시지는 기록 후 false.
  bool HandleMessage(const BrokerMessage& message);

 private:
  void ReceiveLoop();
  bool WaitBackoff();
  void ReportRetry(const std::string& stage, const std::string& error);

  std::shared_ptr<PubSubBroker> broker_;
  std::shared_ptr<Observability> observability_;
  BridgeOptions options_;
  Sink sink_;
  std::thread thread_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Subscription* active_{nullptr};
  bool running_{false};
  bool stopping_{false};
};

}  // namespace matchfeed
