/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "matchfeed/broker.hpp"
#include "matchfeed/broker_bridge.hpp"
#include "matchfeed/config.hpp"
#include "matchfeed/event_publisher.hpp"
#include "matchfeed/match_hub.hpp"
#include "matchfeed/observability.hpp"

namespace matchfeed {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 종료될 때까지 블록한다. 초기화 실패 시 false.
  bool Run();
  void Stop();

  // 리스닝 중인 포트. 아직 바인드 전이면 0.
  unsigned short Port() const { return bound_port_.load(); }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<MatchHub> GetHub() { return hub_; }
  std::shared_ptr<BrokerBridge> GetBridge() { return bridge_; }
  std::shared_ptr<EventPublisher> GetPublisher() { return publisher_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void BuildBroker();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<DurableLog> durable_log_;
  std::shared_ptr<PubSubBroker> pubsub_;
  std::shared_ptr<Cache> cache_;
  std::shared_ptr<MatchHub> hub_;
  std::shared_ptr<BrokerBridge> bridge_;
  std::shared_ptr<EventPublisher> publisher_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> bound_port_{0};
};

}  // namespace matchfeed
