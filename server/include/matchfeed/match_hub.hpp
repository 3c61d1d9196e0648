/*
 * 설명: 경기별 시청자 연결 레지스트리와 팬아웃 브로드캐스터. 등록/해제/브로드캐스트를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_hub_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "matchfeed/connection.hpp"
#include "matchfeed/events.hpp"
#include "matchfeed/observability.hpp"

namespace matchfeed {

class BrokerBridge;

struct BroadcastResult {
  std::size_t delivered{0};
  std::size_t evicted{0};
  bool dropped{false};
};

class MatchHub : public std::enable_shared_from_this<MatchHub> {
 public:
  MatchHub(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability);

  void AttachBridge(std::shared_ptr<BrokerBridge> bridge);
  void Start();
  // 인테이크 소비와 브리지 수신 루프를 멈춘다. 연결은 각자의 소켓 수명에 맡긴다.
  void Stop();
  bool IsRunning() const { return running_.load(); }

  void Register(const std::shared_ptr<Connection>& connection);
  void Unregister(const std::shared_ptr<Connection>& connection);
  BroadcastResult Broadcast(const Envelope& envelope);
  // 브리지 인테이크. 허브 strand에서 도착 순서대로 Broadcast한다.
  void Submit(Envelope envelope);

  std::size_t ViewerCount(MatchId match_id) const;
  std::size_t MatchCount() const;
  std::size_t ConnectionCount() const { return connection_count_.load(); }

 private:
  using ConnectionSet = std::unordered_map<std::uint64_t, std::shared_ptr<Connection>>;

  bool RemoveMember(const Connection& connection);
  void Evict(const std::shared_ptr<Connection>& connection, bool queue_full);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<BrokerBridge> bridge_;
  std::unordered_map<MatchId, ConnectionSet> matches_;
  mutable std::shared_mutex mutex_;
  std::atomic<std::size_t> connection_count_{0};
  std::atomic<bool> running_{false};
};

}  // namespace matchfeed
