/*
 * 설명: 경기별 연결 집합을 관리하고 이벤트를 비차단 방식으로 팬아웃한다. 느린 소비자는 축출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_hub_test.cpp, server/tests/it/live_pipeline_it_test.cpp
 */
#include "matchfeed/match_hub.hpp"

#include <mutex>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "matchfeed/broker_bridge.hpp"

namespace matchfeed {

MatchHub::MatchHub(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), observability_(std::move(observability)) {}

void MatchHub::AttachBridge(std::shared_ptr<BrokerBridge> bridge) { bridge_ = std::move(bridge); }

void MatchHub::Start() {
  if (running_.exchange(true)) {
    return;
  }
  if (bridge_) {
    std::weak_ptr<MatchHub> weak = weak_from_this();
    bridge_->Start([weak](Envelope envelope) {
      if (auto hub = weak.lock()) {
        hub->Submit(std::move(envelope));
      }
    });
  }
  observability_->Info("hub_started");
}

void MatchHub::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (bridge_) {
    bridge_->Stop();
  }
  observability_->Info("hub_stopped", {{"connections", connection_count_.load()}});
}

void MatchHub::Register(const std::shared_ptr<Connection>& connection) {
  std::size_t viewers = 0;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (connection->IsQueueClosed()) {
      lock.unlock();
      observability_->Warn("register_rejected",
                           {{"matchId", connection->match_id()}, {"connectionId", connection->id()}});
      return;
    }
    auto& members = matches_[connection->match_id()];
    if (!members.emplace(connection->id(), connection).second) {
      return;
    }
    viewers = members.size();
  }
  connection_count_.fetch_add(1);
  observability_->ConnectionRegistered();
  nlohmann::json fields{{"matchId", connection->match_id()}, {"connectionId", connection->id()}, {"viewers", viewers}};
  if (connection->viewer_id()) {
    fields["userId"] = *connection->viewer_id();
  }
  observability_->Info("connection_registered", fields);
}

void MatchHub::Unregister(const std::shared_ptr<Connection>& connection) {
  if (!RemoveMember(*connection)) {
    return;
  }
  connection->CloseQueue();
  observability_->Info("connection_unregistered",
                       {{"matchId", connection->match_id()}, {"connectionId", connection->id()}});
}

BroadcastResult MatchHub::Broadcast(const Envelope& envelope) {
  BroadcastResult result;
  std::vector<std::pair<std::shared_ptr<Connection>, bool>> stale;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = matches_.find(envelope.match_id);
    if (it == matches_.end() || it->second.empty()) {
      result.dropped = true;
    } else {
      auto message = std::make_shared<const std::string>(Serialize(envelope));
      for (const auto& [id, connection] : it->second) {
        switch (connection->Offer(message)) {
          case OutboundQueue::PushResult::kAccepted:
            ++result.delivered;
            break;
          case OutboundQueue::PushResult::kFull:
            stale.emplace_back(connection, true);
            break;
          case OutboundQueue::PushResult::kClosed:
            stale.emplace_back(connection, false);
            break;
        }
      }
    }
  }

  if (result.dropped) {
    observability_->IncrementBroadcastDrop();
    observability_->Info("broadcast_dropped",
                         {{"matchId", envelope.match_id}, {"type", std::string(ToString(envelope.type))}});
    return result;
  }

  for (const auto& [connection, queue_full] : stale) {
    Evict(connection, queue_full);
    if (queue_full) {
      ++result.evicted;
    }
  }
  observability_->IncrementBroadcast();
  observability_->Debug("broadcast",
                        {{"matchId", envelope.match_id},
                         {"type", std::string(ToString(envelope.type))},
                         {"delivered", result.delivered},
                         {"evicted", result.evicted}});
  return result;
}

void MatchHub::Submit(Envelope envelope) {
  if (!running_.load()) {
    observability_->Debug("intake_rejected", {{"matchId", envelope.match_id}});
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this(), envelope = std::move(envelope)]() {
    if (!self->running_.load()) {
      return;
    }
    self->Broadcast(envelope);
  });
}

std::size_t MatchHub::ViewerCount(MatchId match_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  return it == matches_.end() ? 0 : it->second.size();
}

std::size_t MatchHub::MatchCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return matches_.size();
}

bool MatchHub::RemoveMember(const Connection& connection) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = matches_.find(connection.match_id());
    if (it == matches_.end()) {
      return false;
    }
    if (it->second.erase(connection.id()) == 0) {
      return false;
    }
    if (it->second.empty()) {
      matches_.erase(it);
    }
  }
  connection_count_.fetch_sub(1);
  observability_->ConnectionUnregistered();
  return true;
}

void MatchHub::Evict(const std::shared_ptr<Connection>& connection, bool queue_full) {
  RemoveMember(*connection);
  if (connection->CloseQueue() && queue_full) {
    observability_->IncrementEviction();
    observability_->Warn("connection_evicted",
                         {{"matchId", connection->match_id()},
                          {"connectionId", connection->id()},
                          {"reason", "backpressure_exceeded"}});
  }
}

}  // namespace matchfeed
