/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_hub_test.cpp, server/tests/e2e/live_match_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace matchfeed {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t registered_connections{0};
  std::uint64_t broadcasts{0};
  std::uint64_t broadcast_drops{0};
  std::uint64_t evictions{0};
  std::uint64_t published{0};
  std::uint64_t publish_failures{0};
  std::uint64_t bridge_received{0};
  std::uint64_t bridge_malformed{0};
  std::uint64_t bridge_retries{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(level) {}

  std::string NextTraceId();
  void IncrementRequest() { request_total_.fetch_add(1); }
  void IncrementError() { request_errors_.fetch_add(1); }
  void WebsocketOpened() { websocket_active_.fetch_add(1); }
  void WebsocketClosed() { websocket_active_.fetch_sub(1); }
  void ConnectionRegistered() { registered_connections_.fetch_add(1); }
  void ConnectionUnregistered() { registered_connections_.fetch_sub(1); }
  void IncrementBroadcast() { broadcasts_.fetch_add(1); }
  void IncrementBroadcastDrop() { broadcast_drops_.fetch_add(1); }
  void IncrementEviction() { evictions_.fetch_add(1); }
  void IncrementPublished() { published_.fetch_add(1); }
  void IncrementPublishFailure() { publish_failures_.fetch_add(1); }
  void IncrementBridgeReceived() { bridge_received_.fetch_add(1); }
  void IncrementBridgeMalformed() { bridge_malformed_.fetch_add(1); }
  void IncrementBridgeRetry() { bridge_retries_.fetch_add(1); }

  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= level_; }
  void Log(LogLevel level, std::string_view event_name, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Debug(std::string_view event_name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kDebug, event_name, fields);
  }
  void Info(std::string_view event_name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kInfo, event_name, fields);
  }
  void Warn(std::string_view event_name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kWarn, event_name, fields);
  }
  void Error(std::string_view event_name, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kError, event_name, fields);
  }

 private:
  LogLevel level_;
  mutable std::mutex output_mutex_;
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> registered_connections_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> broadcast_drops_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> publish_failures_{0};
  std::atomic<std::uint64_t> bridge_received_{0};
  std::atomic<std::uint64_t> bridge_malformed_{0};
  std::atomic<std::uint64_t> bridge_retries_{0};
};

}  // namespace matchfeed
