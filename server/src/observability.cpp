/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "matchfeed/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "matchfeed/events.hpp"

namespace matchfeed {
namespace {
std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.registered_connections = registered_connections_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.broadcast_drops = broadcast_drops_.load();
  snapshot.evictions = evictions_.load();
  snapshot.published = published_.load();
  snapshot.publish_failures = publish_failures_.load();
  snapshot.bridge_received = bridge_received_.load();
  snapshot.bridge_malformed = bridge_malformed_.load();
  snapshot.bridge_retries = bridge_retries_.load();
  return snapshot;
}

void Observability::Log(LogLevel level, std::string_view event_name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json{{"detail", fields}};
  log_json["level"] = std::string(LevelName(level));
  log_json["eventName"] = std::string(event_name);
  log_json["ts"] = FormatTimestamp(std::chrono::system_clock::now());
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

}  // namespace matchfeed
