/*
 * 설명: 시청자 WebSocket 연결의 수신(생존 확인) 루프와 송신(큐 배출, keepalive) 루프를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "matchfeed/connection.hpp"
#include "matchfeed/observability.hpp"

namespace matchfeed {

class MatchHub;

struct ConnectionLimits {
  std::size_t max_queue_messages;
  std::size_t max_queue_bytes;
  std::chrono::seconds pong_wait;
  std::chrono::seconds write_wait;
  std::size_t max_message_bytes;

  // pong 대기 시간보다 확실히 짧아야 한다.
  std::chrono::milliseconds PingPeriod() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(pong_wait) * 9 / 10;
  }
};

class WebSocketConnection : public Connection {
 public:
  WebSocketConnection(boost::beast::tcp_stream stream, MatchId match_id, std::optional<int> viewer_id,
                      const ConnectionLimits& limits, std::weak_ptr<MatchHub> hub,
                      std::shared_ptr<Observability> observability);

  void Run(boost::beast::http::request<boost::beast::http::string_body> req);

 protected:
  void OnMessageQueued() override;
  void OnQueueClosed() override;

 private:
  std::shared_ptr<WebSocketConnection> Self();

  void OnAccept(boost::beast::error_code ec);
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void ArmReadDeadline();
  void SchedulePing();
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseForBackpressure();
  void Teardown(const std::string& reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  boost::asio::steady_timer read_deadline_;
  boost::asio::steady_timer write_deadline_;
  boost::asio::steady_timer ping_timer_;
  ConnectionLimits limits_;
  std::weak_ptr<MatchHub> hub_;
  std::shared_ptr<Observability> observability_;
  SharedMessage in_flight_;
  bool accepted_{false};
  bool writing_{false};
  bool ping_in_flight_{false};
  bool closing_{false};
  bool torn_down_{false};
};

}  // namespace matchfeed
