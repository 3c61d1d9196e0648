/*
 * 설명: HTTP 연결을 처리하고 이벤트 수집/조회 엔드포인트 및 경기 구독 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "matchfeed/api_response.hpp"
#include "matchfeed/config.hpp"
#include "matchfeed/event_publisher.hpp"
#include "matchfeed/match_hub.hpp"
#include "matchfeed/observability.hpp"
#include "matchfeed/websocket_connection.hpp"

namespace matchfeed {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<MatchHub> hub,
              std::shared_ptr<EventPublisher> publisher, std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandlePublish(MatchId match_id, const std::string& kind);
  void HandleWebSocket();
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<MatchHub> hub_;
  std::shared_ptr<EventPublisher> publisher_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace matchfeed
