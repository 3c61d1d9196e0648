/*
 * 설명: 시청자 WebSocket 연결. 핸드셰이크 성공 후에만 허브에 등록하고, 읽기/쓰기 오류나 기한 초과 시 해제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#include "matchfeed/websocket_connection.hpp"

#include <boost/asio/post.hpp>

#include "matchfeed/match_hub.hpp"

namespace matchfeed {
namespace websocket = boost::beast::websocket;

namespace {
constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
}  // namespace

WebSocketConnection::WebSocketConnection(boost::beast::tcp_stream stream, MatchId match_id,
                                         std::optional<int> viewer_id, const ConnectionLimits& limits,
                                         std::weak_ptr<MatchHub> hub, std::shared_ptr<Observability> observability)
    : Connection(match_id, viewer_id, limits.max_queue_messages, limits.max_queue_bytes),
      ws_(std::move(stream)), read_deadline_(ws_.get_executor()), write_deadline_(ws_.get_executor()),
      ping_timer_(ws_.get_executor()), limits_(limits), hub_(std::move(hub)),
      observability_(std::move(observability)) {}

std::shared_ptr<WebSocketConnection> WebSocketConnection::Self() {
  return std::static_pointer_cast<WebSocketConnection>(shared_from_this());
}

void WebSocketConnection::Run(boost::beast::http::request<boost::beast::http::string_body> req) {
  req_ = std::move(req);
  boost::beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout{kHandshakeTimeout, websocket::stream_base::none(), false});
  ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "matchfeed");
  }));
  ws_.read_message_max(limits_.max_message_bytes);
  ws_.control_callback([this](websocket::frame_type kind, boost::beast::string_view) {
    Touch();
    if (kind == websocket::frame_type::pong || kind == websocket::frame_type::ping) {
      ArmReadDeadline();
    }
  });
  ws_.async_accept(req_, [self = Self()](boost::beast::error_code ec) { self->OnAccept(ec); });
}

void WebSocketConnection::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    observability_->Debug("websocket_handshake_failed", {{"matchId", match_id()}, {"error", ec.message()}});
    return;
  }
  auto hub = hub_.lock();
  if (!hub) {
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    return;
  }
  accepted_ = true;
  observability_->WebsocketOpened();
  Touch();
  hub->Register(shared_from_this());
  ArmReadDeadline();
  SchedulePing();
  DoRead();
}

void WebSocketConnection::DoRead() {
  ws_.async_read(buffer_, [self = Self()](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketConnection::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == websocket::error::closed) {
    return Teardown(closing_ ? "backpressure_exceeded" : "peer_closed");
  }
  if (ec) {
    return Teardown(ec == websocket::error::message_too_big ? "message_too_big" : "read_error");
  }
  // 수신 프레임은 생존 확인 용도로만 쓴다.
  buffer_.consume(buffer_.size());
  Touch();
  ArmReadDeadline();
  DoRead();
}

void WebSocketConnection::ArmReadDeadline() {
  if (torn_down_) {
    return;
  }
  read_deadline_.expires_after(limits_.pong_wait);
  read_deadline_.async_wait([self = Self()](boost::beast::error_code ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    self->Teardown("read_deadline");
  });
}

void WebSocketConnection::SchedulePing() {
  if (closing_) {
    return;
  }
  ping_timer_.expires_after(limits_.PingPeriod());
  ping_timer_.async_wait([self = Self()](boost::beast::error_code ec) {
    if (ec == boost::asio::error::operation_aborted || self->closing_) {
      return;
    }
    if (!self->ping_in_flight_) {
      self->ping_in_flight_ = true;
      self->ws_.async_ping({}, [self](boost::beast::error_code ping_ec) {
        self->ping_in_flight_ = false;
        if (ping_ec) {
          self->Teardown("ping_error");
        }
      });
    }
    self->SchedulePing();
  });
}

void WebSocketConnection::OnMessageQueued() {
  boost::asio::post(ws_.get_executor(), [self = Self()]() { self->WriteNext(); });
}

void WebSocketConnection::OnQueueClosed() {
  boost::asio::post(ws_.get_executor(), [self = Self()]() { self->CloseForBackpressure(); });
}

void WebSocketConnection::WriteNext() {
  if (writing_ || closing_ || !accepted_) {
    return;
  }
  auto next = NextOutbound();
  if (!next) {
    return;
  }
  in_flight_ = std::move(*next);
  writing_ = true;
  write_deadline_.expires_after(limits_.write_wait);
  write_deadline_.async_wait([self = Self()](boost::beast::error_code ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    self->Teardown("write_deadline");
  });
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*in_flight_),
                  [self = Self()](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                    self->OnWrite(ec);
                  });
}

void WebSocketConnection::OnWrite(boost::beast::error_code ec) {
  write_deadline_.cancel();
  writing_ = false;
  in_flight_.reset();
  if (ec) {
    return Teardown("write_error");
  }
  Touch();
  WriteNext();
}

// 허브가 큐를 닫았을 때 불린다. 이미 정리 중이면 아무것도 하지 않는다.
void WebSocketConnection::CloseForBackpressure() {
  if (closing_ || !accepted_) {
    return;
  }
  closing_ = true;
  ping_timer_.cancel();
  websocket::close_reason reason{websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  ws_.async_close(reason, [self = Self()](boost::beast::error_code) { self->Teardown("backpressure_exceeded"); });
}

void WebSocketConnection::Teardown(const std::string& reason) {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;
  closing_ = true;
  read_deadline_.cancel();
  write_deadline_.cancel();
  ping_timer_.cancel();

  if (auto hub = hub_.lock()) {
    hub->Unregister(shared_from_this());
  }
  CloseQueue();

  boost::beast::error_code ignored;
  boost::beast::get_lowest_layer(ws_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);

  if (accepted_) {
    observability_->WebsocketClosed();
  }
  observability_->Info("connection_closed",
                       {{"matchId", match_id()}, {"connectionId", id()}, {"reason", reason}});
}

}  // namespace matchfeed
