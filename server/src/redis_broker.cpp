/*
 * 설명: Boost.Asio 소켓 위에서 RESP 명령을 주고받는 Redis 협력자 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_parser_test.cpp
 */
#include "matchfeed/redis_broker.hpp"

#include <array>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace matchfeed {
namespace {
class RedisSubscription : public Subscription {
 public:
  RedisSubscription(const RedisConfig& config, std::string pattern)
      : connection_(config), pattern_(std::move(pattern)) {
    connection_.Connect();
    auto reply = connection_.Command({"PSUBSCRIBE", pattern_});
    if (!reply.IsArray() || reply.elements.empty() || reply.elements[0].text != "psubscribe") {
      throw BrokerError("PSUBSCRIBE 응답이 올바르지 않습니다: " + pattern_, true);
    }
  }

  std::optional<BrokerMessage> Receive() override {
    while (!closed_) {
      RespValue reply;
      try {
        reply = connection_.ReadReply(std::nullopt);
      } catch (const BrokerError&) {
        if (closed_) {
          return std::nullopt;
        }
        throw;
      }
      // ["pmessage", pattern, channel, payload]
      if (reply.IsArray() && reply.elements.size() == 4 && reply.elements[0].text == "pmessage") {
        return BrokerMessage{reply.elements[1].text, reply.elements[2].text, reply.elements[3].text};
      }
    }
    return std::nullopt;
  }

  void Close() override {
    closed_ = true;
    connection_.Shutdown();
  }

 private:
  RedisConnection connection_;
  std::string pattern_;
  std::atomic<bool> closed_{false};
};
}  // namespace

RedisConnection::RedisConnection(const RedisConfig& config) : config_(config), socket_(ioc_) {}

RedisConnection::~RedisConnection() {
  boost::system::error_code ec;
  socket_.close(ec);
}

void RedisConnection::Connect() {
  boost::asio::ip::tcp::resolver resolver{ioc_};
  boost::system::error_code resolve_ec;
  auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), resolve_ec);
  if (resolve_ec) {
    RaiseIoError(resolve_ec, "Redis 주소 해석 실패");
  }

  boost::system::error_code connect_ec = boost::asio::error::would_block;
  boost::asio::async_connect(socket_, endpoints,
                             [&connect_ec](const boost::system::error_code& ec,
                                           const boost::asio::ip::tcp::endpoint&) { connect_ec = ec; });
  Run(config_.io_timeout);
  if (connect_ec) {
    RaiseIoError(connect_ec, "Redis 연결 실패");
  }
  boost::system::error_code option_ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), option_ec);
  if (option_ec) {
    RaiseIoError(option_ec, "Redis 소켓 옵션 설정 실패");
  }

  if (!config_.password.empty()) {
    auto reply = Command({"AUTH", config_.password});
    if (reply.IsError()) {
      throw BrokerError("Redis 인증 실패: " + reply.text, false);
    }
  }
  if (config_.db != 0) {
    auto reply = Command({"SELECT", std::to_string(config_.db)});
    if (reply.IsError()) {
      throw BrokerError("Redis DB 선택 실패: " + reply.text, false);
    }
  }
}

RespValue RedisConnection::Command(const std::vector<std::string>& args) {
  Send(args);
  return ReadReply(config_.io_timeout);
}

void RedisConnection::Send(const std::vector<std::string>& args) {
  auto payload = EncodeCommand(args);
  boost::system::error_code write_ec = boost::asio::error::would_block;
  boost::asio::async_write(socket_, boost::asio::buffer(payload),
                           [&write_ec](const boost::system::error_code& ec, std::size_t) { write_ec = ec; });
  Run(config_.io_timeout);
  if (write_ec) {
    RaiseIoError(write_ec, "Redis 쓰기 실패");
  }
}

RespValue RedisConnection::ReadReply(std::optional<std::chrono::milliseconds> timeout) {
  std::array<char, 4096> chunk{};
  while (true) {
    if (auto reply = parser_.Next()) {
      return std::move(*reply);
    }
    boost::system::error_code read_ec = boost::asio::error::would_block;
    std::size_t read_bytes = 0;
    socket_.async_read_some(boost::asio::buffer(chunk),
                            [&read_ec, &read_bytes](const boost::system::error_code& ec, std::size_t n) {
                              read_ec = ec;
                              read_bytes = n;
                            });
    Run(timeout);
    if (read_ec) {
      RaiseIoError(read_ec, "Redis 읽기 실패");
    }
    parser_.Feed(std::string_view(chunk.data(), read_bytes));
  }
}

void RedisConnection::Shutdown() {
  shutdown_ = true;
  boost::asio::post(ioc_, [this]() {
    boost::system::error_code ec;
    socket_.close(ec);
  });
}

// io_context를 제한 시간 동안 돌리고, 시간이 지나면 소켓을 닫아 진행 중인 작업을 취소한다.
void RedisConnection::Run(std::optional<std::chrono::milliseconds> timeout) {
  ioc_.restart();
  if (!timeout) {
    ioc_.run();
    return;
  }
  ioc_.run_for(*timeout);
  if (!ioc_.stopped()) {
    boost::system::error_code ec;
    socket_.close(ec);
    ioc_.run();
  }
}

void RedisConnection::RaiseIoError(const boost::system::error_code& ec, const std::string& ctx) {
  boost::system::error_code ignored;
  socket_.close(ignored);
  if (shutdown_) {
    throw BrokerError(ctx + ": 연결이 종료되었습니다", false);
  }
  throw BrokerError(ctx + ": " + ec.message(), true);
}

RedisBroker::RedisBroker(const RedisConfig& config) : config_(config) {}

std::string RedisBroker::Append(const std::string& stream_key, const StreamFields& fields) {
  std::vector<std::string> args{"XADD", stream_key, "*"};
  for (const auto& [field, value] : fields) {
    args.push_back(field);
    args.push_back(value);
  }
  auto reply = Execute(args);
  if (!reply.IsString()) {
    throw BrokerError("XADD 응답이 올바르지 않습니다: " + stream_key, false);
  }
  return reply.text;
}

void RedisBroker::Publish(const std::string& channel, const std::string& payload) {
  auto reply = Execute({"PUBLISH", channel, payload});
  if (reply.kind != RespValue::Kind::kInteger) {
    throw BrokerError("PUBLISH 응답이 올바르지 않습니다: " + channel, false);
  }
}

std::unique_ptr<Subscription> RedisBroker::PSubscribe(const std::string& pattern) {
  return std::make_unique<RedisSubscription>(config_, pattern);
}

void RedisBroker::Delete(const std::string& key) { Execute({"DEL", key}); }

void RedisBroker::Ping() {
  auto reply = Execute({"PING"});
  if (!reply.IsString() || reply.text != "PONG") {
    throw BrokerError("PING 응답이 올바르지 않습니다", false);
  }
}

RespValue RedisBroker::Execute(const std::vector<std::string>& args) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    if (!connection_ || !connection_->IsOpen()) {
      connection_ = std::make_unique<RedisConnection>(config_);
      connection_->Connect();
    }
    auto reply = connection_->Command(args);
    if (reply.IsError()) {
      throw BrokerError(args.front() + " 실패: " + reply.text, false);
    }
    return reply;
  } catch (const BrokerError& ex) {
    if (ex.retryable) {
      connection_.reset();
    }
    throw;
  }
}

}  // namespace matchfeed
