/*
 * 설명: Redis 스트림(XADD), Pub/Sub(PUBLISH/PSUBSCRIBE), 캐시(DEL) 협력자를 RESP 연결로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_parser_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "matchfeed/broker.hpp"
#include "matchfeed/resp.hpp"

namespace matchfeed {

struct RedisConfig {
  std::string host;
  unsigned short port;
  std::string password;
  int db;
  std::chrono::milliseconds io_timeout{std::chrono::milliseconds(2000)};
};

// 블로킹 RESP 연결. 스레드 하나에서만 사용하되 Shutdown()은 다른 스레드에서 호출할 수 있다.
class RedisConnection {
 public:
  explicit RedisConnection(const RedisConfig& config);
  ~RedisConnection();

  RedisConnection(const RedisConnection&) = delete;
  RedisConnection& operator=(const RedisConnection&) = delete;

  void Connect();
  RespValue Command(const std::vector<std::string>& args);
  void Send(const std::vector<std::string>& args);
  RespValue ReadReply(std::optional<std::chrono::milliseconds> timeout);
  void Shutdown();
  bool IsOpen() const { return socket_.is_open(); }

 private:
  void Run(std::optional<std::chrono::milliseconds> timeout);
  [[noreturn]] void RaiseIoError(const boost::system::error_code& ec, const std::string& ctx);

  RedisConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::socket socket_;
  RespParser parser_;
  std::atomic<bool> shutdown_{false};
};

class RedisBroker : public DurableLog, public PubSubBroker, public Cache {
 public:
  explicit RedisBroker(const RedisConfig& config);

  std::string Append(const std::string& stream_key, const StreamFields& fields) override;
  void Publish(const std::string& channel, const std::string& payload) override;
  std::unique_ptr<Subscription> PSubscribe(const std::string& pattern) override;
  void Delete(const std::string& key) override;

  void Ping();

 private:
  RespValue Execute(const std::vector<std::string>& args);

  RedisConfig config_;
  std::unique_ptr<RedisConnection> connection_;
  std::mutex mutex_;
};

}  // namespace matchfeed
