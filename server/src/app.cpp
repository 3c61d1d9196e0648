/*
 * 설명: 서버 수명주기와 리스닝 스레드, 브로커/허브/브리지/발행기 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#include "matchfeed/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "matchfeed/http_session.hpp"
#include "matchfeed/in_memory_broker.hpp"
#include "matchfeed/redis_broker.hpp"

namespace matchfeed {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<MatchHub> hub, std::shared_ptr<EventPublisher> publisher,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), hub_(std::move(hub)),
        publisher_(std::move(publisher)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short LocalPort() const { return acceptor_.local_endpoint().port(); }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->hub_, self->publisher_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<MatchHub> hub_;
  std::shared_ptr<EventPublisher> publisher_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  BuildBroker();
  hub_ = std::make_shared<MatchHub>(ioc_, observability_);
  bridge_ = std::make_shared<BrokerBridge>(
      pubsub_, observability_,
      BridgeOptions{EventChannelPattern(), std::chrono::milliseconds(config_.bridge_backoff_ms)});
  hub_->AttachBridge(bridge_);
  publisher_ = std::make_shared<EventPublisher>(durable_log_, pubsub_, cache_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::BuildBroker() {
  if (config_.broker_mode == "memory") {
    auto broker = std::make_shared<InMemoryBroker>();
    durable_log_ = broker;
    pubsub_ = broker;
    cache_ = broker;
    return;
  }
  auto broker = std::make_shared<RedisBroker>(
      RedisConfig{config_.redis_host, config_.redis_port, config_.redis_password, config_.redis_db});
  durable_log_ = broker;
  pubsub_ = broker;
  cache_ = broker;
}

bool ServerApp::Run() {
  running_ = true;
  try {
    if (auto redis = std::dynamic_pointer_cast<RedisBroker>(pubsub_)) {
      redis->Ping();
      observability_->Info("redis_connected", {{"host", config_.redis_host}, {"port", config_.redis_port}});
    }
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, hub_, publisher_, observability_);
    listener_->Run();
    bound_port_ = listener_->LocalPort();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Info("signal_received", {{"signal", signal_number}});
      hub_->Stop();
      if (listener_) {
        listener_->Stop();
      }
      work_guard_.reset();
      ioc_.stop();
    });
    hub_->Start();
    observability_->Info("server_started", {{"port", bound_port_.load()}, {"brokerMode", config_.broker_mode}});
    RunWorkers();
    ioc_.run();
    return true;
  } catch (const std::exception& ex) {
    observability_->Error("server_failed", {{"error", ex.what()}});
    Stop();
    return false;
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count =
      config_.worker_threads > 0 ? static_cast<unsigned int>(config_.worker_threads)
                                 : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  hub_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  observability_->Info("server_stopped");
}

namespace {
unsigned short ParsePort(const char* key, const std::string& value, int min_port) {
  const int port = std::stoi(value);
  if (port < min_port || port > 65535) {
    throw std::out_of_range(std::string(key) + " 범위 오류: " + value);
  }
  return static_cast<unsigned short>(port);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = ParsePort("SERVER_PORT", get_env("SERVER_PORT", "8080"), 0);
  cfg.broker_mode = get_env("BROKER_MODE", "redis");
  cfg.redis_host = get_env("REDIS_HOST", "redis");
  cfg.redis_port = ParsePort("REDIS_PORT", get_env("REDIS_PORT", "6379"), 1);
  cfg.redis_password = get_env("REDIS_PASSWORD", "");
  cfg.redis_db = std::stoi(get_env("REDIS_DB", "0"));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.ws_pong_wait_seconds = static_cast<std::size_t>(std::stoul(get_env("WS_PONG_WAIT_SECONDS", "60")));
  cfg.ws_write_wait_seconds = static_cast<std::size_t>(std::stoul(get_env("WS_WRITE_WAIT_SECONDS", "10")));
  cfg.ws_max_message_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_MAX_MESSAGE_BYTES", "512")));
  cfg.bridge_backoff_ms = static_cast<std::size_t>(std::stoul(get_env("BRIDGE_BACKOFF_MS", "1000")));
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  return cfg;
}

}  // namespace matchfeed
