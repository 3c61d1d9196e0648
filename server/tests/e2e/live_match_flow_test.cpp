#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "matchfeed/app.hpp"
#include "matchfeed/config.hpp"

namespace {

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

// 동기 WebSocket 클라이언트. 읽기는 제한 시간 안에 끝나지 않으면 std::nullopt.
class ViewerClient {
 public:
  ViewerClient() : ws_(ioc_) {}

  void Connect(unsigned short port, const std::string& target) {
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port));
    boost::beast::get_lowest_layer(ws_).connect(results);
    ws_.handshake("127.0.0.1:" + std::to_string(port), target);
  }

  std::optional<nlohmann::json> Read(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    boost::beast::flat_buffer buffer;
    std::optional<boost::beast::error_code> result;
    ws_.async_read(buffer, [&result](boost::beast::error_code ec, std::size_t) { result = ec; });
    ioc_.restart();
    ioc_.run_for(timeout);
    if (!result) {
      boost::beast::get_lowest_layer(ws_).cancel();
      ioc_.restart();
      ioc_.run();
      return std::nullopt;
    }
    if (*result) {
      last_error_ = *result;
      return std::nullopt;
    }
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
  }

  void SendText(const std::string& text) {
    ws_.text(true);
    ws_.write(boost::asio::buffer(text));
  }

  boost::beast::websocket::close_reason Reason() const { return ws_.reason(); }
  boost::beast::error_code LastError() const { return last_error_; }

  void Close() {
    boost::beast::error_code ec;
    ws_.close(boost::beast::websocket::close_code::normal, ec);
  }

 private:
  boost::asio::io_context ioc_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::error_code last_error_;
};

class LiveMatchFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    matchfeed::AppConfig config{};
    config.port = 0;
    config.broker_mode = "memory";
    config.log_level = "error";
    config.ws_queue_limit_messages = 64;
    config.ws_queue_limit_bytes = 1024 * 1024;
    config.ws_pong_wait_seconds = 60;
    config.ws_write_wait_seconds = 10;
    config.ws_max_message_bytes = 512;
    config.bridge_backoff_ms = 50;
    config.worker_threads = 2;
    Configure(config);

    app_ = std::make_unique<matchfeed::ServerApp>(config);
    server_thread_ = std::thread([this]() { app_->Run(); });
    WaitForReady();
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    app_.reset();
  }

  virtual void Configure(matchfeed::AppConfig& /*config*/) {}

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target,
                          const std::optional<nlohmann::json>& body = std::nullopt) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(app_->Port()));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "127.0.0.1");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (body) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body->dump();
    }
    req.prepare_payload();

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target); }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, body);
  }

  bool WaitForViewers(int match_id, std::size_t expected, int attempts = 100) {
    for (int i = 0; i < attempts; ++i) {
      auto res = Get("/api/matches/" + std::to_string(match_id) + "/viewers");
      if (res.status == boost::beast::http::status::ok && res.body["data"]["viewers"] == expected) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
  }

  void WaitForReady() {
    for (int i = 0; i < 200; ++i) {
      if (app_->Port() != 0 && app_->GetBridge()->IsSubscribed()) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    FAIL() << "server did not become ready";
  }

  std::unique_ptr<matchfeed::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(LiveMatchFlowFixture, HealthReportsOk) {
  auto res = Get("/api/health");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_TRUE(res.body["success"].get<bool>());
  EXPECT_EQ(res.body["data"]["status"], "ok");
}

TEST_F(LiveMatchFlowFixture, ViewerReceivesPublishedGoal) {
  ViewerClient viewer;
  viewer.Connect(app_->Port(), "/ws/matches/42?user_id=7");
  ASSERT_TRUE(WaitForViewers(42, 1));

  auto res = PostJson("/api/matches/42/events", {{"event_type", "goal"}, {"minute", 10}, {"player_id", 9}});
  ASSERT_EQ(res.status, boost::beast::http::status::created);
  EXPECT_EQ(res.body["data"]["event"]["type"], "match_event");
  EXPECT_EQ(res.body["data"]["event"]["match_id"], 42);
  ASSERT_EQ(res.body["data"]["cacheInvalidation"].size(), 3u);
  EXPECT_TRUE(res.body["data"]["cacheInvalidation"][0]["ok"].get<bool>());

  auto message = viewer.Read();
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ((*message)["type"], "match_event");
  EXPECT_EQ((*message)["match_id"], 42);
  EXPECT_EQ((*message)["data"]["minute"], 10);
  EXPECT_EQ((*message)["data"]["player_id"], 9);
  EXPECT_TRUE((*message)["timestamp"].is_string());
  viewer.Close();
}

TEST_F(LiveMatchFlowFixture, ViewersOnlyReceiveTheirMatch) {
  ViewerClient home;
  ViewerClient away;
  home.Connect(app_->Port(), "/ws/matches/42");
  away.Connect(app_->Port(), "/ws/matches/43");
  ASSERT_TRUE(WaitForViewers(42, 1));
  ASSERT_TRUE(WaitForViewers(43, 1));

  ASSERT_EQ(PostJson("/api/matches/43/score", {{"home_team_score", 0}, {"away_team_score", 1}}).status,
            boost::beast::http::status::created);
  ASSERT_EQ(PostJson("/api/matches/42/status", {{"status", "live"}}).status, boost::beast::http::status::created);

  auto away_message = away.Read();
  ASSERT_TRUE(away_message.has_value());
  EXPECT_EQ((*away_message)["type"], "score_update");
  EXPECT_EQ((*away_message)["match_id"], 43);

  auto home_message = home.Read();
  ASSERT_TRUE(home_message.has_value());
  EXPECT_EQ((*home_message)["type"], "match_status");
  EXPECT_EQ((*home_message)["match_id"], 42);
  EXPECT_EQ((*home_message)["data"]["status"], "live");

  home.Close();
  away.Close();
}

TEST_F(LiveMatchFlowFixture, RejectsInvalidMatchIdOnUpgrade) {
  ViewerClient bad_id;
  EXPECT_THROW(bad_id.Connect(app_->Port(), "/ws/matches/abc"), boost::system::system_error);
  ViewerClient zero_id;
  EXPECT_THROW(zero_id.Connect(app_->Port(), "/ws/matches/0"), boost::system::system_error);
  ViewerClient bad_user;
  EXPECT_THROW(bad_user.Connect(app_->Port(), "/ws/matches/42?user_id=x"), boost::system::system_error);

  auto res = Get("/api/matches/abc/viewers");
  EXPECT_EQ(res.status, boost::beast::http::status::bad_request);
  EXPECT_EQ(res.body["error"]["code"], "invalid_match_id");
  EXPECT_EQ(app_->GetHub()->MatchCount(), 0u);
}

TEST_F(LiveMatchFlowFixture, RejectsMalformedPublishBody) {
  auto missing_minute = PostJson("/api/matches/42/events", {{"event_type", "goal"}});
  EXPECT_EQ(missing_minute.status, boost::beast::http::status::bad_request);
  EXPECT_EQ(missing_minute.body["error"]["code"], "bad_request");

  auto unknown_status = PostJson("/api/matches/42/status", {{"status", "abandoned"}});
  EXPECT_EQ(unknown_status.status, boost::beast::http::status::bad_request);

  auto unknown_route = Get("/api/matches/42/lineups");
  EXPECT_EQ(unknown_route.status, boost::beast::http::status::not_found);

  EXPECT_EQ(app_->GetObservability()->Snapshot().published, 0u);
}

TEST_F(LiveMatchFlowFixture, DisconnectUnregistersViewer) {
  {
    ViewerClient viewer;
    viewer.Connect(app_->Port(), "/ws/matches/42");
    ASSERT_TRUE(WaitForViewers(42, 1));
    viewer.Close();
  }
  EXPECT_TRUE(WaitForViewers(42, 0));
  EXPECT_EQ(app_->GetHub()->MatchCount(), 0u);
}

TEST_F(LiveMatchFlowFixture, MetricsReflectPublishedEvents) {
  ViewerClient viewer;
  viewer.Connect(app_->Port(), "/ws/matches/42");
  ASSERT_TRUE(WaitForViewers(42, 1));
  ASSERT_EQ(PostJson("/api/matches/42/score", {{"home_team_score", 1}, {"away_team_score", 1}}).status,
            boost::beast::http::status::created);
  ASSERT_TRUE(viewer.Read().has_value());

  auto res = Get("/metrics");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_EQ(res.body["data"]["publish"]["total"], 1);
  EXPECT_EQ(res.body["data"]["bridge"]["received"], 1);
  EXPECT_EQ(res.body["data"]["connections"]["registered"], 1);
  EXPECT_GE(res.body["data"]["broadcast"]["total"].get<int>(), 1);
  viewer.Close();
}

namespace {

// 한 메시지도 담지 못하는 송신 큐. 첫 이벤트에서 바로 축출된다.
class BackpressureFlowFixture : public LiveMatchFlowFixture {
 protected:
  void Configure(matchfeed::AppConfig& config) override {
    config.ws_queue_limit_messages = 1;
    config.ws_queue_limit_bytes = 64;
  }
};

class ReadDeadlineFlowFixture : public LiveMatchFlowFixture {
 protected:
  void Configure(matchfeed::AppConfig& config) override { config.ws_pong_wait_seconds = 1; }
};

}  // namespace

TEST_F(BackpressureFlowFixture, SlowViewerIsClosedWithPolicyError) {
  ViewerClient viewer;
  viewer.Connect(app_->Port(), "/ws/matches/42");
  ASSERT_TRUE(WaitForViewers(42, 1));

  for (int i = 0; i < 3; ++i) {
    ASSERT_EQ(PostJson("/api/matches/42/score", {{"home_team_score", i}, {"away_team_score", 0}}).status,
              boost::beast::http::status::created);
  }

  EXPECT_FALSE(viewer.Read().has_value());
  EXPECT_EQ(viewer.LastError(), boost::beast::websocket::error::closed);
  const auto reason = viewer.Reason();
  EXPECT_EQ(reason.code, boost::beast::websocket::close_code::policy_error);
  EXPECT_EQ(std::string(reason.reason.begin(), reason.reason.end()), "backpressure_exceeded");
  EXPECT_TRUE(WaitForViewers(42, 0));
  EXPECT_EQ(app_->GetObservability()->Snapshot().evictions, 1u);
}

TEST_F(LiveMatchFlowFixture, OversizedInboundFrameClosesViewer) {
  ViewerClient viewer;
  viewer.Connect(app_->Port(), "/ws/matches/42");
  ASSERT_TRUE(WaitForViewers(42, 1));

  viewer.SendText(std::string(600, 'x'));

  EXPECT_FALSE(viewer.Read().has_value());
  EXPECT_TRUE(WaitForViewers(42, 0));
  EXPECT_EQ(app_->GetHub()->MatchCount(), 0u);
}

TEST_F(ReadDeadlineFlowFixture, SilentViewerIsUnregisteredAfterPongWait) {
  ViewerClient viewer;
  viewer.Connect(app_->Port(), "/ws/matches/42");
  ASSERT_TRUE(WaitForViewers(42, 1));

  // 읽지 않는 클라이언트는 ping에 pong으로 답하지 않는다.
  EXPECT_TRUE(WaitForViewers(42, 0, 250));
  EXPECT_EQ(app_->GetHub()->MatchCount(), 0u);
}
