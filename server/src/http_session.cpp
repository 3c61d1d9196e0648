/*
 * 설명: HTTP 요청을 처리하고 이벤트 수집/조회/메트릭/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/live_match_flow_test.cpp
 */
#include "matchfeed/http_session.hpp"

#include <optional>
#include <unordered_map>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace matchfeed {

namespace {
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
  path = target;
  query.clear();
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }
}

nlohmann::json MetricsJson(const MetricsSnapshot& snapshot, std::size_t live_matches) {
  return {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
          {"connections",
           {{"websocket", snapshot.websocket_active},
            {"registered", snapshot.registered_connections},
            {"liveMatches", live_matches}}},
          {"broadcast",
           {{"total", snapshot.broadcasts}, {"dropped", snapshot.broadcast_drops}, {"evicted", snapshot.evictions}}},
          {"publish", {{"total", snapshot.published}, {"failures", snapshot.publish_failures}}},
          {"bridge",
           {{"received", snapshot.bridge_received},
            {"malformed", snapshot.bridge_malformed},
            {"retries", snapshot.bridge_retries}}}};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<MatchHub> hub,
                         std::shared_ptr<EventPublisher> publisher, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), hub_(std::move(hub)), publisher_(std::move(publisher)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  auto segments = SplitPath(path);

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendJson(http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    return SendJson(http::status::ok,
                    MakeSuccessEnvelope(MetricsJson(observability_->Snapshot(), hub_->MatchCount())));
  }

  // /api/matches/{id}/{viewers|events|score|status}
  if (segments.size() == 4 && segments[0] == "api" && segments[1] == "matches") {
    auto match_id = ParseMatchId(segments[2]);
    if (!match_id) {
      return SendJson(http::status::bad_request,
                      MakeErrorEnvelope("invalid_match_id", "match_id는 양의 정수여야 합니다"));
    }
    const auto& action = segments[3];
    if (req_.method() == http::verb::get && action == "viewers") {
      return SendJson(http::status::ok,
                      MakeSuccessEnvelope({{"matchId", *match_id}, {"viewers", hub_->ViewerCount(*match_id)}}));
    }
    if (req_.method() == http::verb::post && (action == "events" || action == "score" || action == "status")) {
      return HandlePublish(*match_id, action);
    }
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandlePublish(MatchId match_id, const std::string& kind) {
  using boost::beast::http::status;
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body.is_discarded()) {
    return SendJson(status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  }

  std::string error_message;
  std::optional<Envelope> published;
  try {
    if (kind == "events") {
      auto event = ParseMatchEventData(body, error_message);
      if (event) {
        published = publisher_->PublishMatchEvent(match_id, *event);
      }
    } else if (kind == "score") {
      auto update = ParseScoreUpdateData(body, error_message);
      if (update) {
        published = publisher_->PublishScoreUpdate(match_id, *update);
      }
    } else {
      auto update = ParseMatchStatusData(body, error_message);
      if (update) {
        published = publisher_->PublishMatchStatus(match_id, *update);
      }
    }
  } catch (const PublishError& ex) {
    if (ex.stage == PublishError::Stage::kEncode) {
      return SendJson(status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
    }
    return SendJson(status::bad_gateway, MakeErrorEnvelope("publish_failed", ex.what()));
  }
  if (!published) {
    return SendJson(status::bad_request, MakeErrorEnvelope("bad_request", error_message));
  }

  nlohmann::json invalidations = nlohmann::json::array();
  for (const auto& outcome : publisher_->InvalidateMatchCache(match_id)) {
    nlohmann::json item{{"key", outcome.key}, {"ok", outcome.ok}};
    if (!outcome.ok) {
      item["error"] = outcome.error;
    }
    invalidations.push_back(item);
  }
  SendJson(status::created,
           MakeSuccessEnvelope({{"event", ToJson(*published)}, {"cacheInvalidation", invalidations}}));
}

void HttpSession::HandleWebSocket() {
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  auto segments = SplitPath(path);
  if (segments.size() != 3 || segments[0] != "ws" || segments[1] != "matches") {
    return SendJson(boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "지원되지 않는 구독 경로입니다"));
  }
  auto match_id = ParseMatchId(segments[2]);
  if (!match_id) {
    return SendJson(boost::beast::http::status::bad_request,
                    MakeErrorEnvelope("invalid_match_id", "match_id는 양의 정수여야 합니다"));
  }

  std::optional<int> viewer_id;
  auto params = ParseQueryParams(query);
  if (auto it = params.find("user_id"); it != params.end()) {
    auto parsed = ParseMatchId(it->second);
    if (!parsed) {
      return SendJson(boost::beast::http::status::bad_request,
                      MakeErrorEnvelope("bad_request", "user_id는 양의 정수여야 합니다"));
    }
    viewer_id = *parsed;
  }

  ConnectionLimits limits{config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes,
                          std::chrono::seconds(config_.ws_pong_wait_seconds),
                          std::chrono::seconds(config_.ws_write_wait_seconds), config_.ws_max_message_bytes};
  observability_->Debug("websocket_upgrade", {{"traceId", trace_id_}, {"matchId", *match_id}});
  std::make_shared<WebSocketConnection>(std::move(stream_), *match_id, viewer_id, limits, hub_, observability_)
      ->Run(std::move(req_));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, "matchfeed");
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Info("http_request", {{"traceId", trace_id_},
                                        {"method", std::string(req_.method_string())},
                                        {"target", std::string(req_.target())},
                                        {"status", res->result_int()},
                                        {"latencyMs", latency}});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace matchfeed
