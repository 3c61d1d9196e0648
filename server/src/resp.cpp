/*
 * 설명: RESP2 명령 인코딩과 응답 파싱을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_parser_test.cpp
 */
#include "matchfeed/resp.hpp"

#include <algorithm>
#include <charconv>

#include "matchfeed/broker.hpp"

namespace matchfeed {
namespace {
constexpr std::size_t kMaxBulkLength = 512 * 1024 * 1024;
constexpr std::size_t kMaxArrayLength = 1024 * 1024;
// 가장 짧은 RESP 요소("+\r\n")의 바이트 수.
constexpr std::size_t kMinElementBytes = 3;

long long ParseLength(std::string_view digits) {
  long long value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    throw BrokerError("RESP 길이 형식 오류: " + std::string(digits), false);
  }
  return value;
}
}  // namespace

std::string EncodeCommand(const std::vector<std::string>& args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& arg : args) {
    out += "$" + std::to_string(arg.size()) + "\r\n";
    out += arg;
    out += "\r\n";
  }
  return out;
}

void RespParser::Feed(std::string_view data) {
  if (offset_ > 0 && (offset_ == buffer_.size() || offset_ > 64 * 1024)) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
  buffer_.append(data.data(), data.size());
}

std::optional<RespValue> RespParser::Next() {
  std::size_t pos = offset_;
  auto value = ParseAt(pos);
  if (value) {
    offset_ = pos;
  }
  return value;
}

std::optional<std::string_view> RespParser::ReadLine(std::size_t& pos) const {
  auto end = buffer_.find("\r\n", pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  std::string_view line(buffer_.data() + pos, end - pos);
  pos = end + 2;
  return line;
}

std::optional<RespValue> RespParser::ParseAt(std::size_t& pos) const {
  if (pos >= buffer_.size()) {
    return std::nullopt;
  }
  const char prefix = buffer_[pos];
  std::size_t cursor = pos + 1;
  auto line = ReadLine(cursor);
  if (!line) {
    return std::nullopt;
  }

  RespValue value;
  switch (prefix) {
    case '+':
      value.kind = RespValue::Kind::kSimpleString;
      value.text = std::string(*line);
      break;
    case '-':
      value.kind = RespValue::Kind::kError;
      value.text = std::string(*line);
      break;
    case ':':
      value.kind = RespValue::Kind::kInteger;
      value.integer = ParseLength(*line);
      break;
    case '$': {
      auto length = ParseLength(*line);
      if (length < 0) {
        value.kind = RespValue::Kind::kNull;
        break;
      }
      if (static_cast<std::size_t>(length) > kMaxBulkLength) {
        throw BrokerError("RESP 벌크 문자열이 너무 큽니다", false);
      }
      if (buffer_.size() < cursor + static_cast<std::size_t>(length) + 2) {
        return std::nullopt;
      }
      if (buffer_.compare(cursor + static_cast<std::size_t>(length), 2, "\r\n") != 0) {
        throw BrokerError("RESP 벌크 문자열 종료 누락", false);
      }
      value.kind = RespValue::Kind::kBulkString;
      value.text = buffer_.substr(cursor, static_cast<std::size_t>(length));
      cursor += static_cast<std::size_t>(length) + 2;
      break;
    }
    case '*': {
      auto count = ParseLength(*line);
      if (count < 0) {
        value.kind = RespValue::Kind::kNull;
        break;
      }
      if (static_cast<std::size_t>(count) > kMaxArrayLength) {
        throw BrokerError("RESP 배열 원소 수가 너무 많습니다: " + std::to_string(count), false);
      }
      value.kind = RespValue::Kind::kArray;
      value.elements.reserve(
          std::min(static_cast<std::size_t>(count), (buffer_.size() - cursor) / kMinElementBytes));
      for (long long i = 0; i < count; ++i) {
        auto element = ParseAt(cursor);
        if (!element) {
          return std::nullopt;
        }
        value.elements.push_back(std::move(*element));
      }
      break;
    }
    default:
      throw BrokerError(std::string("알 수 없는 RESP 타입 바이트: ") + prefix, false);
  }
  pos = cursor;
  return value;
}

}  // namespace matchfeed
