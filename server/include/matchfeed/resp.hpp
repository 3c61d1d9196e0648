/*
 * 설명: Redis RESP2 프로토콜의 명령 인코딩과 증분 응답 파서를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_parser_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matchfeed {

struct RespValue {
  enum class Kind { kSimpleString, kError, kInteger, kBulkString, kNull, kArray };

  Kind kind{Kind::kNull};
  std::string text;
  long long integer{0};
  std::vector<RespValue> elements;

  bool IsError() const { return kind == Kind::kError; }
  bool IsString() const { return kind == Kind::kSimpleString || kind == Kind::kBulkString; }
  bool IsArray() const { return kind == Kind::kArray; }
};

std::string EncodeCommand(const std::vector<std::string>& args);

class RespParser {
 public:
  void Feed(std::string_view data);
  // 완성된 응답 하나를 꺼낸다. 데이터가 부족하면 std::nullopt, 형식 오류는 BrokerError.
  std::optional<RespValue> Next();
  std::size_t Buffered() const { return buffer_.size() - offset_; }

 private:
  std::optional<RespValue> ParseAt(std::size_t& pos) const;
  std::optional<std::string_view> ReadLine(std::size_t& pos) const;

  std::string buffer_;
  std::size_t offset_{0};
};

}  // namespace matchfeed
