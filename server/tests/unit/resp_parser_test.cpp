#include <gtest/gtest.h>

#include <string>

#include "matchfeed/broker.hpp"
#include "matchfeed/resp.hpp"

TEST(RespParserTest, EncodesCommandAsBulkArray) {
  EXPECT_EQ(matchfeed::EncodeCommand({"PUBLISH", "match:42:events", "{}"}),
            "*3\r\n$7\r\nPUBLISH\r\n$15\r\nmatch:42:events\r\n$2\r\n{}\r\n");
  EXPECT_EQ(matchfeed::EncodeCommand({"PING"}), "*1\r\n$4\r\nPING\r\n");
}

TEST(RespParserTest, ParsesScalarReplies) {
  matchfeed::RespParser parser;
  parser.Feed("+OK\r\n-ERR wrong type\r\n:17\r\n$5\r\nhello\r\n$-1\r\n");

  auto ok = parser.Next();
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->kind, matchfeed::RespValue::Kind::kSimpleString);
  EXPECT_EQ(ok->text, "OK");

  auto err = parser.Next();
  ASSERT_TRUE(err.has_value());
  EXPECT_TRUE(err->IsError());
  EXPECT_EQ(err->text, "ERR wrong type");

  auto integer = parser.Next();
  ASSERT_TRUE(integer.has_value());
  EXPECT_EQ(integer->kind, matchfeed::RespValue::Kind::kInteger);
  EXPECT_EQ(integer->integer, 17);

  auto bulk = parser.Next();
  ASSERT_TRUE(bulk.has_value());
  EXPECT_EQ(bulk->kind, matchfeed::RespValue::Kind::kBulkString);
  EXPECT_EQ(bulk->text, "hello");

  auto null = parser.Next();
  ASSERT_TRUE(null.has_value());
  EXPECT_EQ(null->kind, matchfeed::RespValue::Kind::kNull);

  EXPECT_FALSE(parser.Next().has_value());
  EXPECT_EQ(parser.Buffered(), 0u);
}

TEST(RespParserTest, ParsesPatternMessageArray) {
  matchfeed::RespParser parser;
  parser.Feed(
      "*4\r\n$8\r\npmessage\r\n$14\r\nmatch:*:events\r\n$15\r\nmatch:42:events\r\n$11\r\n{\"a\":\"b\\r\"}\r\n");

  auto reply = parser.Next();
  ASSERT_TRUE(reply.has_value());
  ASSERT_TRUE(reply->IsArray());
  ASSERT_EQ(reply->elements.size(), 4u);
  EXPECT_EQ(reply->elements[0].text, "pmessage");
  EXPECT_EQ(reply->elements[1].text, "match:*:events");
  EXPECT_EQ(reply->elements[2].text, "match:42:events");
  EXPECT_EQ(reply->elements[3].text, "{\"a\":\"b\\r\"}");
}

TEST(RespParserTest, WaitsForCompleteReplyAcrossFeeds) {
  matchfeed::RespParser parser;
  parser.Feed("*2\r\n$10\r\npsubscr");
  EXPECT_FALSE(parser.Next().has_value());
  parser.Feed("ibe\r\n:1");
  EXPECT_FALSE(parser.Next().has_value());
  parser.Feed("\r\n$3\r\n1-0\r\n");

  auto reply = parser.Next();
  ASSERT_TRUE(reply.has_value());
  ASSERT_TRUE(reply->IsArray());
  EXPECT_EQ(reply->elements[0].text, "psubscribe");
  EXPECT_EQ(reply->elements[1].integer, 1);

  auto id = parser.Next();
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->text, "1-0");
}

TEST(RespParserTest, ParsesEmptyAndNullArrays) {
  matchfeed::RespParser parser;
  parser.Feed("*0\r\n*-1\r\n");
  auto empty = parser.Next();
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->IsArray());
  EXPECT_TRUE(empty->elements.empty());
  auto null = parser.Next();
  ASSERT_TRUE(null.has_value());
  EXPECT_EQ(null->kind, matchfeed::RespValue::Kind::kNull);
}

TEST(RespParserTest, RejectsUnknownTypeByte) {
  matchfeed::RespParser parser;
  parser.Feed("?what\r\n");
  try {
    parser.Next();
    FAIL() << "BrokerError expected";
  } catch (const matchfeed::BrokerError& ex) {
    EXPECT_FALSE(ex.retryable);
  }
}

TEST(RespParserTest, RejectsBulkWithoutTerminator) {
  matchfeed::RespParser parser;
  parser.Feed("$3\r\nabcXY");
  EXPECT_THROW(parser.Next(), matchfeed::BrokerError);
}

TEST(RespParserTest, RejectsOversizedArrayHeader) {
  matchfeed::RespParser parser;
  parser.Feed("*9223372036854775807\r\n");
  try {
    parser.Next();
    FAIL() << "BrokerError expected";
  } catch (const matchfeed::BrokerError& ex) {
    EXPECT_FALSE(ex.retryable);
  }

  matchfeed::RespParser just_over;
  just_over.Feed("*1048577\r\n");
  EXPECT_THROW(just_over.Next(), matchfeed::BrokerError);
}

TEST(RespParserTest, LargeArrayHeaderWaitsForElements) {
  matchfeed::RespParser parser;
  parser.Feed("*1000\r\n:1\r\n");
  EXPECT_FALSE(parser.Next().has_value());
}
