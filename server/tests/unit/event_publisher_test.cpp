#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "matchfeed/event_publisher.hpp"
#include "matchfeed/in_memory_broker.hpp"
#include "matchfeed/observability.hpp"

namespace {

using Operation = matchfeed::InMemoryBroker::Operation;

std::string FieldValue(const matchfeed::StreamFields& fields, const std::string& name) {
  for (const auto& [key, value] : fields) {
    if (key == name) {
      return value;
    }
  }
  return "";
}

matchfeed::MatchEventData Goal(int minute) {
  matchfeed::MatchEventData event;
  event.id = 501;
  event.team_id = 3;
  event.player_id = 9;
  event.event_type = "goal";
  event.minute = minute;
  return event;
}

class EventPublisherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    broker_ = std::make_shared<matchfeed::InMemoryBroker>();
    observability_ = std::make_shared<matchfeed::Observability>(matchfeed::LogLevel::kError);
    publisher_ = std::make_unique<matchfeed::EventPublisher>(broker_, broker_, broker_, observability_);
  }

  std::shared_ptr<matchfeed::InMemoryBroker> broker_;
  std::shared_ptr<matchfeed::Observability> observability_;
  std::unique_ptr<matchfeed::EventPublisher> publisher_;
};

}  // namespace

TEST_F(EventPublisherTest, AppendsBeforePublishing) {
  std::mutex mutex;
  std::vector<Operation> operations;
  broker_->SetFailureInjector([&](Operation op, const std::string&) {
    std::lock_guard<std::mutex> lock(mutex);
    operations.push_back(op);
    return false;
  });

  auto envelope = publisher_->PublishMatchEvent(42, Goal(10));

  ASSERT_EQ(operations.size(), 2u);
  EXPECT_EQ(operations[0], Operation::kAppend);
  EXPECT_EQ(operations[1], Operation::kPublish);
  EXPECT_EQ(envelope.type, matchfeed::EventType::kMatchEvent);
  EXPECT_EQ(envelope.match_id, 42);
  EXPECT_EQ(observability_->Snapshot().published, 1u);
}

TEST_F(EventPublisherTest, StreamEntryCarriesKindDataAndUnixSeconds) {
  auto envelope = publisher_->PublishMatchEvent(42, Goal(10));

  auto entries = broker_->StreamEntries("match:42:stream");
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(FieldValue(entries[0].fields, "event_type"), "goal");
  auto data = nlohmann::json::parse(FieldValue(entries[0].fields, "data"));
  EXPECT_EQ(data["minute"], 10);
  EXPECT_EQ(data["player_id"], 9);
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(envelope.timestamp.time_since_epoch()).count();
  EXPECT_EQ(FieldValue(entries[0].fields, "timestamp"), std::to_string(seconds));
}

TEST_F(EventPublisherTest, PublishesEnvelopeOnMatchChannel) {
  publisher_->PublishMatchEvent(42, Goal(10));

  auto published = broker_->PublishedMessages();
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].channel, "match:42:events");
  std::string error;
  auto decoded = matchfeed::DecodeEnvelope(published[0].payload, error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->type, matchfeed::EventType::kMatchEvent);
  EXPECT_EQ(decoded->match_id, 42);
  EXPECT_EQ(decoded->data["minute"], 10);
}

TEST_F(EventPublisherTest, ScoreAndStatusUseSameEnvelope) {
  publisher_->PublishScoreUpdate(42, matchfeed::ScoreUpdateData{2, 1});
  publisher_->PublishMatchStatus(42, matchfeed::MatchStatusData{matchfeed::MatchStatus::kFinished});

  auto published = broker_->PublishedMessages();
  ASSERT_EQ(published.size(), 2u);
  std::string error;
  auto score = matchfeed::DecodeEnvelope(published[0].payload, error);
  auto status = matchfeed::DecodeEnvelope(published[1].payload, error);
  ASSERT_TRUE(score.has_value());
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(score->type, matchfeed::EventType::kScoreUpdate);
  EXPECT_EQ(score->data["home_team_score"], 2);
  EXPECT_EQ(score->data["away_team_score"], 1);
  EXPECT_EQ(status->type, matchfeed::EventType::kMatchStatus);
  EXPECT_EQ(status->data["status"], "finished");

  auto entries = broker_->StreamEntries("match:42:stream");
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(FieldValue(entries[0].fields, "event_type"), "score_update");
  EXPECT_EQ(FieldValue(entries[1].fields, "event_type"), "match_status");
}

TEST_F(EventPublisherTest, AppendFailureSkipsPublish) {
  broker_->SetFailureInjector([](Operation op, const std::string&) { return op == Operation::kAppend; });

  try {
    publisher_->PublishMatchEvent(42, Goal(10));
    FAIL() << "PublishError expected";
  } catch (const matchfeed::PublishError& ex) {
    EXPECT_EQ(ex.stage, matchfeed::PublishError::Stage::kAppend);
  }
  EXPECT_TRUE(broker_->PublishedMessages().empty());
  EXPECT_TRUE(broker_->StreamEntries("match:42:stream").empty());
  auto snapshot = observability_->Snapshot();
  EXPECT_EQ(snapshot.publish_failures, 1u);
  EXPECT_EQ(snapshot.published, 0u);
}

TEST_F(EventPublisherTest, PublishFailureKeepsDurableRecord) {
  broker_->SetFailureInjector([](Operation op, const std::string&) { return op == Operation::kPublish; });

  try {
    publisher_->PublishScoreUpdate(42, matchfeed::ScoreUpdateData{1, 0});
    FAIL() << "PublishError expected";
  } catch (const matchfeed::PublishError& ex) {
    EXPECT_EQ(ex.stage, matchfeed::PublishError::Stage::kPublish);
  }
  EXPECT_EQ(broker_->StreamEntries("match:42:stream").size(), 1u);
  EXPECT_EQ(observability_->Snapshot().publish_failures, 1u);
}

TEST_F(EventPublisherTest, RejectsNonPositiveMatchId) {
  EXPECT_THROW(publisher_->PublishMatchEvent(0, Goal(1)), std::invalid_argument);
  EXPECT_THROW(publisher_->PublishScoreUpdate(-3, matchfeed::ScoreUpdateData{}), std::invalid_argument);
  EXPECT_TRUE(broker_->StreamEntries("match:0:stream").empty());
  EXPECT_TRUE(broker_->PublishedMessages().empty());
}

TEST_F(EventPublisherTest, TimestampNeverMovesBackwards) {
  const auto base = std::chrono::system_clock::time_point(std::chrono::seconds(1714557600));
  std::vector<matchfeed::Timestamp> readings{base + std::chrono::seconds(10), base + std::chrono::seconds(5),
                                             base + std::chrono::seconds(20)};
  std::size_t next = 0;
  matchfeed::EventPublisher publisher(broker_, broker_, broker_, observability_,
                                      [&]() { return readings[next++]; });

  auto first = publisher.PublishMatchEvent(42, Goal(1));
  auto second = publisher.PublishMatchEvent(42, Goal(2));
  auto third = publisher.PublishMatchEvent(42, Goal(3));

  EXPECT_EQ(first.timestamp, base + std::chrono::seconds(10));
  EXPECT_EQ(second.timestamp, base + std::chrono::seconds(10));
  EXPECT_EQ(third.timestamp, base + std::chrono::seconds(20));
  EXPECT_EQ(first.data["timestamp"], matchfeed::FormatTimestamp(first.timestamp));
}

TEST_F(EventPublisherTest, CacheInvalidationToleratesPartialFailure) {
  for (const auto& key : matchfeed::EventPublisher::CacheKeys(42)) {
    broker_->SetCacheValue(key, "cached");
  }
  broker_->SetFailureInjector(
      [](Operation op, const std::string& key) { return op == Operation::kDelete && key == "match:42:events"; });

  auto outcomes = publisher_->InvalidateMatchCache(42);

  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_EQ(outcomes[0].key, "match:42");
  EXPECT_TRUE(outcomes[0].ok);
  EXPECT_EQ(outcomes[1].key, "match:42:events");
  EXPECT_FALSE(outcomes[1].ok);
  EXPECT_FALSE(outcomes[1].error.empty());
  EXPECT_EQ(outcomes[2].key, "match:42:stats");
  EXPECT_TRUE(outcomes[2].ok);
  EXPECT_FALSE(broker_->HasCacheKey("match:42"));
  EXPECT_TRUE(broker_->HasCacheKey("match:42:events"));
  EXPECT_FALSE(broker_->HasCacheKey("match:42:stats"));
}

TEST_F(EventPublisherTest, UnencodableEventIsRejectedBeforeAppend) {
  auto event = Goal(12);
  event.description = "\xff\xfe";

  try {
    publisher_->PublishMatchEvent(42, event);
    FAIL() << "PublishError expected";
  } catch (const matchfeed::PublishError& ex) {
    EXPECT_EQ(ex.stage, matchfeed::PublishError::Stage::kEncode);
  }
  EXPECT_TRUE(broker_->StreamEntries("match:42:stream").empty());
  EXPECT_TRUE(broker_->PublishedMessages().empty());
}
