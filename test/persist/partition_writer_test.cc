#include <gtest/gtest.h>
#include "../../src/persist/partition_writer.h"
#include "../../src/common/errors.h"
#include "../../src/event/page_view_event.h"
#include "../test_util.h"

#include <sys/stat.h>

#include <filesystem>
#include <nlohmann/json.hpp>

using namespace Pagestream;
using namespace Pagestream::testing_util;
using json = nlohmann::json;

namespace {

QueueEntry MakeEntry(uint64_t seq, const std::string& timestamp,
                     const std::string& payload = "{\"page_url\":\"https://example.com/a\"}") {
    QueueEntry entry;
    entry.id = EntryId{1705327500000, seq};
    entry.enqueued_at = entry.id.Timestamp();
    entry.fields[kFieldEventId] = "8f14e45f-ceea-467a-9575-6b2b3c4d5e6" + std::to_string(seq % 10);
    entry.fields[kFieldUserId] = "user_" + std::to_string(seq);
    entry.fields[kFieldTimestamp] = timestamp;
    entry.fields[kFieldEventType] = "page_view";
    entry.fields[kFieldPayload] = payload;
    entry.fields[kFieldEnqueuedAt] = "2024-01-15T14:05:00Z";
    return entry;
}

} // namespace

class PartitionWriterTest : public ::testing::Test {
protected:
    PartitionWriterTest()
        : clock_(Utc("2024-01-15T16:00:00Z")),
          writer_(dir_.Sub("events"), clock_.AsClock()) {}

    std::string PartitionFile(const std::string& relative) const {
        return dir_.Sub("events/" + relative);
    }

    TempDir dir_;
    FakeClock clock_;
    PartitionWriter writer_;
};

TEST_F(PartitionWriterTest, GroupsByEventHour) {
    std::vector<QueueEntry> batch = {
        MakeEntry(0, "2024-01-15T14:05:00Z"),
        MakeEntry(1, "2024-01-15T14:05:30Z"),
        MakeEntry(2, "2024-01-15T15:00:01Z"),
        MakeEntry(3, "2024-01-15T14:59:59Z"),
    };
    BatchWriteResult result = writer_.WriteBatch(batch);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.groups_written, 2u);
    EXPECT_EQ(result.records_written, 4u);

    auto hour14 = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-14.jsonl"));
    ASSERT_EQ(hour14.size(), 3u);
    EXPECT_EQ(json::parse(hour14[0])["queue_entry_id"], "1705327500000-0");
    EXPECT_EQ(json::parse(hour14[1])["queue_entry_id"], "1705327500000-1");
    EXPECT_EQ(json::parse(hour14[2])["queue_entry_id"], "1705327500000-3");

    auto hour15 = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-15.jsonl"));
    ASSERT_EQ(hour15.size(), 1u);
    EXPECT_EQ(json::parse(hour15[0])["timestamp"], "2024-01-15T15:00:01Z");
}

TEST_F(PartitionWriterTest, RecordLayout) {
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(7, "2024-01-15T14:05:30Z")}).ok());
    auto lines = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-14.jsonl"));
    ASSERT_EQ(lines.size(), 1u);

    auto record = nlohmann::ordered_json::parse(lines[0]);
    std::vector<std::string> keys;
    for (auto it = record.begin(); it != record.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"queue_entry_id", "processed_at", "event_id", "user_id",
                                               "timestamp", "event_type", "enqueued_at", "payload"}));
    EXPECT_EQ(record["processed_at"], "2024-01-15T16:00:00Z");
    EXPECT_EQ(record["user_id"], "user_7");
    EXPECT_EQ(record["payload"]["page_url"], "https://example.com/a");
}

TEST_F(PartitionWriterTest, MalformedPayloadIsStoredAsNull) {
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(0, "2024-01-15T14:05:30Z", "{not json"),
                                    MakeEntry(1, "2024-01-15T14:05:31Z", "")}).ok());
    auto lines = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-14.jsonl"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(json::parse(lines[0])["payload"].is_null());
    EXPECT_TRUE(json::parse(lines[1])["payload"].is_null());
}

TEST_F(PartitionWriterTest, UnparseableTimestampFallsBackToEnqueueTime) {
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(0, "garbage")}).ok());
    auto lines = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-14.jsonl"));
    ASSERT_EQ(lines.size(), 1u);
    auto record = json::parse(lines[0]);
    EXPECT_EQ(record["timestamp"], "garbage");
    EXPECT_EQ(record["timestamp_parse_error"], true);
}

TEST_F(PartitionWriterTest, UnparseableEnqueueTimeFallsBackToProcessingTime) {
    QueueEntry entry = MakeEntry(0, "garbage");
    entry.fields[kFieldEnqueuedAt] = "also garbage";
    ASSERT_TRUE(writer_.WriteBatch({entry}).ok());
    auto lines = ReadLines(PartitionFile("2024/01/15/events_2024-01-15-16.jsonl"));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(json::parse(lines[0])["timestamp_parse_error"], true);
}

TEST_F(PartitionWriterTest, AppendsAcrossBatches) {
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(0, "2024-01-15T14:05:00Z")}).ok());
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(1, "2024-01-15T14:06:00Z")}).ok());
    EXPECT_EQ(ReadLines(PartitionFile("2024/01/15/events_2024-01-15-14.jsonl")).size(), 2u);
}

TEST_F(PartitionWriterTest, FailedGroupDoesNotBlockOthers) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    // A read-only day directory makes the 14:00 group fail.
    std::filesystem::create_directories(PartitionFile("2024/01/15"));
    ASSERT_EQ(::chmod(PartitionFile("2024/01/15").c_str(), 0555), 0);

    BatchWriteResult result = writer_.WriteBatch({MakeEntry(0, "2024-01-15T14:05:00Z"),
                                                  MakeEntry(1, "2024-01-16T09:00:00Z")});
    ::chmod(PartitionFile("2024/01/15").c_str(), 0755);

    EXPECT_EQ(result.status, BatchWriteStatus::kPartialFailure);
    EXPECT_EQ(result.groups_failed, 1u);
    EXPECT_EQ(result.groups_written, 1u);
    EXPECT_EQ(ReadLines(PartitionFile("2024/01/16/events_2024-01-16-09.jsonl")).size(), 1u);
}

TEST_F(PartitionWriterTest, FileInPlaceOfDirectoryFailsGroup) {
    // Works for root too: a regular file where the month directory belongs.
    std::filesystem::create_directories(PartitionFile("2024"));
    { std::ofstream(PartitionFile("2024/01")) << "x"; }

    BatchWriteResult result = writer_.WriteBatch({MakeEntry(0, "2024-01-15T14:05:00Z"),
                                                  MakeEntry(1, "2023-12-31T23:59:59Z")});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.groups_failed, 1u);
    EXPECT_EQ(ReadLines(PartitionFile("2023/12/31/events_2023-12-31-23.jsonl")).size(), 1u);
}

TEST_F(PartitionWriterTest, EnsureRootCreatesDirectory) {
    writer_.EnsureRoot();
    EXPECT_TRUE(std::filesystem::is_directory(dir_.Sub("events")));
}

TEST_F(PartitionWriterTest, EnsureRootFailsOnFile) {
    { std::ofstream(dir_.Sub("blocker")) << "x"; }
    PartitionWriter writer(dir_.Sub("blocker/events"));
    EXPECT_THROW(writer.EnsureRoot(), FatalConfigError);
}

TEST(PartitionPathTest, RelativePath) {
    EXPECT_EQ(PartitionWriter::RelativePartitionPath(absl::CivilHour(2024, 1, 15, 14)),
              "2024/01/15/events_2024-01-15-14.jsonl");
}

TEST(PartitionPathTest, YearIsPaddedToFourDigits) {
    EXPECT_EQ(PartitionWriter::PartitionName(absl::CivilHour(999, 1, 15, 14)), "0999-01-15-14");
    EXPECT_EQ(PartitionWriter::RelativePartitionPath(absl::CivilHour(999, 1, 15, 14)),
              "0999/01/15/events_0999-01-15-14.jsonl");
    EXPECT_EQ(PartitionWriter::RelativePartitionPath(absl::CivilHour(10000, 1, 15, 14)),
              "10000/01/15/events_10000-01-15-14.jsonl");
}

TEST_F(PartitionWriterTest, ShortYearKeepsDirectoryLayout) {
    ASSERT_TRUE(writer_.WriteBatch({MakeEntry(0, "0999-01-15T14:05:00Z")}).ok());
    auto lines = ReadLines(PartitionFile("0999/01/15/events_0999-01-15-14.jsonl"));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(json::parse(lines[0])["timestamp"], "0999-01-15T14:05:00Z");
}

// Event -> queue fields -> on-disk record keeps the event's identity.
TEST(EventRecordTest, QueueFieldsRoundTripIntoRecord) {
    RawPageView raw;
    raw.event_id = "8F14E45F-CEEA-467A-9575-6B2B3C4D5E6F";
    raw.user_id = "user_42";
    raw.timestamp = "2024-01-15T14:05:30.250Z";
    raw.event_type = "page_view";
    raw.page_url = "https://example.com/products/1?ref=home";

    std::vector<std::string> errors;
    auto with_payload = BuildPageViewEvent(raw, &errors);
    raw.page_url.reset();
    auto without_payload = BuildPageViewEvent(raw, &errors);
    ASSERT_TRUE(with_payload.has_value() && without_payload.has_value()) << ::testing::PrintToString(errors);

    const absl::Time enqueued_at = Utc("2024-01-15T14:05:31Z");
    const absl::Time processed_at = Utc("2024-01-15T14:06:00Z");
    for (const PageViewEvent& event : {*with_payload, *without_payload}) {
        QueueEntry entry;
        entry.id = EntryId{1705327531000, 0};
        entry.enqueued_at = enqueued_at;
        entry.fields = EncodeQueueFields(event, enqueued_at);

        PartitionWriter::Record record = PartitionWriter::BuildRecord(entry, processed_at);
        EXPECT_EQ(record.hour, absl::CivilHour(2024, 1, 15, 14));
        EXPECT_EQ(record.json["event_id"], event.event_id);
        EXPECT_EQ(record.json["user_id"], event.user_id);
        EXPECT_FALSE(record.json.contains("timestamp_parse_error"));

        auto stored = ParseTimestamp(record.json["timestamp"].get<std::string>());
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(absl::ToUnixSeconds(*stored), absl::ToUnixSeconds(event.timestamp));

        if (event.payload.has_value()) {
            EXPECT_EQ(record.json["payload"]["page_url"], event.payload->page_url);
        } else {
            EXPECT_TRUE(record.json["payload"].is_null());
        }
    }
}
