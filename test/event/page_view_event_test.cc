#include <gtest/gtest.h>
#include "../../src/event/page_view_event.h"
#include "../test_util.h"

#include <nlohmann/json.hpp>

using namespace Pagestream;
using namespace Pagestream::testing_util;

namespace {

RawPageView ValidRaw() {
    RawPageView raw;
    raw.event_id = "8F14E45F-CEEA-467A-9575-6B2B3C4D5E6F";
    raw.user_id = "  user_42  ";
    raw.timestamp = "2024-01-15T14:05:30Z";
    raw.event_type = "page_view";
    raw.page_url = " https://example.com/products/1?ref=home ";
    return raw;
}

} // namespace

class PageViewEventTest : public ::testing::Test {
protected:
    std::vector<std::string> errors_;
};

TEST_F(PageViewEventTest, BuildsNormalizedEvent) {
    auto event = BuildPageViewEvent(ValidRaw(), &errors_);
    ASSERT_TRUE(event.has_value()) << ::testing::PrintToString(errors_);
    EXPECT_EQ(event->event_id, "8f14e45f-ceea-467a-9575-6b2b3c4d5e6f");
    EXPECT_EQ(event->user_id, "user_42");
    EXPECT_EQ(event->timestamp, Utc("2024-01-15T14:05:30Z"));
    ASSERT_TRUE(event->payload.has_value());
    EXPECT_EQ(event->payload->page_url, "https://example.com/products/1?ref=home");
}

TEST_F(PageViewEventTest, PayloadIsOptional) {
    RawPageView raw = ValidRaw();
    raw.page_url.reset();
    auto event = BuildPageViewEvent(raw, &errors_);
    ASSERT_TRUE(event.has_value());
    EXPECT_FALSE(event->payload.has_value());
}

TEST_F(PageViewEventTest, TimestampWithoutOffsetIsUtc) {
    RawPageView raw = ValidRaw();
    raw.timestamp = "2024-01-15T14:05:30";
    auto event = BuildPageViewEvent(raw, &errors_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->timestamp, Utc("2024-01-15T14:05:30Z"));
}

TEST_F(PageViewEventTest, OffsetTimestampIsConvertedToUtc) {
    RawPageView raw = ValidRaw();
    raw.timestamp = "2024-01-15T16:05:30+02:00";
    auto event = BuildPageViewEvent(raw, &errors_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(MinuteBucketKey(*event), "page_view_2024-01-15_14:05");
}

TEST_F(PageViewEventTest, CollectsEveryViolation) {
    RawPageView raw;
    raw.event_id = "not-a-uuid";
    raw.user_id = "   ";
    raw.timestamp = "yesterday";
    raw.event_type = "click";
    raw.page_url = "ftp://example.com";
    EXPECT_FALSE(BuildPageViewEvent(raw, &errors_).has_value());
    EXPECT_EQ(errors_.size(), 5u);
}

TEST_F(PageViewEventTest, RejectsBadUserIds) {
    RawPageView raw = ValidRaw();
    raw.user_id = "user 42";
    EXPECT_FALSE(BuildPageViewEvent(raw, &errors_).has_value());

    raw.user_id = std::string(256, 'a');
    EXPECT_FALSE(BuildPageViewEvent(raw, &errors_).has_value());

    raw.user_id = std::string(255, 'a');
    errors_.clear();
    EXPECT_TRUE(BuildPageViewEvent(raw, &errors_).has_value());
}

TEST_F(PageViewEventTest, UrlValidation) {
    EXPECT_TRUE(IsValidPageUrl("http://localhost:8000/page"));
    EXPECT_TRUE(IsValidPageUrl("https://10.0.0.1/a/b"));
    EXPECT_TRUE(IsValidPageUrl("HTTPS://Sub.Example.org"));
    EXPECT_FALSE(IsValidPageUrl("example.com/page"));
    EXPECT_FALSE(IsValidPageUrl("http://nodots/page"));
    EXPECT_FALSE(IsValidPageUrl("http://example.com/has space"));
    EXPECT_FALSE(IsValidPageUrl("http://example.com:/x"));
}

TEST_F(PageViewEventTest, RejectsOverlongUrl) {
    RawPageView raw = ValidRaw();
    raw.page_url = "https://example.com/" + std::string(2048, 'a');
    EXPECT_FALSE(BuildPageViewEvent(raw, &errors_).has_value());
}

TEST_F(PageViewEventTest, RejectsYearsOutsideFourDigits) {
    RawPageView raw = ValidRaw();
    raw.timestamp = "10000-01-15T14:05:00Z";
    EXPECT_FALSE(BuildPageViewEvent(raw, &errors_).has_value());
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0], "timestamp year must be between 1 and 9999");

    errors_.clear();
    raw.timestamp = "0999-01-15T14:05:00Z";
    auto event = BuildPageViewEvent(raw, &errors_);
    ASSERT_TRUE(event.has_value()) << ::testing::PrintToString(errors_);
    EXPECT_EQ(MinuteBucketKey(*event), "page_view_0999-01-15_14:05");
    EXPECT_EQ(EncodeQueueFields(*event, event->timestamp).at(kFieldTimestamp), "0999-01-15T14:05:00Z");
}

TEST_F(PageViewEventTest, BucketKeys) {
    absl::Time t = Utc("2024-01-15T14:05:59.999Z");
    EXPECT_EQ(MinuteBucketKey("page_view", t), "page_view_2024-01-15_14:05");
    EXPECT_EQ(UserSetKey("page_view_2024-01-15_14:05"), "page_view_2024-01-15_14:05:users");
}

TEST_F(PageViewEventTest, QueueFieldsCarryPayloadAsJsonString) {
    auto event = BuildPageViewEvent(ValidRaw(), &errors_);
    ASSERT_TRUE(event.has_value());
    QueueFields fields = EncodeQueueFields(*event, Utc("2024-01-15T14:05:31Z"));

    EXPECT_EQ(fields.at(kFieldEventId), event->event_id);
    EXPECT_EQ(fields.at(kFieldTimestamp), "2024-01-15T14:05:30Z");
    EXPECT_EQ(fields.at(kFieldEnqueuedAt), "2024-01-15T14:05:31Z");
    auto payload = nlohmann::json::parse(fields.at(kFieldPayload));
    EXPECT_EQ(payload["page_url"], "https://example.com/products/1?ref=home");

    event->payload.reset();
    EXPECT_EQ(EncodeQueueFields(*event, Utc("2024-01-15T14:05:31Z")).at(kFieldPayload), "");
}
