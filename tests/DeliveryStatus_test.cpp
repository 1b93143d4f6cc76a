#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "mailjmap/delivery_status.hpp"

using json = nlohmann::json;

TEST(DeliveryStatusTest, FormatsSmtpReplyOnOneLine) {
    EXPECT_EQ(DeliveryStatus::formatSmtpReply(250, "2.0.0", "Accepted"), "250 2.0.0 Accepted");
    EXPECT_EQ(DeliveryStatus::formatSmtpReply(550, "", "Rejected"), "550 Rejected");
    EXPECT_EQ(DeliveryStatus::formatSmtpReply(451, "4.4.0", "line one\r\nline two"), "451 4.4.0 line one  line two");
}

TEST(DeliveryStatusTest, InitialMapIsQueuedPerRecipient) {
    json map = DeliveryStatus::initialMap({"a@x", " b@y ", ""});
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map["a@x"]["delivered"], "queued");
    EXPECT_EQ(map["a@x"]["smtpReply"], nullptr);
    EXPECT_EQ(map["b@y"]["displayed"], "unknown");

    EXPECT_TRUE(DeliveryStatus::initialMap({}).count("unknown"));
}

TEST(DeliveryStatusTest, KeepsCanonicalMaps) {
    json stored = {
        {"a@x", {{"smtpReply", "250 2.0.0 OK"}, {"delivered", "yes"}, {"displayed", "unknown"}}},
    };
    EXPECT_EQ(DeliveryStatus::normalize(stored, {"a@x"}), stored);
    EXPECT_EQ(DeliveryStatus::normalize(json::object(), {"a@x"})["a@x"]["delivered"], "queued");
}

TEST(DeliveryStatusTest, ConvertsLegacySingleRecord) {
    json legacy = {{"status", "accepted"}, {"lastAttempt", 1700000000}, {"retryCount", 1}, {"providerMessageId", "ses-1"}};
    json map = DeliveryStatus::normalize(legacy, {"a@x", "b@y"});
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map["a@x"]["smtpReply"], "250 2.0.0 Accepted");
    EXPECT_EQ(map["b@y"]["delivered"], "queued");
    EXPECT_EQ(map["b@y"]["providerMessageId"], "ses-1");

    legacy = {{"status", "failed"}, {"lastAttempt", 1700000000}, {"retryCount", 6}, {"permanent", true}, {"reason", "Mailbox full"}};
    map = DeliveryStatus::normalize(legacy, {"a@x"});
    EXPECT_EQ(map["a@x"]["smtpReply"], "550 5.4.1 Mailbox full");
    EXPECT_EQ(map["a@x"]["delivered"], "no");

    legacy = {{"status", "failed"}, {"lastAttempt", 1700000000}, {"retryCount", 2}};
    map = DeliveryStatus::normalize(legacy, {"a@x"});
    EXPECT_EQ(map["a@x"]["smtpReply"], "451 4.4.0 Temporary delivery issue");

    legacy = {{"status", "rejected"}, {"lastAttempt", 1700000000}, {"retryCount", 1}};
    EXPECT_EQ(DeliveryStatus::normalize(legacy, {})["unknown"]["delivered"], "no");
}

TEST(DeliveryStatusTest, ConvertsLegacyPerRecipientMaps) {
    json legacy = {
        {"a@x", {{"status", "pending"}, {"lastAttempt", 0}, {"retryCount", 0}}},
        {"b@y", {{"status", "rejected"}, {"lastAttempt", 1}, {"retryCount", 1}, {"reason", "Blocked"}}},
    };
    json map = DeliveryStatus::normalize(legacy, {"a@x", "b@y"});
    EXPECT_EQ(map["a@x"]["delivered"], "queued");
    EXPECT_EQ(map["b@y"]["smtpReply"], "550 5.7.1 Blocked");
}

TEST(DeliveryStatusTest, AppliesToRecipientsCaseInsensitively) {
    json current = DeliveryStatus::initialMap({"Bob@Example.com", "carol@example.com"});
    DeliveryStatusRecord bounced = DeliveryStatusRecord::Make(550, "5.1.1", "No such user", DELIVERED_NO);

    json map = DeliveryStatus::applyToRecipients(current, {"bob@example.com"}, bounced);
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map["Bob@Example.com"]["delivered"], "no");
    EXPECT_EQ(map["carol@example.com"]["delivered"], "queued");

    DeliveryStatusRecord delivered = DeliveryStatusRecord::Make(250, "2.0.0", "OK", DELIVERED_YES);
    map = DeliveryStatus::applyToRecipients(map, {}, delivered);
    EXPECT_EQ(map["Bob@Example.com"]["delivered"], "yes");
    EXPECT_EQ(map["carol@example.com"]["delivered"], "yes");

    map = DeliveryStatus::applyToRecipients(map, {"new@example.com"}, bounced);
    EXPECT_EQ(map.size(), 3u);
}

TEST(DeliveryStatusTest, RecordRoundTripKeepsProviderIds) {
    DeliveryStatusRecord record = DeliveryStatusRecord::Make(250, "2.0.0", "Accepted", DELIVERED_QUEUED, "msg-1", "req-1");
    json value = record.toJSON();
    EXPECT_TRUE(DeliveryStatusRecord::IsRecord(value));
    DeliveryStatusRecord parsed = DeliveryStatusRecord::FromJSON(value);
    EXPECT_EQ(parsed.providerMessageId, "msg-1");
    EXPECT_EQ(parsed.providerRequestId, "req-1");
    EXPECT_FALSE(DeliveryStatusRecord::IsRecord({{"delivered", "maybe"}, {"smtpReply", nullptr}}));
}
