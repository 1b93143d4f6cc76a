#include "MailJMAPTestFixture.hpp"

#include <openssl/evp.h>
#include <openssl/rsa.h>

#include "mailjmap/mail_utils.hpp"
#include "mailjmap/ses_webhook.hpp"
#include "mailjmap/sns_verifier.hpp"
#include "mailjmap/models/email_submission.hpp"

#define TEST_CERT_URL "https://sns.us-east-1.amazonaws.com/SimpleNotificationService-test.pem"
#define TEST_TOPIC_ARN "arn:aws:sns:us-east-1:123456789012:ses-events"

class RecordingWebhook : public SesWebhook {
public:
    using SesWebhook::SesWebhook;
    std::vector<std::string> confirmed;

protected:
    void confirmSubscription(std::string subscribeURL) override {
        confirmed.push_back(subscribeURL);
    }
};

class SesWebhookTest : public MailJMAPTest {
protected:
    SnsCertificateCache * certificates;
    RecordingWebhook * webhook;
    std::shared_ptr<EVP_PKEY> signingKey;
    std::string submissionId;

    void SetUp() override {
        MailJMAPTest::SetUp();
        config.sesWebhookToken = "hook-token";
        config.sesTopicArn = TEST_TOPIC_ARN;

        EVP_PKEY_CTX * ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
        EVP_PKEY * key = nullptr;
        ASSERT_EQ(EVP_PKEY_keygen_init(ctx), 1);
        ASSERT_EQ(EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048), 1);
        ASSERT_EQ(EVP_PKEY_keygen(ctx, &key), 1);
        EVP_PKEY_CTX_free(ctx);
        signingKey = std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);

        certificates = new SnsCertificateCache();
        certificates->insert(TEST_CERT_URL, signingKey);
        webhook = new RecordingWebhook(store, changes, &config, certificates);

        std::string sent = createMailbox("Sent", "sent");
        json email = importEmail(rawMessage("Outgoing", "out@x"), sent);
        json envelope = {
            {"mailFrom", {{"email", "alice@example.com"}}},
            {"rcptTo", json::array({{{"email", "bob@example.com"}}, {{"email", "carol@example.com"}}})},
        };
        EmailSubmission submission{"sub-1", TEST_ACCOUNT_ID, email["id"].get<std::string>(), email["threadId"].get<std::string>(), "identity-1", envelope, time(0)};
        submission.setStatus(SUBMISSION_STATUS_SENT);
        submission.setUndoStatus(UNDO_STATUS_FINAL);
        store->save(&submission);
        submissionId = submission.id();
    }

    void TearDown() override {
        delete webhook;
        delete certificates;
        MailJMAPTest::TearDown();
    }

    std::string sign(const std::string & canonical) {
        EVP_MD_CTX * ctx = EVP_MD_CTX_new();
        size_t length = 0;
        EXPECT_EQ(EVP_DigestSignInit(ctx, nullptr, EVP_sha1(), nullptr, signingKey.get()), 1);
        EXPECT_EQ(EVP_DigestSignUpdate(ctx, canonical.data(), canonical.size()), 1);
        EXPECT_EQ(EVP_DigestSignFinal(ctx, nullptr, &length), 1);
        std::string signature(length, '\0');
        EXPECT_EQ(EVP_DigestSignFinal(ctx, (unsigned char *)&signature[0], &length), 1);
        EVP_MD_CTX_free(ctx);
        signature.resize(length);
        return MailUtils::toBase64(signature.data(), signature.size());
    }

    json notification(json message, std::string topicArn = TEST_TOPIC_ARN) {
        json sns = {
            {"Type", "Notification"},
            {"MessageId", "6a1f0c8e-1111-2222-3333-444455556666"},
            {"TopicArn", topicArn},
            {"Message", message.dump()},
            {"Timestamp", "2024-03-01T12:00:00.000Z"},
            {"SignatureVersion", "1"},
            {"SigningCertURL", TEST_CERT_URL},
        };
        sns["Signature"] = sign(SnsVerifier::canonicalString(sns));
        return sns;
    }

    json sesEvent(std::string eventType, json detail = json::object()) {
        json message = {
            {"eventType", eventType},
            {"mail", {
                {"messageId", "ses-msg-1"},
                {"tags", {{"submissionId", json::array({submissionId})}}},
            }},
        };
        for (auto it = detail.begin(); it != detail.end(); ++it) {
            message[it.key()] = it.value();
        }
        return message;
    }

    json subscriptionConfirmation(std::string topicArn) {
        json sns = {
            {"Type", "SubscriptionConfirmation"},
            {"MessageId", "confirm-1"},
            {"Token", "abc"},
            {"TopicArn", topicArn},
            {"Message", "You have chosen to subscribe"},
            {"SubscribeURL", "https://sns.us-east-1.amazonaws.com/?Action=ConfirmSubscription&Token=abc"},
            {"Timestamp", "2024-03-01T12:00:00.000Z"},
            {"SignatureVersion", "1"},
            {"SigningCertURL", TEST_CERT_URL},
        };
        sns["Signature"] = sign(SnsVerifier::canonicalString(sns));
        return sns;
    }

    std::shared_ptr<EmailSubmission> reload() {
        return store->find<EmailSubmission>(Query().equal("id", submissionId));
    }
};

TEST_F(SesWebhookTest, ChecksToken) {
    EXPECT_EQ(webhook->handle("wrong", "[]").status, 401);
    EXPECT_EQ(webhook->handle("hook-token", "{not json").status, 400);

    EndpointResponse ok = webhook->handle("hook-token", "[]");
    EXPECT_EQ(ok.status, 200);
    EXPECT_EQ(ok.body["processed"], 0);

    config.sesWebhookToken = "";
    EXPECT_EQ(webhook->handle("hook-token", "[]").status, 500);
}

TEST_F(SesWebhookTest, NormalizesPayloadShapes) {
    json sns = {{"Type", "Notification"}, {"Message", "{}"}};
    EXPECT_EQ(SesWebhook::normalizeEvents(sns).size(), 1u);
    EXPECT_EQ(SesWebhook::normalizeEvents(json::array({{{"Sns", sns}}, {{"Sns", sns}}})).size(), 2u);
    EXPECT_EQ(SesWebhook::normalizeEvents({{"Records", json::array({{{"Sns", sns}}})}}).size(), 1u);
    EXPECT_EQ(SesWebhook::normalizeEvents({{"Records", "nope"}}).size(), 0u);
}

TEST_F(SesWebhookTest, MapsEventTypes) {
    SesEventOutcome outcome;

    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Delivery", {{"delivery", {{"recipients", json::array({"bob@example.com"})}}}}), outcome));
    EXPECT_EQ(outcome.submissionId, submissionId);
    EXPECT_EQ(outcome.queueStatus, SUBMISSION_STATUS_SENT);
    EXPECT_EQ(outcome.record.delivered, DELIVERED_YES);
    EXPECT_EQ(outcome.record.smtpReply, "250 2.0.0 Delivered");
    EXPECT_EQ(outcome.record.providerMessageId, "ses-msg-1");
    EXPECT_EQ(outcome.recipients, std::vector<std::string>({"bob@example.com"}));

    json bounce = {{"bounce", {{"bouncedRecipients", json::array({{{"emailAddress", "carol@example.com"}, {"diagnosticCode", "smtp; 550 user unknown"}}})}}}};
    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Bounce", bounce), outcome));
    EXPECT_EQ(outcome.queueStatus, SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(outcome.record.smtpReply, "550 5.1.1 smtp; 550 user unknown");
    EXPECT_EQ(outcome.recipients, std::vector<std::string>({"carol@example.com"}));

    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Reject", {{"reject", {{"reason", "Bad content"}}}}), outcome));
    EXPECT_EQ(outcome.record.smtpReply, "550 5.7.1 Bad content");
    EXPECT_TRUE(outcome.recipients.empty());

    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Complaint", {{"complaint", {{"complainedRecipients", json::array({{{"emailAddress", "bob@example.com"}}})}}}}), outcome));
    EXPECT_EQ(outcome.record.smtpReply, "550 5.7.1 Complaint");

    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Rendering Failure"), outcome));
    EXPECT_EQ(outcome.record.smtpReply, "554 5.3.0 Failure");

    EXPECT_FALSE(SesWebhook::mapNotification(sesEvent("Open"), outcome));
    EXPECT_FALSE(SesWebhook::mapNotification({{"eventType", "Delivery"}, {"mail", json::object()}}, outcome));
}

TEST_F(SesWebhookTest, AppliesSignedBounceToRecipient) {
    json bounce = {{"bounce", {{"bouncedRecipients", json::array({{{"emailAddress", "Carol@Example.com"}}})}}}};
    EndpointResponse response = webhook->handle("hook-token", notification(sesEvent("Bounce", bounce)).dump());
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["processed"], 1);

    auto submission = reload();
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(submission->undoStatus(), UNDO_STATUS_FINAL);
    json status = submission->deliveryStatus();
    EXPECT_EQ(status["carol@example.com"]["delivered"], DELIVERED_NO);
    EXPECT_EQ(status["bob@example.com"]["delivered"], DELIVERED_QUEUED);

    ChangesResult changed = changes->getChanges(TEST_ACCOUNT_ID, TYPE_EMAIL_SUBMISSION, "0", 0);
    EXPECT_EQ(changed.updated, std::vector<std::string>({submissionId}));
}

TEST_F(SesWebhookTest, DropsBadSignaturesAndForeignTopics) {
    json sns = notification(sesEvent("Delivery"));
    sns["Message"] = sesEvent("Bounce").dump();
    EXPECT_EQ(webhook->handle("hook-token", sns.dump()).body["processed"], 0);

    json foreign = notification(sesEvent("Delivery"), "arn:aws:sns:us-east-1:999999999999:other");
    EXPECT_EQ(webhook->handle("hook-token", foreign.dump()).body["processed"], 0);

    json untrusted = notification(sesEvent("Delivery"));
    untrusted["SigningCertURL"] = "https://evil.example.com/cert.pem";
    EXPECT_EQ(webhook->handle("hook-token", untrusted.dump()).body["processed"], 0);

    EXPECT_EQ(reload()->status(), SUBMISSION_STATUS_SENT);
    EXPECT_EQ(reload()->deliveryStatus(), json::object());
}

TEST_F(SesWebhookTest, AcceptsLambdaStyleRecords) {
    json sns = notification(sesEvent("Delivery"));
    sns.erase("SigningCertURL");
    sns["SigningCertUrl"] = TEST_CERT_URL;
    json payload = {{"Records", json::array({{{"Sns", sns}}})}};
    EXPECT_EQ(webhook->handle("hook-token", payload.dump()).body["processed"], 1);
    EXPECT_EQ(reload()->deliveryStatus()["bob@example.com"]["delivered"], DELIVERED_YES);
}

TEST_F(SesWebhookTest, IgnoresCanceledSubmissions) {
    auto submission = reload();
    submission->setStatus(SUBMISSION_STATUS_CANCELED);
    store->save(submission.get());

    SesEventOutcome outcome;
    ASSERT_TRUE(SesWebhook::mapNotification(sesEvent("Delivery"), outcome));
    EXPECT_FALSE(webhook->applyOutcome(outcome));
    EXPECT_EQ(reload()->status(), SUBMISSION_STATUS_CANCELED);
}

TEST_F(SesWebhookTest, ConfirmsSignedSubscriptions) {
    json sns = subscriptionConfirmation(TEST_TOPIC_ARN);

    EndpointResponse response = webhook->handle("hook-token", sns.dump());
    EXPECT_EQ(response.body["processed"], 0);
    EXPECT_EQ(webhook->confirmed, std::vector<std::string>({sns["SubscribeURL"].get<std::string>()}));
}

TEST_F(SesWebhookTest, IgnoresSubscriptionsToOtherTopics) {
    json foreign = subscriptionConfirmation("arn:aws:sns:us-east-1:999999999999:other");
    EXPECT_EQ(webhook->handle("hook-token", foreign.dump()).body["processed"], 0);

    EXPECT_TRUE(webhook->confirmed.empty());
}

TEST(SnsVerifierTest, BuildsCanonicalString) {
    json sns = {
        {"Type", "Notification"},
        {"MessageId", "id-1"},
        {"TopicArn", "arn:topic"},
        {"Message", "hello"},
        {"Timestamp", "2024-01-01T00:00:00Z"},
    };
    EXPECT_EQ(SnsVerifier::canonicalString(sns), "Message\nhello\nMessageId\nid-1\nTimestamp\n2024-01-01T00:00:00Z\nTopicArn\narn:topic\nType\nNotification\n");

    sns["Subject"] = "Hi";
    EXPECT_EQ(SnsVerifier::canonicalString(sns), "Message\nhello\nMessageId\nid-1\nSubject\nHi\nTimestamp\n2024-01-01T00:00:00Z\nTopicArn\narn:topic\nType\nNotification\n");

    sns.erase("TopicArn");
    EXPECT_EQ(SnsVerifier::canonicalString(sns), "");
    EXPECT_EQ(SnsVerifier::canonicalString({{"Type", "Other"}}), "");
}

TEST(SnsVerifierTest, TrustsOnlyAmazonSnsHosts) {
    EXPECT_TRUE(SnsCertificateCache::isTrustedCertificateURL("https://sns.us-east-1.amazonaws.com/cert.pem"));
    EXPECT_TRUE(SnsCertificateCache::isTrustedCertificateURL("https://SNS.eu-west-1.amazonaws.com:443/cert.pem"));
    EXPECT_FALSE(SnsCertificateCache::isTrustedCertificateURL("http://sns.us-east-1.amazonaws.com/cert.pem"));
    EXPECT_FALSE(SnsCertificateCache::isTrustedCertificateURL("https://sns.us-east-1.amazonaws.com.evil.com/cert.pem"));
    EXPECT_FALSE(SnsCertificateCache::isTrustedCertificateURL("https://sns.x.amazonaws.com@evil.com/cert.pem"));
    EXPECT_FALSE(SnsCertificateCache::isTrustedCertificateURL("https://s3.amazonaws.com/cert.pem"));
}

TEST(SnsVerifierTest, CacheCanBeInvalidated) {
    SnsCertificateCache cache;
    cache.insert(TEST_CERT_URL, nullptr);
    EXPECT_EQ(cache.size(), 1u);
    cache.invalidate();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(SnsCertificateCache::keyFromPEM("not a certificate"), nullptr);
}
