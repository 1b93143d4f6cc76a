#include "MailJMAPTestFixture.hpp"
#include "MockOutboundTransport.hpp"

#include "mailjmap/delivery_status.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/submission_queue.hpp"
#include "mailjmap/sync_exception.hpp"
#include "mailjmap/models/email_submission.hpp"

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Invoke;

class SubmissionQueueTest : public MailJMAPTest {
protected:
    std::string inbox;
    json email;
    MockOutboundTransport * transport;
    SubmissionQueue * queue;
    time_t now = 1700000000;

    void SetUp() override {
        MailJMAPTest::SetUp();
        inbox = createMailbox("Sent", "sent");
        email = importEmail(rawMessage("Outgoing", "out@x"), inbox);
        transport = new MockOutboundTransport();
        queue = new SubmissionQueue(store, changes, transport);
    }

    void TearDown() override {
        delete queue;
        delete transport;
        MailJMAPTest::TearDown();
    }

    std::string enqueue(json envelope, time_t sendAt) {
        EmailSubmission submission{MailUtils::idRandomlyGenerated(), TEST_ACCOUNT_ID, email["id"].get<std::string>(), email["threadId"].get<std::string>(), "identity-1", envelope, sendAt};
        store->save(&submission);
        return submission.id();
    }

    std::shared_ptr<EmailSubmission> reload(std::string id) {
        return store->find<EmailSubmission>(Query().equal("id", id));
    }
};

TEST_F(SubmissionQueueTest, RetryDelaysFollowSchedule) {
    EXPECT_EQ(SubmissionQueue::computeNextAttempt(1, now), now + 60);
    EXPECT_EQ(SubmissionQueue::computeNextAttempt(2, now), now + 300);
    EXPECT_EQ(SubmissionQueue::computeNextAttempt(5, now), now + 21600);
    EXPECT_EQ(SubmissionQueue::computeNextAttempt(50, now), now + 21600);
    EXPECT_EQ(SubmissionQueue::maxRetryAttempts(), 5);
}

TEST_F(SubmissionQueueTest, ParsesPlainAndObjectEnvelopes) {
    OutboundEnvelope envelope;
    EXPECT_TRUE(SubmissionQueue::parseEnvelope({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, envelope));
    EXPECT_EQ(envelope.mailFrom, "a@x");
    EXPECT_EQ(envelope.rcptTo, std::vector<std::string>({"b@y"}));

    json objects = {
        {"mailFrom", {{"email", "c@x"}, {"parameters", nullptr}}},
        {"rcptTo", json::array({{{"email", "d@y"}}, {{"email", "e@y"}}})},
    };
    EXPECT_TRUE(SubmissionQueue::parseEnvelope(objects, envelope));
    EXPECT_EQ(envelope.mailFrom, "c@x");
    EXPECT_EQ(envelope.rcptTo, std::vector<std::string>({"d@y", "e@y"}));

    EXPECT_FALSE(SubmissionQueue::parseEnvelope({{"mailFrom", "a@x"}}, envelope));
    EXPECT_FALSE(SubmissionQueue::parseEnvelope({{"mailFrom", ""}, {"rcptTo", json::array()}}, envelope));
}

TEST_F(SubmissionQueueTest, SucceedsOnFifthAttemptAfterTransportErrors) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);

    EXPECT_CALL(*transport, send(_))
        .WillOnce(Throw(SyncException("ses", "connection reset", true)))
        .WillOnce(Throw(SyncException("ses", "connection reset", true)))
        .WillOnce(Throw(SyncException("ses", "connection reset", true)))
        .WillOnce(Throw(SyncException("ses", "connection reset", true)))
        .WillOnce(Return(MockOutboundTransport::accepted()));

    time_t clock = now;
    for (int attempt = 1; attempt <= 4; attempt ++) {
        ASSERT_TRUE(queue->processSingleSubmission(id, clock));
        auto submission = reload(id);
        EXPECT_EQ(submission->status(), SUBMISSION_STATUS_PENDING);
        EXPECT_EQ(submission->retryCount(), attempt);
        EXPECT_EQ(submission->nextAttemptAt(), SubmissionQueue::computeNextAttempt(attempt, clock));

        // not due yet
        EXPECT_FALSE(queue->processSingleSubmission(id, clock + 1));
        clock = submission->nextAttemptAt();
    }

    ASSERT_TRUE(queue->processSingleSubmission(id, clock));
    auto submission = reload(id);
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_SENT);
    EXPECT_EQ(submission->retryCount(), 5);
    EXPECT_EQ(submission->undoStatus(), UNDO_STATUS_FINAL);
    EXPECT_EQ(submission->nextAttemptAt(), -1);

    json status = submission->deliveryStatus();
    ASSERT_TRUE(status.count("b@y"));
    EXPECT_EQ(status["b@y"]["smtpReply"].get<std::string>().substr(0, 3), "250");
    EXPECT_EQ(status["b@y"]["delivered"], DELIVERED_QUEUED);
    EXPECT_EQ(status["b@y"]["providerMessageId"], "ses-message-1");
}

TEST_F(SubmissionQueueTest, FailsAfterRetriesAreExhausted) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);

    EXPECT_CALL(*transport, send(_))
        .Times(6)
        .WillRepeatedly(Return(MockOutboundTransport::rejected("Throttled", false)));

    time_t clock = now;
    for (int attempt = 1; attempt <= 6; attempt ++) {
        ASSERT_TRUE(queue->processSingleSubmission(id, clock));
        clock = reload(id)->nextAttemptAt();
    }

    auto submission = reload(id);
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(submission->retryCount(), 6);
    EXPECT_EQ(submission->nextAttemptAt(), -1);
    EXPECT_EQ(submission->deliveryStatus()["b@y"]["delivered"], DELIVERED_NO);
    EXPECT_FALSE(queue->processSingleSubmission(id, clock + 100000));
}

TEST_F(SubmissionQueueTest, PermanentRejectionFailsImmediately) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);
    EXPECT_CALL(*transport, send(_)).WillOnce(Return(MockOutboundTransport::rejected("Address blacklisted", true)));

    ASSERT_TRUE(queue->processSingleSubmission(id, now));
    auto submission = reload(id);
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(submission->deliveryStatus()["b@y"]["smtpReply"], "550 5.7.1 Address blacklisted");
}

TEST_F(SubmissionQueueTest, ClaimIsExclusive) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);

    auto first = queue->claimSubmission(id, now);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->rawBlobSha256, email["blobId"].get<std::string>());
    EXPECT_EQ(reload(id)->status(), SUBMISSION_STATUS_SENDING);

    EXPECT_EQ(queue->claimSubmission(id, now), nullptr);
}

TEST_F(SubmissionQueueTest, SkipsCanceledAndFutureSubmissions) {
    std::string later = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now + 600);
    std::string canceled = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);
    auto submission = reload(canceled);
    submission->setStatus(SUBMISSION_STATUS_CANCELED);
    submission->setUndoStatus(UNDO_STATUS_CANCELED);
    store->save(submission.get());

    EXPECT_CALL(*transport, send(_)).Times(0);
    EXPECT_EQ(queue->processQueue(10, now), 0);
    EXPECT_EQ(queue->claimSubmission(later, now), nullptr);
    EXPECT_EQ(queue->claimSubmission(canceled, now), nullptr);
}

TEST_F(SubmissionQueueTest, FailsWhenEmailWasDestroyed) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);
    CreationIdMap creationIds;
    emails->set(setArgs(json::object(), json::object(), json::array({email["id"]})), creationIds);

    EXPECT_CALL(*transport, send(_)).Times(0);
    EXPECT_FALSE(queue->processSingleSubmission(id, now));
    auto submission = reload(id);
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(submission->deliveryStatus()["b@y"]["delivered"], DELIVERED_NO);
}

TEST_F(SubmissionQueueTest, SendsRawBlobReference) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y", "c@y"})}}, now);

    EXPECT_CALL(*transport, send(_)).WillOnce(Invoke([&](const OutboundMessage & message) {
        EXPECT_EQ(message.submissionId, id);
        EXPECT_EQ(message.accountId, TEST_ACCOUNT_ID);
        EXPECT_EQ(message.envelope.mailFrom, "a@x");
        EXPECT_EQ(message.envelope.rcptTo, std::vector<std::string>({"b@y", "c@y"}));
        EXPECT_FALSE(message.mime.isInline);
        EXPECT_EQ(message.mime.sha256, email["blobId"].get<std::string>());
        return MockOutboundTransport::accepted();
    }));
    EXPECT_EQ(queue->processQueue(10, now), 1);

    EXPECT_EQ(changes->getChanges(TEST_ACCOUNT_ID, TYPE_EMAIL_SUBMISSION, "0", 0).updated, std::vector<std::string>({id}));
}

TEST_F(SubmissionQueueTest, ClaimLosesWhenStatusChangesBeforeUpdate) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);
    std::string state = changes->getState(TEST_ACCOUNT_ID, TYPE_EMAIL_SUBMISSION);

    // another worker flips the row between our read and the conditional update
    store->db().exec("CREATE TEMP TRIGGER competing_claim BEFORE UPDATE OF status ON EmailSubmission "
                     "WHEN OLD.status = 'pending' AND NEW.status = 'sending' BEGIN SELECT RAISE(IGNORE); END");

    EXPECT_CALL(*transport, send(_)).Times(0);
    EXPECT_EQ(queue->claimSubmission(id, now), nullptr);
    EXPECT_FALSE(queue->processSingleSubmission(id, now));
    EXPECT_EQ(reload(id)->status(), SUBMISSION_STATUS_PENDING);
    EXPECT_EQ(changes->getState(TEST_ACCOUNT_ID, TYPE_EMAIL_SUBMISSION), state);

    store->db().exec("DROP TRIGGER competing_claim");
    EXPECT_NE(queue->claimSubmission(id, now), nullptr);
}

TEST_F(SubmissionQueueTest, KeepsOutcomeSettledWhileSending) {
    std::string id = enqueue({{"mailFrom", "a@x"}, {"rcptTo", json::array({"b@y"})}}, now);
    json bounced = {{"b@y", {{"smtpReply", "550 5.1.1 user unknown"}, {"delivered", DELIVERED_NO}, {"displayed", "unknown"}}}};

    EXPECT_CALL(*transport, send(_)).WillOnce(Invoke([&](const OutboundMessage & message) {
        // the bounce notification lands before the transport call returns
        auto submission = reload(message.submissionId);
        submission->setStatus(SUBMISSION_STATUS_FAILED);
        submission->setDeliveryStatus(bounced);
        store->save(submission.get());
        return MockOutboundTransport::accepted();
    }));
    ASSERT_TRUE(queue->processSingleSubmission(id, now));

    auto submission = reload(id);
    EXPECT_EQ(submission->status(), SUBMISSION_STATUS_FAILED);
    EXPECT_EQ(submission->deliveryStatus(), bounced);
    EXPECT_EQ(submission->retryCount(), 0);
}
