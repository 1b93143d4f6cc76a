#include "MailJMAPTestFixture.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/thread_resolver.hpp"
#include "mailjmap/models/thread.hpp"

class ThreadResolverTest : public MailJMAPTest {
protected:
    std::string inbox;

    void SetUp() override {
        MailJMAPTest::SetUp();
        inbox = createMailbox("Inbox", "inbox");
    }

    std::shared_ptr<Thread> thread(json created) {
        return store->find<Thread>(Query().equal("id", created["threadId"].get<std::string>()));
    }
};

TEST_F(ThreadResolverTest, ReplyJoinsThreadOfParent) {
    json parent = importEmail(rawMessage("Plans", "1@x"), inbox, "2024-01-01T10:00:00Z");
    json reply = importEmail(rawMessage("Re: Plans", "2@x", "In-Reply-To: <1@x>\r\n"), inbox, "2024-01-01T11:00:00Z");

    EXPECT_EQ(reply["threadId"], parent["threadId"]);
    auto t = thread(parent);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->latestMessageAt(), MailUtils::timeForTimestamp("2024-01-01T11:00:00Z"));

    json got = emails->threadGet(getArgs({parent["threadId"].get<std::string>()}));
    ASSERT_EQ(got["list"].size(), 1u);
    EXPECT_EQ(got["list"][0]["emailIds"], json::array({parent["id"], reply["id"]}));
}

TEST_F(ThreadResolverTest, FallsBackToReferences) {
    json root = importEmail(rawMessage("Root", "root@x"), inbox, "2024-01-01T10:00:00Z");
    json reply = importEmail(rawMessage("Re: Root", "child@x", "In-Reply-To: <unknown@x>\r\nReferences: <other@x> <root@x>\r\n"), inbox, "2024-01-01T12:00:00Z");
    EXPECT_EQ(reply["threadId"], root["threadId"]);
}

TEST_F(ThreadResolverTest, ReferencesPickThreadOfEarliestMessage) {
    json later = importEmail(rawMessage("Later", "later@x"), inbox, "2024-02-01T10:00:00Z");
    json earlier = importEmail(rawMessage("Earlier", "earlier@x"), inbox, "2024-01-01T10:00:00Z");
    ASSERT_NE(later["threadId"], earlier["threadId"]);

    // header order and insertion order both favor the later message
    json reply = importEmail(rawMessage("Re: both", "both@x", "References: <later@x> <earlier@x>\r\n"), inbox, "2024-03-01T10:00:00Z");
    EXPECT_EQ(reply["threadId"], earlier["threadId"]);
    EXPECT_EQ(thread(earlier)->latestMessageAt(), MailUtils::timeForTimestamp("2024-03-01T10:00:00Z"));
    EXPECT_EQ(thread(later)->latestMessageAt(), MailUtils::timeForTimestamp("2024-02-01T10:00:00Z"));
}

TEST_F(ThreadResolverTest, OlderReplyKeepsLatestMessageAt) {
    json parent = importEmail(rawMessage("Plans", "1@x"), inbox, "2024-01-05T10:00:00Z");
    importEmail(rawMessage("Re: Plans", "2@x", "In-Reply-To: <1@x>\r\n"), inbox, "2024-01-01T10:00:00Z");
    EXPECT_EQ(thread(parent)->latestMessageAt(), MailUtils::timeForTimestamp("2024-01-05T10:00:00Z"));
}

TEST_F(ThreadResolverTest, UnrelatedMessagesStartNewThreads) {
    json a = importEmail(rawMessage("Same subject", "a@x"), inbox);
    json b = importEmail(rawMessage("Same subject", "b@x"), inbox);
    EXPECT_NE(a["threadId"], b["threadId"]);

    json changed = emails->threadChanges(changesArgs("0"));
    EXPECT_EQ(changed["created"].size(), 2u);
}

TEST_F(ThreadResolverTest, DestroyedParentNoLongerAnchorsThread) {
    json parent = importEmail(rawMessage("Gone", "gone@x"), inbox);
    CreationIdMap creationIds;
    emails->set(setArgs(json::object(), json::object(), json::array({parent["id"]})), creationIds);

    json reply = importEmail(rawMessage("Re: Gone", "reply@x", "In-Reply-To: <gone@x>\r\n"), inbox);
    EXPECT_NE(reply["threadId"], parent["threadId"]);
}

TEST_F(ThreadResolverTest, ResolvesOtherAccountsIndependently) {
    importEmail(rawMessage("Plans", "1@x"), inbox);

    ThreadResolver resolver(store);
    MailStoreTransaction transaction{store, "resolve"};
    ThreadResolution resolution = resolver.resolveOrCreateThreadId("acct-2", "Re: Plans", time(0), "<1@x>", "");
    transaction.commit();
    EXPECT_TRUE(resolution.created);
}
