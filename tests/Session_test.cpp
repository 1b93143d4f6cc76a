#include "MailJMAPTestFixture.hpp"

#include "mailjmap/models/account.hpp"
#include "mailjmap/jmap/session.hpp"

class JMAPSessionTest : public MailJMAPTest {
};

TEST_F(JMAPSessionTest, BuildsSessionForAccount) {
    Account account{TEST_ACCOUNT_ID, "alice@example.com"};
    store->save(&account);

    JMAPSession session{store, changes, &config};
    json result = session.build(TEST_ACCOUNT_ID, "https://mail.example.com/");

    EXPECT_EQ(result["username"], "alice@example.com");
    EXPECT_EQ(result["accounts"][TEST_ACCOUNT_ID]["name"], "alice@example.com");
    EXPECT_EQ(result["accounts"][TEST_ACCOUNT_ID]["isPersonal"], true);
    EXPECT_EQ(result["primaryAccounts"][JMAP_CAPABILITY_MAIL], TEST_ACCOUNT_ID);
    EXPECT_EQ(result["primaryAccounts"][JMAP_CAPABILITY_SUBMISSION], TEST_ACCOUNT_ID);
    EXPECT_EQ(result["apiUrl"], "https://mail.example.com/jmap");
    EXPECT_EQ(result["downloadUrl"], "https://mail.example.com/blobs/download/{accountId}/{blobId}/{name}?type={type}");
    EXPECT_EQ(result["uploadUrl"], "https://mail.example.com/blobs/upload/{accountId}/{type}");
    EXPECT_EQ(result["state"], changes->getSessionState(TEST_ACCOUNT_ID));

    json core = result["capabilities"][JMAP_CAPABILITY_CORE];
    EXPECT_EQ(core["maxCallsInRequest"], JMAP_MAX_CALLS_IN_REQUEST);
    EXPECT_EQ(core["maxSizeUpload"], config.maxSizeUpload);
    EXPECT_TRUE(core["collationAlgorithms"].is_array());
}

TEST_F(JMAPSessionTest, FallsBackToAccountIdWithoutAccountRecord) {
    JMAPSession session{store, changes, &config};
    json result = session.build(TEST_ACCOUNT_ID, "http://localhost:8080");
    EXPECT_EQ(result["username"], TEST_ACCOUNT_ID);
    EXPECT_EQ(result["apiUrl"], "http://localhost:8080/jmap");
}

TEST_F(JMAPSessionTest, StateFollowsMutations) {
    JMAPSession session{store, changes, &config};
    std::string before = session.build(TEST_ACCOUNT_ID, "http://localhost")["state"];
    createMailbox("Inbox", "inbox");
    std::string after = session.build(TEST_ACCOUNT_ID, "http://localhost")["state"];
    EXPECT_NE(before, after);
}
