#include "MailJMAPTestFixture.hpp"

#include "mailjmap/submission_engine.hpp"
#include "mailjmap/jmap/dispatcher.hpp"

class JMAPDispatcherTest : public MailJMAPTest {
protected:
    SubmissionEngine * submissions;
    JMAPDispatcher * dispatcher;

    void SetUp() override {
        MailJMAPTest::SetUp();
        submissions = new SubmissionEngine(store, changes);
        dispatcher = new JMAPDispatcher(changes, emails, mailboxes, submissions);
    }

    void TearDown() override {
        delete dispatcher;
        delete submissions;
        MailJMAPTest::TearDown();
    }

    static json request(json methodCalls) {
        return {
            {"using", json::array({JMAP_CAPABILITY_CORE, JMAP_CAPABILITY_MAIL})},
            {"methodCalls", methodCalls},
        };
    }
};

TEST_F(JMAPDispatcherTest, RejectsMalformedRequests) {
    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, json::array());
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["type"], "notRequest");

    response = dispatcher->handle(TEST_ACCOUNT_ID, {{"using", json::array()}});
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["type"], "notRequest");

    response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({json::array({"Mailbox/get", json::object()})})));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["type"], "notRequest");
}

TEST_F(JMAPDispatcherTest, RejectsUnknownCapability) {
    json body = {
        {"using", json::array({JMAP_CAPABILITY_CORE, "urn:example:calendars"})},
        {"methodCalls", json::array()},
    };
    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, body);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["type"], "unknownCapability");
    EXPECT_EQ(response.body["capability"], "urn:example:calendars");
}

TEST_F(JMAPDispatcherTest, LimitsCallsPerRequest) {
    json calls = json::array();
    for (int i = 0; i < JMAP_MAX_CALLS_IN_REQUEST + 1; i++) {
        calls.push_back(json::array({"Mailbox/get", json::object(), "c" + std::to_string(i)}));
    }
    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(calls));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["type"], "limitExceeded");
    EXPECT_EQ(response.body["limit"], "maxCallsInRequest");

    calls.erase(calls.size() - 1);
    response = dispatcher->handle(TEST_ACCOUNT_ID, request(calls));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["methodResponses"].size(), JMAP_MAX_CALLS_IN_REQUEST);
}

TEST_F(JMAPDispatcherTest, MethodErrorsDoNotStopLaterCalls) {
    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Calendar/get", json::object(), "a"}),
        json::array({"Mailbox/get", {{"accountId", "acct-other"}}, "b"}),
        json::array({"Mailbox/get", json::object(), "c"}),
    })));
    ASSERT_EQ(response.status, 200);
    json responses = response.body["methodResponses"];
    ASSERT_EQ(responses.size(), 3);

    EXPECT_EQ(responses[0][0], "error");
    EXPECT_EQ(responses[0][1]["type"], "unknownMethod");
    EXPECT_EQ(responses[0][2], "a");

    EXPECT_EQ(responses[1][0], "error");
    EXPECT_EQ(responses[1][1]["type"], "accountNotFound");
    EXPECT_EQ(responses[1][2], "b");

    EXPECT_EQ(responses[2][0], "Mailbox/get");
    EXPECT_EQ(responses[2][1]["accountId"], TEST_ACCOUNT_ID);
    EXPECT_EQ(responses[2][2], "c");
}

TEST_F(JMAPDispatcherTest, SharesCreationIdsAcrossCalls) {
    std::string raw = rawMessage("Dispatched", "dispatched@example.com");
    std::string blobId = uploadBlob(raw);

    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Mailbox/set", {{"create", {{"mb", {{"name", "Inbox"}, {"role", "inbox"}}}}}}, "0"}),
        json::array({"Email/set", {{"create", {{"e", {{"blobId", blobId}, {"mailboxIds", {{"#mb", true}}}}}}}}, "1"}),
        json::array({"Email/query", {{"filter", {{"inMailbox", "#mb"}}}}, "2"}),
    })));
    ASSERT_EQ(response.status, 200);
    json responses = response.body["methodResponses"];
    ASSERT_EQ(responses.size(), 3);

    std::string mailboxId = responses[0][1]["created"]["mb"]["id"];
    ASSERT_TRUE(responses[1][1]["created"].count("e")) << responses[1].dump();
    std::string emailId = responses[1][1]["created"]["e"]["id"];

    json got = emails->get(getArgs({emailId}))["list"][0];
    EXPECT_TRUE(got["mailboxIds"].count(mailboxId));

    EXPECT_EQ(response.body["sessionState"], changes->getSessionState(TEST_ACCOUNT_ID));
}

TEST_F(JMAPDispatcherTest, RoutesEmailQueryChanges) {
    std::string inbox = createMailbox("Inbox", "inbox");
    json email = importEmail(rawMessage("Routed", "routed@example.com"), inbox);

    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Email/queryChanges", {{"sinceQueryState", "0"}}, "a"}),
        json::array({"Email/queryChanges", json::object(), "b"}),
        json::array({"Mailbox/queryChanges", {{"sinceQueryState", "0"}}, "c"}),
    })));
    ASSERT_EQ(response.status, 200);
    json responses = response.body["methodResponses"];
    ASSERT_EQ(responses.size(), 3);

    EXPECT_EQ(responses[0][0], "Email/queryChanges");
    EXPECT_EQ(responses[0][1]["accountId"], TEST_ACCOUNT_ID);
    EXPECT_EQ(responses[0][1]["added"], json::array({{{"id", email["id"]}, {"index", 0}}}));

    EXPECT_EQ(responses[1][0], "error");
    EXPECT_EQ(responses[1][1]["type"], "invalidArguments");

    EXPECT_EQ(responses[2][0], "error");
    EXPECT_EQ(responses[2][1]["type"], "unknownMethod");
}

TEST_F(JMAPDispatcherTest, RoutesEmailParse) {
    std::string blobId = uploadBlob(rawMessage("Parsed", "parsed@example.com"));

    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Email/parse", {{"blobIds", json::array({blobId})}, {"properties", json::array({"subject"})}}, "a"}),
        json::array({"Email/parse", json::object(), "b"}),
    })));
    ASSERT_EQ(response.status, 200);
    json responses = response.body["methodResponses"];
    ASSERT_EQ(responses.size(), 2);

    EXPECT_EQ(responses[0][0], "Email/parse");
    EXPECT_EQ(responses[0][1]["parsed"][blobId], json({{"subject", "Parsed"}}));
    EXPECT_EQ(responses[1][1]["type"], "invalidArguments");
}

TEST_F(JMAPDispatcherTest, CopyWithDestroyOriginalAnswersWithEmailSet) {
    std::string inbox = createMailbox("Inbox", "inbox");
    std::string archive = createMailbox("Archive", "archive");
    json source = importEmail(rawMessage("Move me", "move@example.com"), inbox);

    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Email/copy", {
            {"fromAccountId", TEST_ACCOUNT_ID},
            {"create", {{"c", {{"id", source["id"]}, {"mailboxIds", {{archive, true}}}}}}},
            {"onSuccessDestroyOriginal", true},
        }, "move"}),
    })));
    ASSERT_EQ(response.status, 200);
    json responses = response.body["methodResponses"];
    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[0][0], "Email/copy");
    EXPECT_TRUE(responses[0][1]["created"].count("c"));
    EXPECT_EQ(responses[1][0], "Email/set");
    EXPECT_EQ(responses[1][1]["destroyed"], json::array({source["id"]}));
    EXPECT_EQ(responses[1][2], "move");

    EXPECT_EQ(emails->get(getArgs({source["id"].get<std::string>()}))["notFound"], json::array({source["id"]}));
}

TEST_F(JMAPDispatcherTest, CopyFromAnotherAccountIsRejected) {
    EndpointResponse response = dispatcher->handle(TEST_ACCOUNT_ID, request(json::array({
        json::array({"Email/copy", {{"fromAccountId", "acct-2"}, {"create", json::object()}}, "x"}),
    })));
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.body["methodResponses"][0][0], "error");
    EXPECT_EQ(response.body["methodResponses"][0][1]["type"], "accountNotFound");
}
