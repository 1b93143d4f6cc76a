#include "MailJMAPTestFixture.hpp"
#include "mailjmap/jmap_error.hpp"

class MailboxEngineTest : public MailJMAPTest {
};

TEST_F(MailboxEngineTest, CreatesChildThroughCreationReference) {
    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs({
        {"child", {{"name", "2024"}, {"parentId", "#projects"}}},
        {"projects", {{"name", "Projects"}}},
    }), creationIds);

    ASSERT_TRUE(result["created"].count("projects")) << result.dump();
    ASSERT_TRUE(result["created"].count("child")) << result.dump();
    EXPECT_TRUE(result["notCreated"].empty());

    std::string projectsId = result["created"]["projects"]["id"];
    std::string childId = result["created"]["child"]["id"];
    EXPECT_EQ(creationIds["projects"], projectsId);

    json got = mailboxes->get(getArgs({childId}));
    ASSERT_EQ(got["list"].size(), 1u);
    EXPECT_EQ(got["list"][0]["parentId"], projectsId);
    EXPECT_EQ(got["list"][0]["totalEmails"], 0);
    EXPECT_EQ(result["oldState"], "0");
    EXPECT_EQ(result["newState"], "2");
}

TEST_F(MailboxEngineTest, StaleIfInStateWritesNothing) {
    std::string work = createMailbox("Work");
    std::string state = changes->getState(TEST_ACCOUNT_ID, TYPE_MAILBOX);

    SetArgs args = setArgs({{"new", {{"name", "Later"}}}}, {{work, {{"name", "Renamed"}}}}, json::array({work}));
    args.hasIfInState = true;
    args.ifInState = "0";

    CreationIdMap creationIds;
    EXPECT_THROW(mailboxes->set(args, creationIds), JMAPError);
    EXPECT_TRUE(creationIds.empty());
    EXPECT_EQ(changes->getState(TEST_ACCOUNT_ID, TYPE_MAILBOX), state);

    json got = mailboxes->get(getArgs({work}));
    ASSERT_EQ(got["list"].size(), 1u);
    EXPECT_EQ(got["list"][0]["name"], "Work");
    SQLite::Statement count(store->db(), "SELECT COUNT(*) FROM Mailbox");
    ASSERT_TRUE(count.executeStep());
    EXPECT_EQ(count.getColumn(0).getInt(), 1);
}

TEST_F(MailboxEngineTest, ReportsUnresolvableCreationReference) {
    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs({
        {"orphan", {{"name", "Orphan"}, {"parentId", "#missing"}}},
    }), creationIds);
    ASSERT_TRUE(result["notCreated"].count("orphan"));
    EXPECT_EQ(result["notCreated"]["orphan"]["type"], "invalidProperties");
}

TEST_F(MailboxEngineTest, RejectsDuplicateRole) {
    createMailbox("Inbox", "inbox");

    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs({
        {"second", {{"name", "Other Inbox"}, {"role", "INBOX"}}},
    }), creationIds);
    ASSERT_TRUE(result["notCreated"].count("second"));
    EXPECT_EQ(result["notCreated"]["second"]["type"], "roleConflict");
}

TEST_F(MailboxEngineTest, RejectsInvalidNamesAndRoles) {
    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs({
        {"empty", {{"name", ""}}},
        {"long", {{"name", std::string(256, 'a')}}},
        {"role", {{"name", "Weird"}, {"role", "not-a-role"}}},
        {"junk", {{"name", "Junk"}, {"role", "junk"}}},
        {"serverSet", {{"name", "Counts"}, {"totalEmails", 4}}},
    }), creationIds);
    EXPECT_EQ(result["notCreated"].size(), 5u);
    EXPECT_TRUE(result["created"].empty());
    EXPECT_EQ(result["newState"], "0");
}

TEST_F(MailboxEngineTest, RejectsParentCycles) {
    std::string a = createMailbox("A");
    CreationIdMap creationIds;
    json child = mailboxes->set(setArgs({{"b", {{"name", "B"}, {"parentId", a}}}}), creationIds);
    std::string b = child["created"]["b"]["id"];

    json result = mailboxes->set(setArgs(json::object(), {{a, {{"parentId", b}}}}), creationIds);
    ASSERT_TRUE(result["notUpdated"].count(a));
    EXPECT_EQ(result["notUpdated"][a]["type"], "invalidProperties");

    result = mailboxes->set(setArgs(json::object(), {{a, {{"parentId", a}}}}), creationIds);
    ASSERT_TRUE(result["notUpdated"].count(a));
}

TEST_F(MailboxEngineTest, RenamesAndRecordsUpdatedProperties) {
    std::string id = createMailbox("Receipts");
    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs(json::object(), {{id, {{"name", "Invoices"}, {"sortOrder", 3}}}}), creationIds);
    EXPECT_TRUE(result["updated"].count(id));

    json got = mailboxes->get(getArgs({id}));
    EXPECT_EQ(got["list"][0]["name"], "Invoices");
    EXPECT_EQ(got["list"][0]["sortOrder"], 3);

    json changed = mailboxes->getChanges(changesArgs("1"));
    EXPECT_EQ(changed["updated"], json::array({id}));
    EXPECT_EQ(changed["created"], json::array());
}

TEST_F(MailboxEngineTest, RefusesToDestroyParent) {
    std::string parent = createMailbox("Parent");
    CreationIdMap creationIds;
    mailboxes->set(setArgs({{"c", {{"name", "Child"}, {"parentId", parent}}}}), creationIds);

    json result = mailboxes->set(setArgs(json::object(), json::object(), json::array({parent})), creationIds);
    ASSERT_TRUE(result["notDestroyed"].count(parent));
    EXPECT_EQ(result["notDestroyed"][parent]["type"], "mailboxHasChild");
}

TEST_F(MailboxEngineTest, RefusesToDestroyMailboxWithEmailUntilEmptied) {
    std::string inbox = createMailbox("Inbox", "inbox");
    json email = importEmail(rawMessage("Hello", "hello@example.com"), inbox);
    std::string emailId = email["id"];

    CreationIdMap creationIds;
    json result = mailboxes->set(setArgs(json::object(), json::object(), json::array({inbox})), creationIds);
    ASSERT_TRUE(result["notDestroyed"].count(inbox));
    EXPECT_EQ(result["notDestroyed"][inbox]["type"], "mailboxHasEmail");

    json destroyed = emails->set(setArgs(json::object(), json::object(), json::array({emailId})), creationIds);
    EXPECT_EQ(destroyed["destroyed"], json::array({emailId}));

    result = mailboxes->set(setArgs(json::object(), json::object(), json::array({inbox})), creationIds);
    EXPECT_EQ(result["destroyed"], json::array({inbox}));
}

TEST_F(MailboxEngineTest, OnDestroyRemoveEmailsKeepsMessagesInOtherMailboxes) {
    std::string inbox = createMailbox("Inbox", "inbox");
    std::string archive = createMailbox("Archive", "archive");

    json only = importEmail(rawMessage("Only inbox", "only@example.com"), inbox);
    json both = importEmail(rawMessage("Both", "both@example.com"), inbox);
    CreationIdMap creationIds;
    std::string bothId = both["id"];
    emails->set(setArgs(json::object(), {{bothId, {{"mailboxIds/" + archive, true}}}}), creationIds);

    SetArgs args = setArgs(json::object(), json::object(), json::array({inbox}));
    args.onDestroyRemoveEmails = true;
    json result = mailboxes->set(args, creationIds);
    EXPECT_EQ(result["destroyed"], json::array({inbox}));

    json got = emails->get(getArgs({only["id"].get<std::string>(), bothId}));
    EXPECT_EQ(got["notFound"], json::array({only["id"]}));
    ASSERT_EQ(got["list"].size(), 1u);
    EXPECT_EQ(got["list"][0]["mailboxIds"], json({{archive, true}}));
}

TEST_F(MailboxEngineTest, CountsEmailsAndUnread) {
    std::string inbox = createMailbox("Inbox", "inbox");
    json first = importEmail(rawMessage("One", "one@example.com"), inbox);
    importEmail(rawMessage("Two", "two@example.com"), inbox);

    CreationIdMap creationIds;
    emails->set(setArgs(json::object(), {{first["id"].get<std::string>(), {{"keywords/$seen", true}}}}), creationIds);

    json got = mailboxes->get(getArgs({inbox}));
    EXPECT_EQ(got["list"][0]["totalEmails"], 2);
    EXPECT_EQ(got["list"][0]["unreadEmails"], 1);
    EXPECT_EQ(got["list"][0]["totalThreads"], 2);
    EXPECT_EQ(got["list"][0]["unreadThreads"], 1);
}

TEST_F(MailboxEngineTest, QueriesByRoleAndSortsByName) {
    createMailbox("Zeta");
    std::string inbox = createMailbox("Inbox", "inbox");
    createMailbox("Alpha");

    QueryArgs args;
    args.accountId = TEST_ACCOUNT_ID;
    args.filter = {{"hasAnyRole", true}};
    json result = mailboxes->query(args);
    EXPECT_EQ(result["ids"], json::array({inbox}));

    args.filter = nullptr;
    args.sort = json::array({{{"property", "name"}, {"isAscending", false}}});
    result = mailboxes->query(args);
    ASSERT_EQ(result["ids"].size(), 3u);
    EXPECT_EQ(result["ids"][1], inbox);

    args.sort = json::array({{{"property", "totalEmails"}}});
    try {
        mailboxes->query(args);
        FAIL() << "Expected unsupportedSort";
    } catch (JMAPError & err) {
        EXPECT_EQ(err.type, "unsupportedSort");
    }
}
