#ifndef MAILJMAPTESTFIXTURE_HPP
#define MAILJMAPTESTFIXTURE_HPP

#include <gtest/gtest.h>
#include <stdlib.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

#include "mailjmap/blob_store.hpp"
#include "mailjmap/change_log.hpp"
#include "mailjmap/constants.hpp"
#include "mailjmap/email_engine.hpp"
#include "mailjmap/ingestion.hpp"
#include "mailjmap/mail_store.hpp"
#include "mailjmap/mail_store_transaction.hpp"
#include "mailjmap/mailbox_engine.hpp"
#include "mailjmap/server_config.hpp"
#include "mailjmap/jmap/method_args.hpp"

using json = nlohmann::json;

#define TEST_ACCOUNT_ID "acct-1"
#define TEST_DIR "/tmp/mailjmap_test"

class MailJMAPTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("CONFIG_DIR_PATH", TEST_DIR, 1);
        system("rm -rf " TEST_DIR " && mkdir -p " TEST_DIR);

        if (spdlog::get("logger") == nullptr) {
            auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
            spdlog::register_logger(std::make_shared<spdlog::logger>("logger", sink));
        }

        config = ServerConfig::FromJSON(json::object(), TEST_DIR);
        store = new MailStore();
        store->migrate();
        blobs = new MemoryBlobStore();
        changes = new ChangeLog(store);
        emails = new EmailEngine(store, blobs, &config, changes);
        mailboxes = new MailboxEngine(store, changes, emails);
    }

    void TearDown() override {
        delete mailboxes;
        delete emails;
        delete changes;
        delete blobs;
        delete store;
        system("rm -rf " TEST_DIR);
    }

    static std::string rawMessage(std::string subject, std::string messageId, std::string extraHeaders = "", std::string body = "Hello there") {
        return "From: Alice <alice@example.com>\r\n"
            "To: Bob <bob@example.com>\r\n"
            "Subject: " + subject + "\r\n"
            "Message-ID: <" + messageId + ">\r\n"
            "Date: Mon, 01 Jan 2024 10:00:00 +0000\r\n"
            + extraHeaders +
            "MIME-Version: 1.0\r\n"
            "Content-Type: text/plain; charset=utf-8\r\n"
            "\r\n"
            + body + "\r\n";
    }

    SetArgs setArgs(json create = json::object(), json update = json::object(), json destroy = json::array()) {
        SetArgs args;
        args.accountId = TEST_ACCOUNT_ID;
        for (auto it = create.begin(); it != create.end(); ++it) {
            args.create.push_back({it.key(), it.value()});
        }
        for (auto it = update.begin(); it != update.end(); ++it) {
            args.update.push_back({it.key(), it.value()});
        }
        for (const auto & id : destroy) {
            args.destroy.push_back(id.get<std::string>());
        }
        return args;
    }

    GetArgs getArgs(std::vector<std::string> ids) {
        GetArgs args;
        args.accountId = TEST_ACCOUNT_ID;
        args.hasIds = true;
        args.ids = ids;
        return args;
    }

    ChangesArgs changesArgs(std::string sinceState, int maxChanges = 0) {
        ChangesArgs args;
        args.accountId = TEST_ACCOUNT_ID;
        args.sinceState = sinceState;
        args.maxChanges = maxChanges;
        return args;
    }

    std::string createMailbox(std::string name, std::string role = "") {
        json create = {{"name", name}};
        if (role != "") {
            create["role"] = role;
        }
        CreationIdMap creationIds;
        json result = mailboxes->set(setArgs({{"mb", create}}), creationIds);
        EXPECT_TRUE(result["created"].count("mb")) << result.dump();
        return result["created"]["mb"]["id"].get<std::string>();
    }

    // Stores bytes as a blob the test account may reference.
    std::string uploadBlob(std::string bytes) {
        IngestionPipeline pipeline(store, blobs);
        MailStoreTransaction transaction{store, "testUpload"};
        std::string sha = pipeline.storeBlob(bytes);
        pipeline.ensureAccountBlob(TEST_ACCOUNT_ID, sha);
        transaction.commit();
        return sha;
    }

    json importEmail(std::string raw, std::string mailboxId, std::string receivedAt = "") {
        json create = {{"blobId", uploadBlob(raw)}, {"mailboxIds", {{mailboxId, true}}}};
        if (receivedAt != "") {
            create["receivedAt"] = receivedAt;
        }
        CreationIdMap creationIds;
        json result = emails->set(setArgs({{"e", create}}), creationIds);
        EXPECT_TRUE(result["created"].count("e")) << result.dump();
        return result["created"]["e"];
    }

    ServerConfig config;
    MailStore * store;
    MemoryBlobStore * blobs;
    ChangeLog * changes;
    EmailEngine * emails;
    MailboxEngine * mailboxes;
};

#endif /* MAILJMAPTESTFIXTURE_HPP */
