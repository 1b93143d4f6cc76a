#include "MailJMAPTestFixture.hpp"
#include "mailjmap/jmap_error.hpp"
#include "mailjmap/mail_utils.hpp"

class IngestionTest : public MailJMAPTest {
protected:
    int countRows(std::string sql) {
        SQLite::Statement query(store->db(), sql);
        query.executeStep();
        return query.getColumn(0).getInt();
    }
};

TEST_F(IngestionTest, ParsesHeadersAndAddresses) {
    std::string raw = rawMessage("Quarterly numbers", "q1@example.com",
        "Cc: Carol <carol@example.com>, dave@example.com\r\n"
        "In-Reply-To: <parent@example.com>\r\n"
        "X-Folded: first\r\n  second\r\n");

    ParsedEmail parsed = IngestionPipeline::parseRawEmail(raw);
    EXPECT_EQ(parsed.subject, "Quarterly numbers");
    EXPECT_EQ(parsed.messageId, "q1@example.com");
    EXPECT_EQ(parsed.inReplyTo, "<parent@example.com>");
    EXPECT_GT(parsed.sentAt, 0);

    ASSERT_EQ(parsed.from.size(), 1);
    EXPECT_EQ(parsed.from[0].email, "alice@example.com");
    EXPECT_EQ(parsed.from[0].name, "Alice");
    ASSERT_EQ(parsed.cc.size(), 2);
    EXPECT_EQ(parsed.cc[1].email, "dave@example.com");

    bool foundFolded = false;
    for (const auto & header : parsed.headers) {
        if (header.first == "X-Folded") {
            EXPECT_EQ(header.second, "first second");
            foundFolded = true;
        }
    }
    EXPECT_TRUE(foundFolded);

    EXPECT_TRUE(parsed.hasText);
    EXPECT_NE(parsed.text.find("Hello there"), std::string::npos);
    EXPECT_FALSE(parsed.hasHTML);
}

TEST_F(IngestionTest, MissingDateLeavesSentAtUnset) {
    std::string raw = "From: alice@example.com\r\nSubject: No date\r\n\r\nBody\r\n";
    EXPECT_EQ(IngestionPipeline::parseRawEmail(raw).sentAt, -1);
}

TEST_F(IngestionTest, BuildsSnippets) {
    ParsedEmail text;
    text.hasText = true;
    text.text = "   Short note  \n";
    EXPECT_EQ(IngestionPipeline::makeSnippet(text), "Short note");

    ParsedEmail html;
    html.hasText = false;
    html.hasHTML = true;
    html.html = "<p>Hello <b>World</b></p>\n<div>again</div>";
    EXPECT_EQ(IngestionPipeline::makeSnippet(html), "Hello World again");

    ParsedEmail longText;
    longText.hasText = true;
    longText.text = std::string(SNIPPET_LENGTH + 50, 'x');
    EXPECT_EQ(IngestionPipeline::makeSnippet(longText).size(), SNIPPET_LENGTH);
}

TEST_F(IngestionTest, PreparesStoredBodies) {
    StoredBody absent = IngestionPipeline::prepareStoredBody(false, "ignored");
    EXPECT_FALSE(absent.present);

    StoredBody normalized = IngestionPipeline::prepareStoredBody(true, "one\r\ntwo\r\n");
    EXPECT_TRUE(normalized.present);
    EXPECT_EQ(normalized.content, "one\ntwo\n");
    EXPECT_FALSE(normalized.truncated);

    StoredBody large = IngestionPipeline::prepareStoredBody(true, std::string(MAX_STORED_BODY_BYTES + 10, 'a'));
    EXPECT_TRUE(large.truncated);
    EXPECT_EQ(large.content.size(), MAX_STORED_BODY_BYTES);
}

TEST_F(IngestionTest, IdenticalBytesShareOneMessage) {
    IngestionPipeline pipeline{store, blobs};
    std::string raw = rawMessage("Dedupe", "dedupe@example.com");

    IngestResult first;
    IngestResult second;
    {
        MailStoreTransaction transaction{store, "testIngest"};
        first = pipeline.ingest(TEST_ACCOUNT_ID, raw);
        second = pipeline.ingest("acct-2", raw);
        transaction.commit();
    }

    EXPECT_TRUE(first.inserted);
    EXPECT_FALSE(second.inserted);
    EXPECT_EQ(first.canonicalMessageId, second.canonicalMessageId);
    EXPECT_EQ(first.rawBlobSha256, MailUtils::sha256Hex(raw));
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Message"), 1);
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM AccountBlob"), 2);
    EXPECT_EQ(blobs->count(), 1);
}

TEST_F(IngestionTest, StoresAttachmentsAsBlobs) {
    std::string raw =
        "From: alice@example.com\r\n"
        "To: bob@example.com\r\n"
        "Subject: With file\r\n"
        "Message-ID: <file@example.com>\r\n"
        "MIME-Version: 1.0\r\n"
        "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
        "\r\n"
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "See attached\r\n"
        "--b1\r\n"
        "Content-Type: application/pdf; name=\"report.pdf\"\r\n"
        "Content-Disposition: attachment; filename=\"report.pdf\"\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "\r\n"
        "UERGREFUQQ==\r\n"
        "--b1--\r\n";

    ParsedEmail parsed = IngestionPipeline::parseRawEmail(raw);
    ASSERT_EQ(parsed.attachments.size(), 1);
    EXPECT_EQ(parsed.attachments[0].filename, "report.pdf");
    EXPECT_EQ(parsed.attachments[0].mimeType, "application/pdf");
    EXPECT_EQ(parsed.attachments[0].bytes, "PDFDATA");

    json structure = IngestionPipeline::buildBodyStructure(parsed, raw.size());
    ASSERT_EQ(structure["parts"].size(), 2);
    EXPECT_EQ(structure["parts"][1]["name"], "report.pdf");
    EXPECT_EQ(structure["parts"][1]["blobId"], MailUtils::sha256Hex("PDFDATA"));

    IngestionPipeline pipeline{store, blobs};
    {
        MailStoreTransaction transaction{store, "testIngest"};
        pipeline.ingest(TEST_ACCOUNT_ID, raw);
        transaction.commit();
    }
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Attachment"), 1);
    EXPECT_TRUE(blobs->exists(MailUtils::sha256Hex("PDFDATA")));
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM AccountBlob"), 2);
}

TEST_F(IngestionTest, RollbackRemovesBlobsWrittenByTheTransaction) {
    std::string raw =
        "From: alice@example.com\r\n"
        "To: bob@example.com\r\n"
        "Subject: Abandoned\r\n"
        "Message-ID: <abandoned@example.com>\r\n"
        "MIME-Version: 1.0\r\n"
        "Content-Type: multipart/mixed; boundary=\"b1\"\r\n"
        "\r\n"
        "--b1\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "See attached\r\n"
        "--b1\r\n"
        "Content-Type: application/pdf; name=\"draft.pdf\"\r\n"
        "Content-Disposition: attachment; filename=\"draft.pdf\"\r\n"
        "Content-Transfer-Encoding: base64\r\n"
        "\r\n"
        "UERGREFUQQ==\r\n"
        "--b1--\r\n";

    IngestionPipeline pipeline{store, blobs};
    try {
        MailStoreTransaction transaction{store, "testIngest"};
        pipeline.ingest(TEST_ACCOUNT_ID, raw);
        EXPECT_EQ(blobs->count(), 2);
        throw JMAPError("invalidProperties", "rejected after ingest");
    } catch (JMAPError & err) {
        EXPECT_EQ(err.type, "invalidProperties");
    }

    EXPECT_EQ(blobs->count(), 0);
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Blob"), 0);
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Message"), 0);
}

TEST_F(IngestionTest, RollbackKeepsBlobsStoredEarlier) {
    std::string raw = rawMessage("Kept", "kept@example.com");
    std::string blobId = uploadBlob(raw);

    IngestionPipeline pipeline{store, blobs};
    {
        MailStoreTransaction transaction{store, "testIngest"};
        pipeline.ingest(TEST_ACCOUNT_ID, raw);
    }

    EXPECT_TRUE(blobs->exists(blobId));
    EXPECT_EQ(countRows("SELECT COUNT(*) FROM Blob"), 1);
}
