#include "MailJMAPTestFixture.hpp"

#include "mailjmap/mail_utils.hpp"
#include "mailjmap/jmap/blob_endpoints.hpp"

class BlobEndpointsTest : public MailJMAPTest {
protected:
    BlobEndpoints * endpoints;

    void SetUp() override {
        MailJMAPTest::SetUp();
        endpoints = new BlobEndpoints(store, blobs, &config);
    }

    void TearDown() override {
        delete endpoints;
        MailJMAPTest::TearDown();
    }
};

TEST_F(BlobEndpointsTest, UploadStoresBlobAndGrantsAccount) {
    EndpointResponse response = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "hello blob");
    ASSERT_EQ(response.status, 201) << response.body.dump();
    EXPECT_EQ(response.body["accountId"], TEST_ACCOUNT_ID);
    EXPECT_EQ(response.body["type"], "text/plain");
    EXPECT_EQ(response.body["size"], 10);

    std::string blobId = response.body["blobId"];
    EXPECT_TRUE(MailUtils::isBlobId(blobId));
    EXPECT_TRUE(blobs->exists(blobId));

    EndpointResponse again = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "", "hello blob");
    EXPECT_EQ(again.body["blobId"], blobId);
    EXPECT_EQ(again.body["type"], "application/octet-stream");
    EXPECT_EQ(blobs->count(), 1);
}

TEST_F(BlobEndpointsTest, UploadRejectsBadRequests) {
    EXPECT_EQ(endpoints->upload(TEST_ACCOUNT_ID, "acct-2", "text/plain", "x").status, 403);
    EXPECT_EQ(endpoints->upload(TEST_ACCOUNT_ID, "bad/account", "text/plain", "x").status, 400);
    EXPECT_EQ(endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "").status, 400);

    config.maxSizeUpload = 4;
    EndpointResponse tooLarge = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "12345");
    EXPECT_EQ(tooLarge.status, 413);
    EXPECT_EQ(blobs->count(), 0);
}

TEST_F(BlobEndpointsTest, DownloadRequiresGrant) {
    std::string blobId = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "secret").body["blobId"];

    EXPECT_EQ(endpoints->download("acct-2", "acct-2", blobId, "file.txt", "", "").status, 404);
    EXPECT_EQ(endpoints->download("acct-2", TEST_ACCOUNT_ID, blobId, "file.txt", "", "").status, 403);
}

TEST_F(BlobEndpointsTest, DownloadReturnsBytesAndHeaders) {
    std::string blobId = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "report body").body["blobId"];

    EndpointResponse response = endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "Q1 report.txt", "", "text/plain");
    ASSERT_EQ(response.status, 200) << response.body.dump();
    EXPECT_TRUE(response.hasData);
    EXPECT_EQ(response.data, "report body");
    EXPECT_EQ(response.headers["Content-Type"], "text/plain");
    EXPECT_EQ(response.headers["ETag"], "\"" + blobId + "\"");
    EXPECT_EQ(response.headers["Cache-Control"], "private, max-age=0, must-revalidate");
    EXPECT_EQ(response.headers["X-Content-Type-Options"], "nosniff");
    EXPECT_EQ(response.headers["Content-Disposition"], "attachment; filename=\"" + MailUtils::urlEncode("Q1 report.txt") + "\"");

    EndpointResponse untyped = endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "raw", "", "");
    EXPECT_EQ(untyped.headers["Content-Type"], "application/octet-stream");
}

TEST_F(BlobEndpointsTest, DownloadHonorsIfNoneMatch) {
    std::string blobId = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "cached").body["blobId"];
    std::string etag = "\"" + blobId + "\"";

    EndpointResponse matched = endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "a.txt", "\"other\", " + etag, "");
    EXPECT_EQ(matched.status, 304);
    EXPECT_FALSE(matched.hasData);
    EXPECT_EQ(matched.headers["ETag"], etag);

    EXPECT_EQ(endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "a.txt", "*", "").status, 304);
    EXPECT_EQ(endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "a.txt", "\"other\"", "").status, 200);
}

TEST_F(BlobEndpointsTest, DownloadRejectsInvalidPaths) {
    std::string blobId = endpoints->upload(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "text/plain", "x").body["blobId"];

    EXPECT_EQ(endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, "not-a-sha", "a.txt", "", "").status, 400);
    EXPECT_EQ(endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "../etc/passwd", "", "").status, 400);
    EXPECT_EQ(endpoints->download(TEST_ACCOUNT_ID, TEST_ACCOUNT_ID, blobId, "", "", "").status, 400);
}
