#include <gtest/gtest.h>

#include "mailjmap/aws_sigv4.hpp"
#include "mailjmap/mail_utils.hpp"
#include "mailjmap/sync_exception.hpp"

static std::string hex(const std::string & bytes) {
    return MailUtils::toHex(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size());
}

TEST(AwsSigV4Test, HmacMatchesKnownVector) {
    EXPECT_EQ(hex(AwsSigV4::hmacSha256("Jefe", "what do ya want for nothing?")), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(AwsSigV4Test, DerivesSigningKey) {
    std::string kDate = AwsSigV4::hmacSha256("AWS4wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", "20120215");
    std::string kRegion = AwsSigV4::hmacSha256(kDate, "us-east-1");
    std::string kService = AwsSigV4::hmacSha256(kRegion, "iam");
    std::string kSigning = AwsSigV4::hmacSha256(kService, "aws4_request");
    EXPECT_EQ(hex(kSigning), "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
}

TEST(AwsSigV4Test, SplitsURL) {
    std::string host;
    std::string path;
    AwsSigV4::splitURL("https://email.us-east-1.amazonaws.com/v2/email/outbound-emails?x=1", host, path);
    EXPECT_EQ(host, "email.us-east-1.amazonaws.com");
    EXPECT_EQ(path, "/v2/email/outbound-emails");

    AwsSigV4::splitURL("http://localhost:4566", host, path);
    EXPECT_EQ(host, "localhost:4566");
    EXPECT_EQ(path, "/");

    EXPECT_THROW(AwsSigV4::splitURL("not a url", host, path), SyncException);
}

TEST(AwsSigV4Test, SignsRequestHeaders) {
    AwsCredentials credentials{"AKIDEXAMPLE", "secret", "eu-west-1", "ses"};
    time_t now = 1700000000; // 2023-11-14T22:13:20Z
    std::string body = "{\"Content\":{}}";
    auto headers = AwsSigV4::sign("post", "https://email.eu-west-1.amazonaws.com/v2/email/outbound-emails", body, credentials, now);

    EXPECT_EQ(headers["host"], "email.eu-west-1.amazonaws.com");
    EXPECT_EQ(headers["x-amz-date"], "20231114T221320Z");
    EXPECT_EQ(headers["x-amz-content-sha256"], MailUtils::sha256Hex(body));
    EXPECT_EQ(headers["content-type"], "application/json");

    std::string auth = headers["authorization"];
    EXPECT_EQ(auth.find("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20231114/eu-west-1/ses/aws4_request, SignedHeaders=content-type;host;x-amz-date, Signature="), 0u);
    std::string signature = auth.substr(auth.find("Signature=") + 10);
    EXPECT_EQ(signature.size(), 64u);

    auto again = AwsSigV4::sign("POST", "https://email.eu-west-1.amazonaws.com/v2/email/outbound-emails", body, credentials, now);
    EXPECT_EQ(again["authorization"], auth);

    auto otherBody = AwsSigV4::sign("POST", "https://email.eu-west-1.amazonaws.com/v2/email/outbound-emails", body + " ", credentials, now);
    EXPECT_NE(otherBody["authorization"], auth);
}

TEST(AwsSigV4Test, EmptyPayloadHash) {
    EXPECT_EQ(MailUtils::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
