#include <gtest/gtest.h>

#include "mailjmap/jmap_error.hpp"
#include "mailjmap/sync_exception.hpp"

TEST(ExceptionsTest, JMAPErrorStatusAndBody) {
    JMAPError invalid{"invalidArguments", "bad", {"accountId"}};
    EXPECT_EQ(invalid.httpStatus(), 400);
    EXPECT_EQ(invalid.toJSON()["properties"], nlohmann::json::array({"accountId"}));
    EXPECT_STREQ(invalid.what(), "bad");

    JMAPError duplicate{"alreadyExists"};
    EXPECT_EQ(duplicate.httpStatus(), 409);
    EXPECT_FALSE(duplicate.toJSON().count("description"));
    EXPECT_STREQ(duplicate.what(), "alreadyExists");

    EXPECT_EQ(JMAPError("accountNotFound").httpStatus(), 404);
}

TEST(ExceptionsTest, SyncExceptionStatus) {
    EXPECT_EQ(SyncException("invalid-base64", "", false).httpStatus(), 400);
    EXPECT_EQ(SyncException("ses-throttled", "", true).httpStatus(), 503);
    EXPECT_EQ(SyncException("disk", "", false).httpStatus(), 500);

    SyncException timeout{CURLE_OPERATION_TIMEDOUT, "https://email.us-east-1.amazonaws.com"};
    EXPECT_TRUE(timeout.isRetryable());
    EXPECT_EQ(timeout.toJSON()["debuginfo"], "https://email.us-east-1.amazonaws.com");
    EXPECT_FALSE(SyncException(CURLE_URL_MALFORMAT, "").isRetryable());
}
