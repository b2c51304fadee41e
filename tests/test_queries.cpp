#include <gtest/gtest.h>
#include "ocrd/queries.hpp"
#include "ocrd/registry.hpp"

using namespace ocrd;

namespace {

class QueriesTest : public ::testing::Test {
protected:
    QueriesTest() : queries(registry) {
        Job job;
        job.id = "job-1";
        job.owner = "alice";
        job.sourceFile = "/work/job-1_scan.pdf";
        job.workspace = "/work/job-1";
        job.createdAt = std::chrono::system_clock::now();
        EXPECT_TRUE(registry.insert(job));
    }

    Registry registry;
    Queries queries;
};

}

TEST_F(QueriesTest, OwnerSeesStatus) {
    Lookup lookup = queries.status("job-1", "alice");
    ASSERT_TRUE(lookup);
    EXPECT_EQ(lookup.job.status, Status::Queued);
    EXPECT_EQ(lookup.job.id, "job-1");
}

TEST_F(QueriesTest, UnknownJobIsNotFound) {
    EXPECT_EQ(queries.status("nope", "alice").error, ErrorKind::NotFound);
    EXPECT_EQ(queries.result("nope", "alice").error, ErrorKind::NotFound);
}

TEST_F(QueriesTest, OtherUsersAreForbidden) {
    EXPECT_EQ(queries.status("job-1", "bob").error, ErrorKind::Forbidden);
    EXPECT_EQ(queries.result("job-1", "bob").error, ErrorKind::Forbidden);
}

TEST_F(QueriesTest, ResultBeforeCompletionIsInvalidState) {
    Lookup lookup = queries.result("job-1", "alice");
    EXPECT_FALSE(lookup);
    EXPECT_EQ(lookup.error, ErrorKind::InvalidState);
    EXPECT_NE(lookup.message.find("queued"), std::string::npos);

    ASSERT_TRUE(registry.beginProcessing("job-1"));
    lookup = queries.result("job-1", "alice");
    EXPECT_EQ(lookup.error, ErrorKind::InvalidState);
    EXPECT_NE(lookup.message.find("processing"), std::string::npos);
}

TEST_F(QueriesTest, FailedJobHasNoResult) {
    ASSERT_TRUE(registry.beginProcessing("job-1"));
    ASSERT_TRUE(registry.fail("job-1", "pipeline exited with code 1"));

    Lookup status = queries.status("job-1", "alice");
    ASSERT_TRUE(status);
    EXPECT_EQ(status.job.status, Status::Failed);
    EXPECT_EQ(status.job.error, "pipeline exited with code 1");
    EXPECT_EQ(queries.result("job-1", "alice").error, ErrorKind::InvalidState);
}

TEST_F(QueriesTest, CompletedJobReturnsTextRepeatedly) {
    ASSERT_TRUE(registry.beginProcessing("job-1"));
    ASSERT_TRUE(registry.complete("job-1", "# Hello", "/work/job-1/markdown/scan.md"));

    Lookup first = queries.result("job-1", "alice");
    Lookup second = queries.result("job-1", "alice");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.job.resultText, "# Hello");
    EXPECT_EQ(second.job.resultText, first.job.resultText);
    EXPECT_EQ(second.job.resultPath, first.job.resultPath);
    EXPECT_EQ(registry.get("job-1")->status, Status::Completed);
}

TEST_F(QueriesTest, CompletedWithoutTextIsNotFound) {
    ASSERT_TRUE(registry.beginProcessing("job-1"));
    ASSERT_TRUE(registry.complete("job-1", "", "/work/job-1/markdown/scan.md"));
    EXPECT_EQ(queries.result("job-1", "alice").error, ErrorKind::NotFound);
}

TEST(ErrorKindTest, HttpMapping) {
    EXPECT_EQ(httpStatus(ErrorKind::Validation), 400);
    EXPECT_EQ(httpStatus(ErrorKind::Authentication), 401);
    EXPECT_EQ(httpStatus(ErrorKind::Forbidden), 403);
    EXPECT_EQ(httpStatus(ErrorKind::NotFound), 404);
    EXPECT_EQ(httpStatus(ErrorKind::PayloadTooLarge), 413);
    EXPECT_EQ(httpStatus(ErrorKind::InvalidState), 400);
    EXPECT_EQ(httpStatus(ErrorKind::Unavailable), 503);
    EXPECT_EQ(httpStatus(ErrorKind::Internal), 500);
    EXPECT_STREQ(reasonOf(ErrorKind::Forbidden), "forbidden");
    EXPECT_STREQ(reasonOf(ErrorKind::PayloadTooLarge), "payload_too_large");
}
