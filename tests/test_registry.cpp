#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "ocrd/registry.hpp"

using namespace ocrd;

namespace {

Job queuedJob(const JobId& id, const std::string& owner = "alice") {
    Job job;
    job.id = id;
    job.owner = owner;
    job.sourceFile = "/work/" + id + "_scan.pdf";
    job.workspace = "/work/" + id;
    job.createdAt = std::chrono::system_clock::now();
    return job;
}

}

TEST(RegistryTest, InsertAndSnapshot) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));

    auto job = registry.get("a");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status, Status::Queued);
    EXPECT_EQ(job->owner, "alice");
    EXPECT_TRUE(registry.contains("a"));
    EXPECT_FALSE(registry.get("missing"));
}

TEST(RegistryTest, DuplicateIdIsRejected) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a", "alice")));
    EXPECT_FALSE(registry.insert(queuedJob("a", "bob")));
    EXPECT_EQ(registry.get("a")->owner, "alice");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, HappyPathTransitions) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    ASSERT_TRUE(registry.beginProcessing("a"));
    EXPECT_EQ(registry.get("a")->status, Status::Processing);

    ASSERT_TRUE(registry.complete("a", "# text", "/work/a/markdown/x.md"));
    auto job = registry.get("a");
    EXPECT_EQ(job->status, Status::Completed);
    EXPECT_EQ(job->resultText, "# text");
    EXPECT_EQ(job->resultPath, std::filesystem::path("/work/a/markdown/x.md"));
    EXPECT_TRUE(job->error.empty());
}

TEST(RegistryTest, NoRegressionOutOfTerminalStates) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    ASSERT_TRUE(registry.beginProcessing("a"));
    ASSERT_TRUE(registry.fail("a", "boom"));

    EXPECT_FALSE(registry.beginProcessing("a"));
    EXPECT_FALSE(registry.complete("a", "text", "/x.md"));
    EXPECT_FALSE(registry.fail("a", "again"));

    auto job = registry.get("a");
    EXPECT_EQ(job->status, Status::Failed);
    EXPECT_EQ(job->error, "boom");
    EXPECT_TRUE(job->resultText.empty());
}

TEST(RegistryTest, CannotSkipProcessing) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    EXPECT_FALSE(registry.complete("a", "text", "/x.md"));
    EXPECT_FALSE(registry.fail("a", "boom"));
    EXPECT_EQ(registry.get("a")->status, Status::Queued);
}

TEST(RegistryTest, EmptyFailureMessageIsReplaced) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    ASSERT_TRUE(registry.beginProcessing("a"));
    ASSERT_TRUE(registry.fail("a", ""));
    EXPECT_FALSE(registry.get("a")->error.empty());
}

TEST(RegistryTest, EraseOnlyQueuedJobs) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    ASSERT_TRUE(registry.insert(queuedJob("b")));
    ASSERT_TRUE(registry.beginProcessing("b"));

    EXPECT_TRUE(registry.erase("a"));
    EXPECT_FALSE(registry.contains("a"));
    EXPECT_FALSE(registry.erase("b"));
    EXPECT_FALSE(registry.erase("missing"));
}

TEST(RegistryTest, SnapshotsAreCopies) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("a")));
    auto before = registry.get("a");
    ASSERT_TRUE(registry.beginProcessing("a"));
    EXPECT_EQ(before->status, Status::Queued);
}

TEST(RegistryTest, CountsByStatus) {
    Registry registry;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(registry.insert(queuedJob("job" + std::to_string(i))));
    }
    ASSERT_TRUE(registry.beginProcessing("job0"));
    ASSERT_TRUE(registry.beginProcessing("job1"));
    ASSERT_TRUE(registry.complete("job1", "t", "/t.md"));

    EXPECT_EQ(registry.count(Status::Queued), 3u);
    EXPECT_EQ(registry.count(Status::Processing), 1u);
    EXPECT_EQ(registry.count(Status::Completed), 1u);
    EXPECT_EQ(registry.count(Status::Failed), 0u);
}

TEST(RegistryTest, ConcurrentClaimsSucceedOnce) {
    Registry registry;
    ASSERT_TRUE(registry.insert(queuedJob("contested")));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (registry.beginProcessing("contested")) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST(RegistryTest, ParallelUpdatesOnDistinctJobs) {
    Registry registry;
    constexpr int kJobs = 64;
    for (int i = 0; i < kJobs; ++i) {
        ASSERT_TRUE(registry.insert(queuedJob("job" + std::to_string(i))));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = t; i < kJobs; i += 4) {
                JobId id = "job" + std::to_string(i);
                if (registry.beginProcessing(id)) {
                    (void)registry.complete(id, "text " + id, "/r.md");
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(registry.count(Status::Completed), static_cast<std::size_t>(kJobs));
    EXPECT_EQ(registry.get("job17")->resultText, "text job17");
}

TEST(StatusTest, NamesAndProgress) {
    EXPECT_STREQ(toString(Status::Queued), "queued");
    EXPECT_STREQ(toString(Status::Processing), "processing");
    EXPECT_STREQ(toString(Status::Completed), "completed");
    EXPECT_STREQ(toString(Status::Failed), "failed");

    EXPECT_DOUBLE_EQ(progressOf(Status::Queued), 0.0);
    EXPECT_DOUBLE_EQ(progressOf(Status::Processing), 0.5);
    EXPECT_DOUBLE_EQ(progressOf(Status::Completed), 1.0);
    EXPECT_DOUBLE_EQ(progressOf(Status::Failed), 0.0);

    EXPECT_TRUE(isTerminal(Status::Completed));
    EXPECT_TRUE(isTerminal(Status::Failed));
    EXPECT_FALSE(isTerminal(Status::Processing));
}

TEST(StatusTest, TimestampFormat) {
    std::string ts = formatTimestamp(std::chrono::system_clock::now());
    // 2025-03-01T10:15:30.123456
    ASSERT_EQ(ts.size(), 26u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
}
