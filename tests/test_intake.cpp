#include <gtest/gtest.h>
#include <regex>
#include <type_traits>
#include <vector>
#include "ocrd/intake.hpp"
#include "ocrd/registry.hpp"
#include "ocrd/workspace.hpp"
#include "test_support.hpp"

using namespace ocrd;
using ocrd::testing::TempDir;
using ocrd::testing::countEntries;
using ocrd::testing::readFile;

static_assert(!std::is_default_constructible<Upload::Key>::value, "uploads are opened through Intake only");

namespace {

class IntakeTest : public ::testing::Test {
protected:
    IntakeTest() : workspace(dir.path()) {
        workspace.ensureRoot();
        settings.maxFileSizeMb = 1;
    }

    Intake makeIntake(bool accept = true) {
        return Intake(settings, workspace, registry, [this, accept](const JobId& id) {
            dispatched.push_back(id);
            return accept;
        });
    }

    std::size_t stagingFiles() const { return countEntries(workspace.root() / ".staging"); }

    TempDir dir;
    Workspace workspace;
    Registry registry;
    UploadSettings settings;
    std::vector<JobId> dispatched;
};

constexpr std::size_t kMiB = 1024 * 1024;

}

TEST_F(IntakeTest, AcceptedUploadIsPersistedQueuedAndDispatched) {
    Intake intake = makeIntake();
    SubmitResult result = intake.submit("scan.pdf", "alice", "%PDF-1.4 data");
    ASSERT_TRUE(result) << result.message;

    auto job = registry.get(result.id);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status, Status::Queued);
    EXPECT_EQ(job->owner, "alice");
    EXPECT_EQ(job->sourceFile, workspace.root() / (result.id + "_scan.pdf"));
    EXPECT_EQ(job->workspace, workspace.root() / result.id);
    EXPECT_EQ(readFile(job->sourceFile), "%PDF-1.4 data");
    EXPECT_EQ(job->createdAt, result.createdAt);

    ASSERT_EQ(dispatched.size(), 1u);
    EXPECT_EQ(dispatched[0], result.id);
    EXPECT_EQ(stagingFiles(), 0u);
}

TEST_F(IntakeTest, ExtensionCheckIsCaseInsensitive) {
    Intake intake = makeIntake();
    EXPECT_TRUE(intake.submit("PHOTO.JPG", "alice", "x"));
    EXPECT_TRUE(intake.submit("scan.Jpeg", "alice", "x"));
    EXPECT_TRUE(intake.submit("page.png", "alice", "x"));
}

TEST_F(IntakeTest, DisallowedExtensionIsRejected) {
    Intake intake = makeIntake();
    for (const char* name : {"virus.exe", "archive.pdf.zip", "pdf", ".pdf", "noext"}) {
        SubmitResult result = intake.submit(name, "alice", "x");
        EXPECT_FALSE(result) << name;
        EXPECT_EQ(result.error, ErrorKind::Validation) << name;
    }
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(dispatched.empty());
    EXPECT_EQ(stagingFiles(), 0u);
}

TEST_F(IntakeTest, ExactlyMaxSizeIsAccepted) {
    Intake intake = makeIntake();
    SubmitResult result = intake.submit("big.pdf", "alice", std::string(kMiB, 'a'));
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(std::filesystem::file_size(registry.get(result.id)->sourceFile), kMiB);
}

TEST_F(IntakeTest, OneByteOverMaxIsTooLarge) {
    Intake intake = makeIntake();
    SubmitResult result = intake.submit("big.pdf", "alice", std::string(kMiB + 1, 'a'));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::PayloadTooLarge);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(stagingFiles(), 0u);
    // only the staging directory remains
    EXPECT_EQ(countEntries(workspace.root()), 1u);
}

TEST_F(IntakeTest, StreamedChunksCountTowardsLimit) {
    Intake intake = makeIntake();
    SubmitResult rejected;
    auto upload = intake.open("scan.pdf", "alice", rejected);
    ASSERT_TRUE(upload);

    std::string chunk(256 * 1024, 'b');
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(upload->append(chunk.data(), chunk.size()));
    }
    EXPECT_FALSE(upload->append("!", 1));
    EXPECT_TRUE(upload->exceeded());
    EXPECT_EQ(stagingFiles(), 0u);

    SubmitResult result = intake.commit(*upload);
    EXPECT_EQ(result.error, ErrorKind::PayloadTooLarge);
}

TEST_F(IntakeTest, AbandonedUploadLeavesNoStagingFile) {
    Intake intake = makeIntake();
    {
        SubmitResult rejected;
        auto upload = intake.open("scan.pdf", "alice", rejected);
        ASSERT_TRUE(upload);
        ASSERT_TRUE(upload->append("partial", 7));
        EXPECT_EQ(stagingFiles(), 1u);
    }
    EXPECT_EQ(stagingFiles(), 0u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(IntakeTest, RefusedDispatchRollsBack) {
    Intake intake = makeIntake(false);
    SubmitResult result = intake.submit("scan.pdf", "alice", "data");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, ErrorKind::Unavailable);
    ASSERT_EQ(dispatched.size(), 1u);
    EXPECT_FALSE(registry.contains(dispatched[0]));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(countEntries(workspace.root()), 1u);
}

TEST_F(IntakeTest, ClientPathsAreReducedToFileName) {
    Intake intake = makeIntake();
    SubmitResult result = intake.submit("../../etc/evil.pdf", "alice", "x");
    ASSERT_TRUE(result);
    auto job = registry.get(result.id);
    EXPECT_EQ(job->sourceFile.parent_path(), workspace.root());
    EXPECT_EQ(job->sourceFile.filename().string(), result.id + "_evil.pdf");
}

TEST_F(IntakeTest, UnusableNamesAreRejected) {
    Intake intake = makeIntake();
    EXPECT_EQ(intake.submit("", "alice", "x").error, ErrorKind::Validation);
    EXPECT_EQ(intake.submit("dir/", "alice", "x").error, ErrorKind::Validation);
    EXPECT_EQ(intake.submit("..", "alice", "x").error, ErrorKind::Validation);
}

TEST(IntakeHelpersTest, SanitizeFilename) {
    EXPECT_EQ(Intake::sanitizeFilename("scan.pdf"), "scan.pdf");
    EXPECT_EQ(Intake::sanitizeFilename("/tmp/a/scan.pdf"), "scan.pdf");
    EXPECT_EQ(Intake::sanitizeFilename("C:\\Users\\me\\scan.pdf"), "scan.pdf");
    EXPECT_EQ(Intake::sanitizeFilename(".."), "");
    EXPECT_EQ(Intake::sanitizeFilename("bad\nname.pdf"), "");
}

TEST(IntakeHelpersTest, GeneratedIdsAreUuidV4) {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    JobId a = Intake::generateId();
    JobId b = Intake::generateId();
    EXPECT_TRUE(std::regex_match(a, uuid)) << a;
    EXPECT_NE(a, b);
}
