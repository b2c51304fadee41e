#include <gtest/gtest.h>
#include "ocrd/credentials.hpp"

using namespace ocrd;

TEST(CredentialsTest, PlaintextPasswordsStillVerify) {
    CredentialStore store(std::vector<UserRecord>{{"admin", "secret"}});
    EXPECT_TRUE(store.verify("admin", "secret"));
    EXPECT_FALSE(store.verify("admin", "Secret"));
    EXPECT_FALSE(store.verify("admin", ""));
}

TEST(CredentialsTest, UnknownUserIsRejected) {
    CredentialStore store(std::vector<UserRecord>{{"admin", "secret"}});
    EXPECT_FALSE(store.verify("nobody", "secret"));
    EXPECT_FALSE(store.contains("nobody"));
    EXPECT_TRUE(store.contains("admin"));
}

TEST(CredentialsTest, HashRoundTripsThroughVerify) {
    std::string hashed = CredentialStore::hash("correct horse");
    EXPECT_EQ(hashed.rfind("$2b$12$", 0), 0u);
    EXPECT_TRUE(CredentialStore::isHash(hashed));

    CredentialStore store({{"alice", hashed}});
    EXPECT_TRUE(store.verify("alice", "correct horse"));
    EXPECT_FALSE(store.verify("alice", "wrong horse"));
    // the hash itself is not a password
    EXPECT_FALSE(store.verify("alice", hashed));
}

TEST(CredentialsTest, HashesAreSalted) {
    EXPECT_NE(CredentialStore::hash("pw"), CredentialStore::hash("pw"));
}

TEST(CredentialsTest, RecognisesModularCryptPrefixes) {
    EXPECT_TRUE(CredentialStore::isHash("$2a$10$x"));
    EXPECT_TRUE(CredentialStore::isHash("$2y$10$x"));
    EXPECT_TRUE(CredentialStore::isHash("$6$salt$x"));
    EXPECT_TRUE(CredentialStore::isHash("$y$j9T$x"));
    EXPECT_FALSE(CredentialStore::isHash("secret"));
    EXPECT_FALSE(CredentialStore::isHash("$1$md5"));
}

TEST(CredentialsTest, BrokenHashNeverVerifies) {
    CredentialStore store(std::vector<UserRecord>{{"eve", "$2b$12$tooShort"}});
    EXPECT_FALSE(store.verify("eve", "anything"));
}

TEST(CredentialsTest, DuplicateUsersKeepFirstEntry) {
    CredentialStore store({{"admin", "first"}, {"admin", "second"}});
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.verify("admin", "first"));
    EXPECT_FALSE(store.verify("admin", "second"));
}
