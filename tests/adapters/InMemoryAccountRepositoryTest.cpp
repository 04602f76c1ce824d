#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"

using namespace bank;
using namespace bank::adapters::secondary;

class InMemoryAccountRepositoryTest : public ::testing::Test {
protected:
    InMemoryAccountRepository repo_;
};

TEST_F(InMemoryAccountRepositoryTest, Fetch_NotFound) {
    auto result = repo_.fetch("99999");

    EXPECT_EQ(result.error, domain::AccountError::ACCOUNT_NOT_FOUND);
    EXPECT_FALSE(result.account.has_value());
}

TEST_F(InMemoryAccountRepositoryTest, SaveThenFetch_SameIdAndBalance) {
    domain::Account account("12345", 100.0);

    ASSERT_TRUE(repo_.save(account).isSuccess());
    auto result = repo_.fetch("12345");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(*result.account, account);
}

TEST_F(InMemoryAccountRepositoryTest, Save_Overwrites) {
    repo_.save(domain::Account("12345", 100.0));
    repo_.save(domain::Account("12345", 7.0));

    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 7.0);
    EXPECT_EQ(repo_.size(), 1u);
}

TEST_F(InMemoryAccountRepositoryTest, Save_Idempotent) {
    domain::Account account("12345", 33.0);

    repo_.save(account);
    repo_.save(account);

    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 33.0);
    EXPECT_EQ(repo_.size(), 1u);
}

TEST_F(InMemoryAccountRepositoryTest, Fetch_ReturnsDetachedSnapshot) {
    repo_.save(domain::Account("12345", 100.0));

    auto snapshot = repo_.fetch("12345");
    ASSERT_TRUE(snapshot.isSuccess());
    snapshot.account->deposit(500.0);

    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 100.0);
}

TEST_F(InMemoryAccountRepositoryTest, Create_OnlyIfAbsent) {
    EXPECT_TRUE(repo_.create(domain::Account("12345", 100.0)).isSuccess());

    auto second = repo_.create(domain::Account("12345", 1.0));

    EXPECT_EQ(second.error, domain::AccountError::ACCOUNT_ALREADY_EXISTS);
    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 100.0);
}

TEST_F(InMemoryAccountRepositoryTest, EnsureSchema_Repeatable) {
    repo_.save(domain::Account("12345", 1.0));

    repo_.ensureSchema();
    repo_.ensureSchema();

    EXPECT_TRUE(repo_.fetch("12345").isSuccess());
}

TEST_F(InMemoryAccountRepositoryTest, UpdateBalance_AppliesMutation) {
    repo_.save(domain::Account("12345", 100.0));

    auto result = repo_.updateBalance("12345", [](domain::Account& account) {
        return account.deposit(25.0);
    });

    ASSERT_TRUE(result.isSuccess());
    EXPECT_DOUBLE_EQ(result.balance(), 125.0);
    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 125.0);
}

TEST_F(InMemoryAccountRepositoryTest, UpdateBalance_FailedMutation_NothingStored) {
    repo_.save(domain::Account("12345", 100.0));

    auto result = repo_.updateBalance("12345", [](domain::Account& account) {
        return account.withdraw(1000.0);
    });

    EXPECT_EQ(result.error, domain::AccountError::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(repo_.fetch("12345").balance(), 100.0);
}

TEST_F(InMemoryAccountRepositoryTest, UpdateBalance_MissingAccount_MutationNotCalled) {
    bool called = false;

    auto result = repo_.updateBalance("99999", [&called](domain::Account&) {
        called = true;
        return std::optional<domain::AccountError>{};
    });

    EXPECT_EQ(result.error, domain::AccountError::ACCOUNT_NOT_FOUND);
    EXPECT_FALSE(called);
    EXPECT_EQ(repo_.size(), 0u);
}
