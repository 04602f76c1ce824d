#include <gtest/gtest.h>

#include "domain/Account.hpp"
#include "domain/OperationResult.hpp"
#include <limits>

using namespace bank::domain;

// ============================================
// CONSTRUCTION
// ============================================

TEST(AccountTest, Create_DefaultBalanceIsZero) {
    Account account("12345");

    EXPECT_EQ(account.id(), "12345");
    EXPECT_DOUBLE_EQ(account.balance(), 0.0);
}

TEST(AccountTest, Create_WithInitialBalance) {
    Account account("12345", 100.0);
    EXPECT_DOUBLE_EQ(account.balance(), 100.0);
}

TEST(AccountTest, Create_EmptyId_Throws) {
    EXPECT_THROW(Account("", 10.0), std::invalid_argument);
}

TEST(AccountTest, Create_NegativeBalance_Throws) {
    EXPECT_THROW(Account("12345", -0.01), std::invalid_argument);
}

TEST(AccountTest, Create_NanBalance_Throws) {
    EXPECT_THROW(Account("12345", std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

// ============================================
// DEPOSIT
// ============================================

TEST(AccountTest, Deposit_PositiveAmount_IncreasesBalance) {
    Account account("12345", 100.0);

    auto error = account.deposit(50.0);

    EXPECT_FALSE(error.has_value());
    EXPECT_DOUBLE_EQ(account.balance(), 150.0);
}

TEST(AccountTest, Deposit_VariousAmounts_AddsExactly) {
    for (double amount : {0.01, 1.0, 99.5, 1e6}) {
        Account account("acc", 10.0);
        ASSERT_FALSE(account.deposit(amount).has_value()) << "amount=" << amount;
        EXPECT_DOUBLE_EQ(account.balance(), 10.0 + amount);
    }
}

TEST(AccountTest, Deposit_NonPositiveAmount_RejectedWithoutChange) {
    for (double amount : {0.0, -0.0, -1.0, -100.0}) {
        Account account("12345", 100.0);

        auto error = account.deposit(amount);

        ASSERT_TRUE(error.has_value()) << "amount=" << amount;
        EXPECT_EQ(*error, AccountError::INVALID_AMOUNT);
        EXPECT_DOUBLE_EQ(account.balance(), 100.0);
    }
}

TEST(AccountTest, Deposit_NonFiniteAmount_Rejected) {
    Account account("12345", 100.0);

    EXPECT_EQ(account.deposit(std::numeric_limits<double>::quiet_NaN()), AccountError::INVALID_AMOUNT);
    EXPECT_EQ(account.deposit(std::numeric_limits<double>::infinity()), AccountError::INVALID_AMOUNT);
    EXPECT_DOUBLE_EQ(account.balance(), 100.0);
}

TEST(AccountTest, Deposit_OverflowToInfinity_RejectedWithoutChange) {
    Account account("big", 1e308);

    auto error = account.deposit(1e308);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(*error, AccountError::INVALID_AMOUNT);
    EXPECT_DOUBLE_EQ(account.balance(), 1e308);
    EXPECT_NO_THROW(Account("big", account.balance()));
}

// ============================================
// WITHDRAW
// ============================================

TEST(AccountTest, Withdraw_WithinBalance_DecreasesBalance) {
    Account account("12345", 150.0);

    auto error = account.withdraw(50.0);

    EXPECT_FALSE(error.has_value());
    EXPECT_DOUBLE_EQ(account.balance(), 100.0);
}

TEST(AccountTest, Withdraw_EntireBalance_LeavesZero) {
    Account account("12345", 150.0);

    EXPECT_FALSE(account.withdraw(150.0).has_value());
    EXPECT_DOUBLE_EQ(account.balance(), 0.0);
}

TEST(AccountTest, Withdraw_MoreThanBalance_RejectedWithoutChange) {
    Account account("12345", 150.0);

    auto error = account.withdraw(200.0);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(*error, AccountError::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(account.balance(), 150.0);
}

TEST(AccountTest, Withdraw_FromEmptyAccount_InsufficientFunds) {
    Account account("12345");
    EXPECT_EQ(account.withdraw(0.01), AccountError::INSUFFICIENT_FUNDS);
}

TEST(AccountTest, Withdraw_NonPositiveAmount_RejectedWithoutChange) {
    Account account("12345", 100.0);

    EXPECT_EQ(account.withdraw(0.0), AccountError::INVALID_AMOUNT);
    EXPECT_EQ(account.withdraw(-10.0), AccountError::INVALID_AMOUNT);
    EXPECT_EQ(account.withdraw(std::numeric_limits<double>::quiet_NaN()), AccountError::INVALID_AMOUNT);
    EXPECT_DOUBLE_EQ(account.balance(), 100.0);
}

// ============================================
// RESULT / ERROR TEXT
// ============================================

TEST(OperationResultTest, Success_CarriesSnapshot) {
    auto result = OperationResult::success(Account("12345", 42.0));

    EXPECT_TRUE(result.isSuccess());
    ASSERT_TRUE(result.account.has_value());
    EXPECT_EQ(result.account->id(), "12345");
    EXPECT_DOUBLE_EQ(result.balance(), 42.0);
    EXPECT_TRUE(result.message.empty());
}

TEST(OperationResultTest, Failure_CarriesKindAndMessage) {
    auto result = OperationResult::failure(AccountError::INSUFFICIENT_FUNDS);

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, AccountError::INSUFFICIENT_FUNDS);
    EXPECT_FALSE(result.account.has_value());
    EXPECT_EQ(result.message, "Insufficient funds");
}

TEST(OperationResultTest, StorageFailure_MessageIsGeneric) {
    auto result = OperationResult::failure(AccountError::STORAGE_FAILURE);
    EXPECT_EQ(result.message, "Storage is unavailable, please try again later");
    EXPECT_EQ(toString(AccountError::STORAGE_FAILURE), "STORAGE_FAILURE");
}
