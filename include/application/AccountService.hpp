#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include <memory>
#include <iostream>
#include <cmath>

namespace bank::application {

/**
 * @brief Сервис операций со счетами
 *
 * Каждая операция изменения - цикл read-modify-write:
 *   fetch(id) -> account.deposit/withdraw(amount) -> save(account)
 *
 * Цикл выполняется через IAccountRepository::updateBalance, поэтому
 * хранилище проводит его одной транзакцией и два параллельных пополнения
 * не теряют друг друга. Проверка суммы остаётся в domain::Account.
 * При любой ошибке сохранение не выполняется.
 */
class AccountService : public ports::input::IAccountService {
public:
    explicit AccountService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo
    ) : accountRepo_(std::move(accountRepo))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::OperationResult openAccount(
        const std::string& accountId,
        double initialBalance = 0.0
    ) override {
        if (accountId.empty()) {
            return domain::OperationResult::failure(domain::AccountError::INVALID_ACCOUNT_ID);
        }
        if (!std::isfinite(initialBalance) || initialBalance < 0.0) {
            return domain::OperationResult::failure(domain::AccountError::INVALID_AMOUNT);
        }

        auto result = accountRepo_->create(domain::Account(accountId, initialBalance));
        if (result.isSuccess()) {
            std::cout << "[AccountService] Opened account: " << accountId
                      << " balance=" << initialBalance << std::endl;
        }
        return result;
    }

    domain::OperationResult deposit(const std::string& accountId, double amount) override {
        return accountRepo_->updateBalance(accountId, [amount](domain::Account& account) {
            return account.deposit(amount);
        });
    }

    domain::OperationResult withdraw(const std::string& accountId, double amount) override {
        return accountRepo_->updateBalance(accountId, [amount](domain::Account& account) {
            return account.withdraw(amount);
        });
    }

    domain::OperationResult getBalance(const std::string& accountId) override {
        return accountRepo_->fetch(accountId);
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
};

} // namespace bank::application
