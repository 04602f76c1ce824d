#pragma once

#include "enums/AccountError.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cmath>

namespace bank::domain {

/**
 * @brief Банковский счёт
 *
 * Инварианты:
 * - id не пустой и не меняется после создания
 * - balance >= 0 всегда
 *
 * deposit/withdraw сначала полностью проверяют сумму и только потом
 * меняют баланс. При ошибке баланс остаётся прежним.
 *
 * Экземпляр, полученный из репозитория, является отсоединённой копией:
 * изменения не видны в хранилище до явного save().
 */
class Account {
public:
    /**
     * @throws std::invalid_argument если id пустой или баланс < 0
     */
    explicit Account(const std::string& id, double balance = 0.0)
        : id_(id)
        , balance_(balance)
    {
        if (id_.empty()) {
            throw std::invalid_argument("Account id must not be empty");
        }
        if (!std::isfinite(balance_) || balance_ < 0.0) {
            throw std::invalid_argument("Account balance must be a non-negative number: " + id_);
        }
    }

    const std::string& id() const { return id_; }
    double balance() const { return balance_; }

    /**
     * @brief Пополнить счёт
     * @return std::nullopt при успехе, INVALID_AMOUNT если amount <= 0
     *         или баланс после пополнения не помещается в double
     */
    std::optional<AccountError> deposit(double amount) {
        if (!isPositive(amount)) {
            return AccountError::INVALID_AMOUNT;
        }
        // Переполнение до +inf нарушило бы инвариант конечного баланса
        if (!std::isfinite(balance_ + amount)) {
            return AccountError::INVALID_AMOUNT;
        }
        balance_ += amount;
        return std::nullopt;
    }

    /**
     * @brief Снять деньги со счёта
     * @return std::nullopt при успехе, INSUFFICIENT_FUNDS если amount > balance,
     *         INVALID_AMOUNT если amount <= 0
     */
    std::optional<AccountError> withdraw(double amount) {
        if (!isPositive(amount)) {
            return AccountError::INVALID_AMOUNT;
        }
        if (amount > balance_) {
            return AccountError::INSUFFICIENT_FUNDS;
        }
        balance_ -= amount;
        return std::nullopt;
    }

    bool operator==(const Account& other) const {
        return id_ == other.id_ && balance_ == other.balance_;
    }

private:
    std::string id_;
    double balance_;

    // NaN тоже отсекается: сравнение с NaN всегда false
    static bool isPositive(double amount) {
        return std::isfinite(amount) && amount > 0.0;
    }
};

} // namespace bank::domain
