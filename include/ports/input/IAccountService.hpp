#pragma once

#include "domain/OperationResult.hpp"
#include <string>

namespace bank::ports::input {

/**
 * @brief Интерфейс сервиса операций со счетами
 *
 * Используется primary адаптерами (консольное меню).
 * Каждая операция возвращает снимок счёта после изменения,
 * так что адаптеру не нужно перечитывать баланс.
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт с начальным балансом
     */
    virtual domain::OperationResult openAccount(
        const std::string& accountId,
        double initialBalance = 0.0
    ) = 0;

    /**
     * @brief Пополнить счёт
     */
    virtual domain::OperationResult deposit(const std::string& accountId, double amount) = 0;

    /**
     * @brief Снять деньги со счёта
     */
    virtual domain::OperationResult withdraw(const std::string& accountId, double amount) = 0;

    /**
     * @brief Получить текущий баланс
     */
    virtual domain::OperationResult getBalance(const std::string& accountId) = 0;
};

} // namespace bank::ports::input
