#pragma once

#include "Account.hpp"
#include "enums/AccountError.hpp"
#include <string>
#include <optional>

namespace bank::domain {

/**
 * @brief Результат операции со счётом
 *
 * Возвращается всеми портами вместо исключений:
 * - успех: error пуст, account содержит снимок счёта после операции
 * - ошибка: error содержит вид ошибки, message - текст для пользователя
 *
 * @example
 * ```cpp
 * auto result = accountService->withdraw("12345", 200.0);
 * if (!result.isSuccess()) {
 *     std::cout << "Error: " << result.message << std::endl;
 * }
 * ```
 */
struct OperationResult {
    std::optional<AccountError> error;   ///< Пусто при успехе
    std::optional<Account> account;      ///< Снимок счёта (при успехе)
    std::string message;                 ///< Сообщение для пользователя

    bool isSuccess() const {
        return !error.has_value();
    }

    /**
     * @brief Баланс из снимка, 0 если операция неуспешна
     */
    double balance() const {
        return account ? account->balance() : 0.0;
    }

    static OperationResult success(const Account& account) {
        OperationResult result;
        result.account = account;
        return result;
    }

    static OperationResult failure(AccountError error) {
        OperationResult result;
        result.error = error;
        result.message = describe(error);
        return result;
    }
};

} // namespace bank::domain
