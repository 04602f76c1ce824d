#pragma once

#include <string>

namespace bank::domain {

/**
 * @brief Вид ошибки операции со счётом
 *
 * Доменные ошибки (запрос некорректен) отделены от STORAGE_FAILURE
 * (сломана сама система), чтобы адаптеры могли различать эти случаи.
 */
enum class AccountError {
    ACCOUNT_NOT_FOUND,       ///< Нет записи для данного id
    INVALID_AMOUNT,          ///< Сумма <= 0 или не конечна
    INSUFFICIENT_FUNDS,      ///< Сумма списания больше баланса
    INVALID_ACCOUNT_ID,      ///< Пустой id при открытии счёта
    ACCOUNT_ALREADY_EXISTS,  ///< Счёт с таким id уже открыт
    STORAGE_FAILURE          ///< Ошибка хранилища (I/O, соединение)
};

/**
 * @brief Преобразовать AccountError в строку
 */
inline std::string toString(AccountError error) {
    switch (error) {
        case AccountError::ACCOUNT_NOT_FOUND:      return "ACCOUNT_NOT_FOUND";
        case AccountError::INVALID_AMOUNT:         return "INVALID_AMOUNT";
        case AccountError::INSUFFICIENT_FUNDS:     return "INSUFFICIENT_FUNDS";
        case AccountError::INVALID_ACCOUNT_ID:     return "INVALID_ACCOUNT_ID";
        case AccountError::ACCOUNT_ALREADY_EXISTS: return "ACCOUNT_ALREADY_EXISTS";
        case AccountError::STORAGE_FAILURE:        return "STORAGE_FAILURE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Сообщение для пользователя
 *
 * Для STORAGE_FAILURE текст намеренно общий: детали драйвера
 * пишутся только в лог.
 */
inline std::string describe(AccountError error) {
    switch (error) {
        case AccountError::ACCOUNT_NOT_FOUND:      return "Account not found";
        case AccountError::INVALID_AMOUNT:         return "Amount must be greater than zero";
        case AccountError::INSUFFICIENT_FUNDS:     return "Insufficient funds";
        case AccountError::INVALID_ACCOUNT_ID:     return "Account id must not be empty";
        case AccountError::ACCOUNT_ALREADY_EXISTS: return "Account already exists";
        case AccountError::STORAGE_FAILURE:        return "Storage is unavailable, please try again later";
        default: return "Unknown error";
    }
}

} // namespace bank::domain
