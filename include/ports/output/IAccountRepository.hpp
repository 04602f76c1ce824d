#pragma once

#include "domain/Account.hpp"
#include "domain/OperationResult.hpp"
#include <string>
#include <optional>
#include <functional>

namespace bank::ports::output {

/**
 * @brief Изменение баланса внутри атомарной операции
 *
 * Получает отсоединённую копию счёта и меняет её.
 * Возвращает std::nullopt при успехе или вид ошибки.
 * Выполняется под блокировкой хранилища: mutation не должна вызывать
 * методы репозитория, иначе поток заблокирует сам себя.
 */
using BalanceMutation = std::function<std::optional<domain::AccountError>(domain::Account&)>;

/**
 * @brief Интерфейс хранилища счетов
 *
 * Хранит для каждого id только текущий баланс (без истории).
 * Все методы сообщают об ошибках через OperationResult,
 * ошибки драйвера превращаются в STORAGE_FAILURE.
 *
 * @example
 * ```cpp
 * // Атомарное пополнение: fetch -> deposit -> save в одной транзакции
 * auto result = accountRepo->updateBalance(accountId, [amount](domain::Account& account) {
 *     return account.deposit(amount);
 * });
 * ```
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Создать структуру хранения, если её нет
     *
     * Вызывается из конструктора реализации. Повторный вызов безопасен.
     */
    virtual void ensureSchema() = 0;

    /**
     * @brief Получить снимок счёта
     * @return ACCOUNT_NOT_FOUND если записи нет
     */
    virtual domain::OperationResult fetch(const std::string& accountId) = 0;

    /**
     * @brief Сохранить счёт (insert-or-replace одним запросом)
     */
    virtual domain::OperationResult save(const domain::Account& account) = 0;

    /**
     * @brief Создать счёт, только если id свободен
     * @return ACCOUNT_ALREADY_EXISTS если запись уже есть
     */
    virtual domain::OperationResult create(const domain::Account& account) = 0;

    /**
     * @brief Атомарно прочитать, изменить и сохранить баланс
     *
     * Если mutation вернула ошибку, хранилище не меняется.
     * Параллельные вызовы для одного id сериализуются.
     */
    virtual domain::OperationResult updateBalance(
        const std::string& accountId,
        const BalanceMutation& mutation
    ) = 0;
};

} // namespace bank::ports::output
