// include/adapters/secondary/persistence/InMemoryAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace bank::adapters::secondary {

/**
 * @brief In-memory реализация хранилища счетов
 *
 * Используется при BANK_STORAGE=memory и в unit-тестах.
 * Данные живут до завершения процесса.
 *
 * Атомарность updateBalance обеспечивает ThreadSafeMap::compute:
 * чтение, изменение и запись идут под одной эксклюзивной блокировкой.
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    InMemoryAccountRepository() {
        ensureSchema();
    }

    void ensureSchema() override {
        // Структура создаётся вместе с объектом
    }

    domain::OperationResult fetch(const std::string& accountId) override {
        auto account = accounts_.find(accountId);
        if (!account) {
            return domain::OperationResult::failure(domain::AccountError::ACCOUNT_NOT_FOUND);
        }
        return domain::OperationResult::success(*account);
    }

    domain::OperationResult save(const domain::Account& account) override {
        accounts_.insert(account.id(), std::make_shared<domain::Account>(account));
        return domain::OperationResult::success(account);
    }

    domain::OperationResult create(const domain::Account& account) override {
        if (!accounts_.insertIfAbsent(account.id(), std::make_shared<domain::Account>(account))) {
            return domain::OperationResult::failure(domain::AccountError::ACCOUNT_ALREADY_EXISTS);
        }
        return domain::OperationResult::success(account);
    }

    domain::OperationResult updateBalance(
        const std::string& accountId,
        const ports::output::BalanceMutation& mutation
    ) override {
        auto result = domain::OperationResult::failure(domain::AccountError::ACCOUNT_NOT_FOUND);

        accounts_.compute(accountId,
            [&](const std::shared_ptr<domain::Account>& current) -> std::shared_ptr<domain::Account> {
                if (!current) {
                    return nullptr;
                }

                // Меняем копию: хранимый снимок остаётся целым при ошибке
                domain::Account updated = *current;
                if (auto error = mutation(updated)) {
                    result = domain::OperationResult::failure(*error);
                    return nullptr;
                }

                result = domain::OperationResult::success(updated);
                return std::make_shared<domain::Account>(updated);
            });

        return result;
    }

    // Test helpers
    size_t size() const {
        return accounts_.size();
    }

    void clear() {
        accounts_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::Account> accounts_;
};

} // namespace bank::adapters::secondary
