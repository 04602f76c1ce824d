// include/adapters/secondary/persistence/PostgresAccountRepository.hpp
#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace bank::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища счетов
 *
 * Таблица: accounts
 * - id TEXT PRIMARY KEY
 * - balance DOUBLE PRECISION NOT NULL DEFAULT 0 CHECK (balance >= 0)
 *
 * Соединение открывается в конструкторе и закрывается в деструкторе.
 * Доступ к соединению внутри процесса сериализуется mutex_, между
 * процессами - блокировкой строки (SELECT ... FOR UPDATE) в updateBalance.
 *
 * Ошибки драйвера пишутся в std::cerr и возвращаются как STORAGE_FAILURE,
 * текст драйвера в OperationResult не попадает.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    /**
     * @throws std::exception если не удалось подключиться или создать таблицу
     */
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Connecting to "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }

        ensureSchema();
    }

    ~PostgresAccountRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
            std::cout << "[PostgresAccountRepository] Connection closed" << std::endl;
        }
    }

    PostgresAccountRepository(const PostgresAccountRepository&) = delete;
    PostgresAccountRepository& operator=(const PostgresAccountRepository&) = delete;

    void ensureSchema() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id TEXT PRIMARY KEY,
                    balance DOUBLE PRECISION NOT NULL DEFAULT 0 CHECK (balance >= 0)
                )
            )");

            txn.commit();
            std::cout << "[PostgresAccountRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] ensureSchema() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::OperationResult fetch(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT id, balance FROM accounts WHERE id = $1",
                accountId
            );

            txn.commit();

            if (result.empty()) {
                return domain::OperationResult::failure(domain::AccountError::ACCOUNT_NOT_FOUND);
            }
            return domain::OperationResult::success(rowToAccount(result[0]));

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] fetch() failed: " << e.what() << std::endl;
            return domain::OperationResult::failure(domain::AccountError::STORAGE_FAILURE);
        }
    }

    domain::OperationResult save(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO accounts (id, balance)
                    VALUES ($1, $2)
                    ON CONFLICT (id) DO UPDATE SET balance = EXCLUDED.balance
                )",
                account.id(),
                account.balance()
            );

            txn.commit();
            std::cout << "[PostgresAccountRepository] Saved account " << account.id()
                      << " balance=" << account.balance() << std::endl;
            return domain::OperationResult::success(account);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] save() failed: " << e.what() << std::endl;
            return domain::OperationResult::failure(domain::AccountError::STORAGE_FAILURE);
        }
    }

    domain::OperationResult create(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO accounts (id, balance)
                    VALUES ($1, $2)
                    ON CONFLICT (id) DO NOTHING
                    RETURNING id
                )",
                account.id(),
                account.balance()
            );

            txn.commit();

            if (result.empty()) {
                return domain::OperationResult::failure(domain::AccountError::ACCOUNT_ALREADY_EXISTS);
            }
            std::cout << "[PostgresAccountRepository] Created account " << account.id() << std::endl;
            return domain::OperationResult::success(account);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] create() failed: " << e.what() << std::endl;
            return domain::OperationResult::failure(domain::AccountError::STORAGE_FAILURE);
        }
    }

    domain::OperationResult updateBalance(
        const std::string& accountId,
        const ports::output::BalanceMutation& mutation
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            // Блокировка строки до commit: параллельный writer ждёт здесь
            auto rows = txn.exec_params(
                "SELECT id, balance FROM accounts WHERE id = $1 FOR UPDATE",
                accountId
            );

            if (rows.empty()) {
                return domain::OperationResult::failure(domain::AccountError::ACCOUNT_NOT_FOUND);
            }

            domain::Account account = rowToAccount(rows[0]);
            if (auto error = mutation(account)) {
                // pqxx::work без commit() откатывается в деструкторе
                return domain::OperationResult::failure(*error);
            }

            txn.exec_params(
                "UPDATE accounts SET balance = $2 WHERE id = $1",
                account.id(),
                account.balance()
            );

            txn.commit();
            std::cout << "[PostgresAccountRepository] Updated account " << account.id()
                      << " balance=" << account.balance() << std::endl;
            return domain::OperationResult::success(account);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] updateBalance() failed: " << e.what() << std::endl;
            return domain::OperationResult::failure(domain::AccountError::STORAGE_FAILURE);
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    // Вызывается под mutex_
    void ensureConnected() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresAccountRepository] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
    }

    domain::Account rowToAccount(const pqxx::row& row) const {
        return domain::Account(
            row["id"].as<std::string>(),
            row["balance"].as<double>()
        );
    }
};

} // namespace bank::adapters::secondary
