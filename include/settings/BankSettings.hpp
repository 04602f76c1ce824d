// include/settings/BankSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <cmath>
#include <stdexcept>

namespace bank::settings
{

    /**
     * @brief Тип хранилища счетов
     */
    enum class StorageType
    {
        POSTGRES,   ///< PostgreSQL (по умолчанию)
        MEMORY      ///< In-memory, данные теряются при выходе
    };

    /**
     * @brief Преобразовать строку в StorageType
     * @throws std::invalid_argument если строка не распознана
     */
    inline StorageType parseStorageType(const std::string &str)
    {
        if (str == "POSTGRES" || str == "postgres") return StorageType::POSTGRES;
        if (str == "MEMORY" || str == "memory")     return StorageType::MEMORY;
        throw std::invalid_argument("Unknown storage type: " + str);
    }

    /**
     * @brief Настройки приложения из ENV
     *
     * - BANK_STORAGE: postgres | memory
     * - BANK_SEED_ACCOUNT_ID / BANK_SEED_BALANCE: счёт, который создаётся
     *   при старте, если его ещё нет
     */
    class BankSettings
    {
    public:
        BankSettings()
        {
            storageType_ = parseStorageType(getEnvOrDefault("BANK_STORAGE", "postgres"));
            seedAccountId_ = getEnvOrDefault("BANK_SEED_ACCOUNT_ID", "12345");
            seedBalance_ = parseBalance(getEnvOrDefault("BANK_SEED_BALANCE", "100.0"));
        }

        StorageType getStorageType() const { return storageType_; }
        std::string getSeedAccountId() const { return seedAccountId_; }
        double getSeedBalance() const { return seedBalance_; }

    private:
        StorageType storageType_;
        std::string seedAccountId_;
        double seedBalance_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        /**
         * @throws std::invalid_argument если значение не число или < 0
         */
        static double parseBalance(const std::string &value)
        {
            size_t parsed = 0;
            double balance = 0.0;
            try {
                balance = std::stod(value, &parsed);
            } catch (const std::exception &) {
                throw std::invalid_argument("BANK_SEED_BALANCE is not a number: " + value);
            }
            if (parsed != value.size() || !std::isfinite(balance) || balance < 0.0) {
                throw std::invalid_argument("BANK_SEED_BALANCE must be a non-negative number: " + value);
            }
            return balance;
        }
    };

} // namespace bank::settings
