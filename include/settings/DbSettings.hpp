// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bank::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("BANK_DB_HOST", "localhost");
            port_ = parsePort(getEnvOrDefault("BANK_DB_PORT", "5432"));
            name_ = getEnvOrDefault("BANK_DB_NAME", "bank_db");
            user_ = getEnvOrDefault("BANK_DB_USER", "bank_user");
            password_ = getEnvOrDefault("BANK_DB_PASSWORD", "bank_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        /**
         * @throws std::invalid_argument если порт не число или вне 1..65535
         */
        static int parsePort(const std::string &value)
        {
            size_t parsed = 0;
            int port = 0;
            try {
                port = std::stoi(value, &parsed);
            } catch (const std::exception &) {
                throw std::invalid_argument("BANK_DB_PORT is not a number: " + value);
            }
            if (parsed != value.size() || port <= 0 || port > 65535) {
                throw std::invalid_argument("BANK_DB_PORT is out of range: " + value);
            }
            return port;
        }
    };

} // namespace bank::settings
