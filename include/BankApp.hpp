#pragma once

#include <boost/di.hpp>
#include <memory>

#include "settings/BankSettings.hpp"
#include "settings/DbSettings.hpp"

// Forward declarations - Ports
namespace bank::ports::input {
    class IAccountService;
}

namespace bank::ports::output {
    class IAccountRepository;
}

namespace bank::adapters::primary {
    class ConsoleMenu;
}

namespace bank {

/**
 * @class BankApp
 * @brief Точка сборки приложения (composition root)
 *
 * Template Method:
 * 1. loadEnvironment() - чтение настроек из ENV
 * 2. configureInjection() - выбор хранилища и настройка Boost.DI
 * 3. bootstrap() - создание стартового счёта, если его нет
 * 4. start() - запуск консольного меню
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: ConsoleMenu
 * - Secondary Adapters: PostgresAccountRepository, InMemoryAccountRepository
 *
 * Хранилище принадлежит BankApp и передаётся в сервис через DI.
 * Соединение с БД закрывается при разрушении BankApp, в том числе
 * при выходе по исключению.
 */
class BankApp {
public:
    BankApp();
    ~BankApp();

    BankApp(const BankApp&) = delete;
    BankApp& operator=(const BankApp&) = delete;

    /**
     * @brief Запустить приложение
     * @throws std::exception при ошибке конфигурации или хранилища на старте
     */
    void run();

private:
    void loadEnvironment();
    void configureInjection();
    void bootstrap();
    void start();

    std::shared_ptr<settings::BankSettings> bankSettings_;
    std::shared_ptr<settings::DbSettings> dbSettings_;

    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<adapters::primary::ConsoleMenu> consoleMenu_;

    std::shared_ptr<ports::output::IAccountRepository> createRepository();
};

} // namespace bank
