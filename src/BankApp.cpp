#include "BankApp.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/AccountBootstrap.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"

// Primary Adapters
#include "adapters/primary/ConsoleMenu.hpp"

#include <iostream>
#include <stdexcept>

namespace di = boost::di;

namespace bank {

BankApp::BankApp()
{
    std::cout << "[BankApp] Application created" << std::endl;
}

BankApp::~BankApp()
{
    // Порядок важен: меню и сервис держат ссылку на хранилище
    consoleMenu_.reset();
    accountService_.reset();
    accountRepo_.reset();
    std::cout << "[BankApp] Application destroyed" << std::endl;
}

void BankApp::run()
{
    loadEnvironment();
    configureInjection();
    bootstrap();
    start();
}

void BankApp::loadEnvironment()
{
    std::cout << "[BankApp] Loading environment..." << std::endl;

    bankSettings_ = std::make_shared<settings::BankSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    std::cout << "[BankApp] Environment loaded successfully" << std::endl;
}

void BankApp::configureInjection()
{
    std::cout << "[BankApp] Configuring Boost.DI injection..." << std::endl;

    accountRepo_ = createRepository();

    // ========================================================================
    // Boost.DI Injector Configuration
    // ========================================================================

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings & Secondary Adapters
        // ====================================================================
        di::bind<settings::BankSettings>().to(bankSettings_),
        di::bind<settings::DbSettings>().to(dbSettings_),

        di::bind<ports::output::IAccountRepository>().to(accountRepo_),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================
        di::bind<ports::input::IAccountService>()
            .to<application::AccountService>()
            .in(di::singleton)
    );

    accountService_ = injector.create<std::shared_ptr<ports::input::IAccountService>>();

    // ========================================================================
    // Layer 3: Primary Adapters
    // ========================================================================
    consoleMenu_ = injector.create<std::shared_ptr<adapters::primary::ConsoleMenu>>();

    std::cout << "[BankApp] DI Injector configured:" << std::endl;
    std::cout << "  ✓ IAccountRepository" << std::endl;
    std::cout << "  ✓ IAccountService" << std::endl;
    std::cout << "  ✓ ConsoleMenu" << std::endl;
}

std::shared_ptr<ports::output::IAccountRepository> BankApp::createRepository()
{
    switch (bankSettings_->getStorageType()) {
        case settings::StorageType::POSTGRES:
            std::cout << "[BankApp] Storage: PostgreSQL" << std::endl;
            return std::make_shared<adapters::secondary::PostgresAccountRepository>(dbSettings_);
        case settings::StorageType::MEMORY:
            std::cout << "[BankApp] Storage: in-memory" << std::endl;
            return std::make_shared<adapters::secondary::InMemoryAccountRepository>();
    }
    throw std::logic_error("Unhandled storage type");
}

void BankApp::bootstrap()
{
    application::ensureSeedAccount(*accountService_,
                                   bankSettings_->getSeedAccountId(),
                                   bankSettings_->getSeedBalance());
}

void BankApp::start()
{
    std::cout << "[BankApp] Starting console menu" << std::endl;
    consoleMenu_->run(std::cin, std::cout);
}

} // namespace bank
