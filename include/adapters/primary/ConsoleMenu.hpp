#pragma once

#include "ports/input/IAccountService.hpp"
#include <memory>
#include <optional>
#include <istream>
#include <ostream>
#include <string>

namespace bank::adapters::primary {

/**
 * @brief Текстовое меню поверх IAccountService
 *
 * Только собирает id счёта и сумму, вызывает сервис и печатает результат.
 * Бизнес-логики нет: ошибка разбора суммы обрабатывается здесь и
 * в сервис не попадает.
 *
 * Потоки передаются в run(), что позволяет тестировать меню
 * через std::istringstream / std::ostringstream.
 */
class ConsoleMenu {
public:
    explicit ConsoleMenu(std::shared_ptr<ports::input::IAccountService> accountService);

    /**
     * @brief Цикл меню до выбора "Exit" или конца ввода
     */
    void run(std::istream& in, std::ostream& out);

private:
    std::shared_ptr<ports::input::IAccountService> accountService_;

    void printMenu(std::ostream& out) const;

    void handleDeposit(std::istream& in, std::ostream& out);
    void handleWithdraw(std::istream& in, std::ostream& out);
    void handleBalance(std::istream& in, std::ostream& out);
    void handleOpenAccount(std::istream& in, std::ostream& out);

    static std::optional<std::string> prompt(std::istream& in, std::ostream& out,
                                             const std::string& text);
    static std::optional<double> parseAmount(const std::string& text);
    static void printError(std::ostream& out, const domain::OperationResult& result);
};

} // namespace bank::adapters::primary
