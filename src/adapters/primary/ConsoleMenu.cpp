#include "adapters/primary/ConsoleMenu.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bank::adapters::primary {

namespace {

std::string trim(const std::string& value)
{
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Фиксированная запись с копейками: поток по умолчанию даёт 1.23457e+06
std::string formatBalance(double balance)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(2) << balance;
    return stream.str();
}

} // namespace

ConsoleMenu::ConsoleMenu(std::shared_ptr<ports::input::IAccountService> accountService)
    : accountService_(std::move(accountService))
{
    std::cout << "[ConsoleMenu] Created" << std::endl;
}

void ConsoleMenu::run(std::istream& in, std::ostream& out)
{
    while (true) {
        printMenu(out);

        auto option = prompt(in, out, "Select an option: ");
        if (!option || *option == "5") {
            out << "Thank you for using Bank CLI. Goodbye!" << std::endl;
            return;
        }

        if (*option == "1") {
            handleDeposit(in, out);
        } else if (*option == "2") {
            handleWithdraw(in, out);
        } else if (*option == "3") {
            handleBalance(in, out);
        } else if (*option == "4") {
            handleOpenAccount(in, out);
        } else {
            out << "Invalid option. Try again." << std::endl;
        }
    }
}

void ConsoleMenu::printMenu(std::ostream& out) const
{
    out << "\nWelcome to Bank CLI\n"
        << "1. Deposit\n"
        << "2. Withdraw\n"
        << "3. Check balance\n"
        << "4. Open account\n"
        << "5. Exit" << std::endl;
}

void ConsoleMenu::handleDeposit(std::istream& in, std::ostream& out)
{
    auto accountId = prompt(in, out, "Enter account id: ");
    if (!accountId) return;
    auto amountText = prompt(in, out, "Enter amount to deposit: ");
    if (!amountText) return;

    auto amount = parseAmount(*amountText);
    if (!amount) {
        out << "Error: invalid amount format" << std::endl;
        return;
    }

    auto result = accountService_->deposit(*accountId, *amount);
    if (!result.isSuccess()) {
        printError(out, result);
        return;
    }
    out << "Deposit successful. New balance: " << formatBalance(result.balance()) << std::endl;
}

void ConsoleMenu::handleWithdraw(std::istream& in, std::ostream& out)
{
    auto accountId = prompt(in, out, "Enter account id: ");
    if (!accountId) return;
    auto amountText = prompt(in, out, "Enter amount to withdraw: ");
    if (!amountText) return;

    auto amount = parseAmount(*amountText);
    if (!amount) {
        out << "Error: invalid amount format" << std::endl;
        return;
    }

    auto result = accountService_->withdraw(*accountId, *amount);
    if (!result.isSuccess()) {
        printError(out, result);
        return;
    }
    out << "Withdrawal successful. New balance: " << formatBalance(result.balance()) << std::endl;
}

void ConsoleMenu::handleBalance(std::istream& in, std::ostream& out)
{
    auto accountId = prompt(in, out, "Enter account id: ");
    if (!accountId) return;

    auto result = accountService_->getBalance(*accountId);
    if (!result.isSuccess()) {
        printError(out, result);
        return;
    }
    out << "Current balance: " << formatBalance(result.balance()) << std::endl;
}

void ConsoleMenu::handleOpenAccount(std::istream& in, std::ostream& out)
{
    auto accountId = prompt(in, out, "Enter new account id: ");
    if (!accountId) return;
    auto amountText = prompt(in, out, "Enter initial balance: ");
    if (!amountText) return;

    // Пустая строка - открыть с нулевым балансом
    double initialBalance = 0.0;
    if (!amountText->empty()) {
        auto amount = parseAmount(*amountText);
        if (!amount) {
            out << "Error: invalid amount format" << std::endl;
            return;
        }
        initialBalance = *amount;
    }

    auto result = accountService_->openAccount(*accountId, initialBalance);
    if (!result.isSuccess()) {
        printError(out, result);
        return;
    }
    out << "Account " << *accountId << " opened. Balance: " << formatBalance(result.balance()) << std::endl;
}

std::optional<std::string> ConsoleMenu::prompt(std::istream& in, std::ostream& out,
                                                const std::string& text)
{
    out << text << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    return trim(line);
}

std::optional<double> ConsoleMenu::parseAmount(const std::string& text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t parsed = 0;
        double value = std::stod(text, &parsed);
        if (parsed != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void ConsoleMenu::printError(std::ostream& out, const domain::OperationResult& result)
{
    out << "Error: " << result.message << std::endl;
}

} // namespace bank::adapters::primary
