#pragma once

#include "ports/input/IAccountService.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace bank::application {

/**
 * @brief Гарантировать наличие стартового счёта
 *
 * Открывает счёт через openAccount (create не перезаписывает существующий),
 * поэтому у уже открытого счёта баланс сохраняется.
 *
 * @return true если счёт создан, false если он уже был
 * @throws std::runtime_error при любой другой ошибке (например, STORAGE_FAILURE)
 */
inline bool ensureSeedAccount(
    ports::input::IAccountService& accountService,
    const std::string& accountId,
    double balance
) {
    auto result = accountService.openAccount(accountId, balance);
    if (result.isSuccess()) {
        std::cout << "[AccountBootstrap] Seed account " << accountId << " created" << std::endl;
        return true;
    }
    if (result.error == domain::AccountError::ACCOUNT_ALREADY_EXISTS) {
        std::cout << "[AccountBootstrap] Seed account " << accountId << " already exists" << std::endl;
        return false;
    }

    throw std::runtime_error("Failed to bootstrap seed account " + accountId + ": " +
                             domain::toString(*result.error));
}

} // namespace bank::application
