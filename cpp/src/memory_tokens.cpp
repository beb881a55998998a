#include "transmuter/memory_tokens.hpp"

#include <stdexcept>

namespace transmuter {

uint256 MemoryTokens::balance_of(const std::string& token, const std::string& account) const {
    auto it = balances_.find({token, account});
    return it == balances_.end() ? uint256(0) : it->second;
}

uint256 MemoryTokens::total_supply(const std::string& token) const {
    auto it = supply_.find(token);
    return it == supply_.end() ? uint256(0) : it->second;
}

void MemoryTokens::credit(const std::string& token, const std::string& account, const uint256& amount) {
    balances_[{token, account}] += amount;
    supply_[token] += amount;
}

void MemoryTokens::debit(const std::string& token, const std::string& account, const uint256& amount) {
    auto it = balances_.find({token, account});
    if (it == balances_.end() || it->second < amount) {
        throw std::runtime_error("insufficient " + token + " balance for " + account);
    }
    it->second -= amount;
    supply_[token] -= amount;
}

void MemoryTokens::transfer(const std::string& token, const std::string& from, const std::string& to, const uint256& amount) {
    debit(token, from, amount);
    credit(token, to, amount);
}

void MemoryTokens::transfer_collateral(
    const std::string& asset,
    const std::string& manager_target,
    const std::string& account,
    const uint256& amount,
    bool is_mint
) {
    const std::string& custody = manager_target.empty() ? vault_ : manager_target;
    if (is_mint) {
        transfer(asset, account, custody, amount);
    } else {
        transfer(asset, custody, account, amount);
    }
}

void MemoryTokens::mint(const std::string& to, const uint256& amount) {
    credit(stablecoin_, to, amount);
}

void MemoryTokens::burn_self(const uint256& amount, const std::string& from) {
    debit(stablecoin_, from, amount);
}

// ------------------------------- manager -------------------------------------

void MemoryManager::attach(const std::string& asset, const std::string& account) {
    accounts_[asset] = account;
}

const std::string& MemoryManager::account_of(const std::string& asset) const {
    auto it = accounts_.find(asset);
    if (it == accounts_.end()) {
        throw std::runtime_error("no manager account for " + asset);
    }
    return it->second;
}

void MemoryManager::deploy(const std::string& asset, const uint256& amount) {
    const uint256 held = tokens_.balance_of(asset, account_of(asset));
    if (deployed(asset) + amount > held) {
        throw std::runtime_error("cannot deploy more " + asset + " than held");
    }
    deployed_[asset] += amount;
}

uint256 MemoryManager::deployed(const std::string& asset) const {
    auto it = deployed_.find(asset);
    return it == deployed_.end() ? uint256(0) : it->second;
}

uint256 MemoryManager::max_available(const std::string& asset) const {
    return tokens_.balance_of(asset, account_of(asset)) - deployed(asset);
}

void MemoryManager::pull_all(const std::string& asset, const std::string& manager_config) {
    const uint256 held = tokens_.balance_of(asset, manager_config);
    if (held > 0) {
        tokens_.transfer(asset, manager_config, tokens_.vault(), held);
    }
    deployed_.erase(asset);
}

} // namespace transmuter
