#pragma once

#include <map>
#include <string>
#include <utility>

#include "transmuter/collaborators.hpp"

namespace transmuter {

// Token balances kept in memory. Unmanaged collateral sits in the vault
// account, managed collateral in the manager target account.
class MemoryTokens : public TokenGateway {
public:
    explicit MemoryTokens(std::string stablecoin, std::string vault = "transmuter")
        : stablecoin_(std::move(stablecoin)), vault_(std::move(vault)) {}

    uint256 balance_of(const std::string& token, const std::string& account) const;
    uint256 total_supply(const std::string& token) const;

    void credit(const std::string& token, const std::string& account, const uint256& amount);
    void debit(const std::string& token, const std::string& account, const uint256& amount);
    void transfer(const std::string& token, const std::string& from, const std::string& to, const uint256& amount);

    void transfer_collateral(
        const std::string& asset,
        const std::string& manager_target,
        const std::string& account,
        const uint256& amount,
        bool is_mint
    ) override;
    void mint(const std::string& to, const uint256& amount) override;
    void burn_self(const uint256& amount, const std::string& from) override;

    const std::string& stablecoin() const { return stablecoin_; }
    const std::string& vault() const { return vault_; }

private:
    std::string stablecoin_;
    std::string vault_;
    std::map<std::pair<std::string, std::string>, uint256> balances_;
    std::map<std::string, uint256> supply_;
};

// Manager whose strategies are simulated by locking part of its balance
class MemoryManager : public Manager {
public:
    explicit MemoryManager(MemoryTokens& tokens) : tokens_(tokens) {}

    // `account` is the manager target configured for `asset`
    void attach(const std::string& asset, const std::string& account);
    void deploy(const std::string& asset, const uint256& amount);
    uint256 deployed(const std::string& asset) const;

    uint256 max_available(const std::string& asset) const override;
    void pull_all(const std::string& asset, const std::string& manager_config) override;

private:
    const std::string& account_of(const std::string& asset) const;

    MemoryTokens& tokens_;
    std::map<std::string, std::string> accounts_;
    std::map<std::string, uint256> deployed_;
};

} // namespace transmuter
