/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BALANCE_LEDGER_HPP
#define BALANCE_LEDGER_HPP

#include "core/LedgerTypes.hpp"
#include <shared_mutex>
#include <unordered_map>

namespace LatticeMint {

enum class BalanceTransferResult { Success, InsufficientFunds };

/**
 * @brief Payment currency ledger consumed by minting and settlement
 *
 * Implementations must be synchronous and fail fast: a transfer either moves
 * the full amount or nothing.
 */
class IBalanceLedger {
public:
  virtual ~IBalanceLedger() = default;

  virtual Amount balanceOf(const AccountId &account) const = 0;
  virtual BalanceTransferResult transfer(Amount amount, const AccountId &from,
                                         const AccountId &to) = 0;
};

/**
 * @brief Thread-safe in-process balance ledger
 */
class InMemoryBalanceLedger : public IBalanceLedger {
public:
  InMemoryBalanceLedger() = default;

  Amount balanceOf(const AccountId &account) const override;
  BalanceTransferResult transfer(Amount amount, const AccountId &from,
                                 const AccountId &to) override;

  // Credits new currency to an account, returns false on overflow
  bool deposit(const AccountId &account, Amount amount);
  // Sum of all balances
  Amount totalSupply() const;

private:
  InMemoryBalanceLedger(const InMemoryBalanceLedger &) = delete;
  InMemoryBalanceLedger &operator=(const InMemoryBalanceLedger &) = delete;

  std::unordered_map<AccountId, Amount> m_balances;
  mutable std::shared_mutex m_balanceMutex;
};

} // namespace LatticeMint

#endif // BALANCE_LEDGER_HPP
