/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/BalanceLedger.hpp"
#include "core/Logger.hpp"
#include <format>
#include <limits>
#include <mutex>

namespace LatticeMint {

Amount InMemoryBalanceLedger::balanceOf(const AccountId &account) const {
  std::shared_lock<std::shared_mutex> lock(m_balanceMutex);
  auto it = m_balances.find(account);
  return it == m_balances.end() ? 0 : it->second;
}

BalanceTransferResult InMemoryBalanceLedger::transfer(Amount amount,
                                                      const AccountId &from,
                                                      const AccountId &to) {
  std::unique_lock<std::shared_mutex> lock(m_balanceMutex);

  auto fromIt = m_balances.find(from);
  Amount available = fromIt == m_balances.end() ? 0 : fromIt->second;
  if (available < amount) {
    BALANCE_WARN(std::format("Transfer of {} from {} rejected - balance {}",
                             amount, from, available));
    return BalanceTransferResult::InsufficientFunds;
  }

  if (amount == 0 || from == to) {
    return BalanceTransferResult::Success;
  }

  // Total supply only grows through deposit(), which refuses overflow
  fromIt->second -= amount;
  m_balances[to] += amount;

  BALANCE_DEBUG(std::format("Transferred {} from {} to {}", amount, from, to));
  return BalanceTransferResult::Success;
}

bool InMemoryBalanceLedger::deposit(const AccountId &account, Amount amount) {
  std::unique_lock<std::shared_mutex> lock(m_balanceMutex);

  Amount total = 0;
  for (const auto &[_, balance] : m_balances) {
    total += balance;
  }
  if (amount > std::numeric_limits<Amount>::max() - total) {
    BALANCE_ERROR(std::format("Deposit of {} to {} would overflow supply",
                              amount, account));
    return false;
  }

  m_balances[account] += amount;
  return true;
}

Amount InMemoryBalanceLedger::totalSupply() const {
  std::shared_lock<std::shared_mutex> lock(m_balanceMutex);
  Amount total = 0;
  for (const auto &[_, balance] : m_balances) {
    total += balance;
  }
  return total;
}

} // namespace LatticeMint
