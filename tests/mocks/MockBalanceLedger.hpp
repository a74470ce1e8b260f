/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_BALANCE_LEDGER_HPP
#define MOCK_BALANCE_LEDGER_HPP

#include "core/BalanceLedger.hpp"
#include <string>
#include <vector>

/**
 * @brief In-memory balance ledger that can be told to refuse transfers
 *
 * Refuses every transfer whose recipient is in the blocked list, and every
 * transfer once the configured number of successful transfers is used up.
 */
class MockBalanceLedger : public LatticeMint::IBalanceLedger {
public:
  LatticeMint::Amount balanceOf(const LatticeMint::AccountId &account) const override {
    return m_inner.balanceOf(account);
  }

  LatticeMint::BalanceTransferResult
  transfer(LatticeMint::Amount amount, const LatticeMint::AccountId &from,
           const LatticeMint::AccountId &to) override {
    ++transferCalls;
    for (const auto &blocked : blockedRecipients) {
      if (blocked == to) {
        return LatticeMint::BalanceTransferResult::InsufficientFunds;
      }
    }
    if (remainingTransfers == 0) {
      return LatticeMint::BalanceTransferResult::InsufficientFunds;
    }
    auto result = m_inner.transfer(amount, from, to);
    if (result == LatticeMint::BalanceTransferResult::Success &&
        remainingTransfers > 0) {
      --remainingTransfers;
    }
    return result;
  }

  bool deposit(const LatticeMint::AccountId &account, LatticeMint::Amount amount) {
    return m_inner.deposit(account, amount);
  }

  LatticeMint::Amount totalSupply() const { return m_inner.totalSupply(); }

  std::vector<std::string> blockedRecipients;
  // Negative means unlimited
  int remainingTransfers{-1};
  int transferCalls{0};

private:
  LatticeMint::InMemoryBalanceLedger m_inner;
};

#endif // MOCK_BALANCE_LEDGER_HPP
