/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/FeeEngine.hpp"
#include "core/Logger.hpp"
#include <format>

namespace LatticeMint {

LedgerResult FeeEngine::settle(Amount amount, const AccountId &payer,
                               const AccountId &seller,
                               const AccountId &creator,
                               BasisPoints royaltyBps,
                               SettlementReceipt &receipt) {
  SettlementReceipt pending;
  pending.payer = payer;
  pending.split = previewSplit(amount, royaltyBps);

  if (m_balances.balanceOf(payer) < amount) {
    FEE_WARN(std::format("Settlement of {} rejected - {} cannot cover it",
                         amount, payer));
    return LedgerResult::InsufficientPayment;
  }

  const SettlementReceipt::Leg legs[] = {
      {m_platform.admin, pending.split.platformFee},
      {creator, pending.split.royalty},
      {seller, pending.split.sellerAmount}};

  for (const auto &leg : legs) {
    if (leg.amount == 0) {
      continue;
    }
    if (m_balances.transfer(leg.amount, payer, leg.to) !=
        BalanceTransferResult::Success) {
      FEE_WARN(std::format("Settlement leg of {} to {} failed, reversing {} "
                           "applied legs",
                           leg.amount, leg.to, pending.legs.size()));
      if (!rollback(pending)) {
        FEE_CRITICAL("Settlement left partially applied for payer " + payer);
      }
      return LedgerResult::InsufficientPayment;
    }
    pending.legs.push_back(leg);
  }

  FEE_DEBUG(std::format("Settled {} from {} - fee: {}, royalty: {}, seller: {}",
                        amount, payer, pending.split.platformFee,
                        pending.split.royalty, pending.split.sellerAmount));
  receipt = std::move(pending);
  return LedgerResult::Success;
}

bool FeeEngine::rollback(const SettlementReceipt &receipt) {
  bool complete = true;
  for (auto it = receipt.legs.rbegin(); it != receipt.legs.rend(); ++it) {
    if (m_balances.transfer(it->amount, it->to, receipt.payer) !=
        BalanceTransferResult::Success) {
      FEE_CRITICAL(std::format("Could not reverse settlement leg of {} from {} "
                               "back to {}",
                               it->amount, it->to, receipt.payer));
      complete = false;
    }
  }
  return complete;
}

} // namespace LatticeMint
