/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FEE_ENGINE_HPP
#define FEE_ENGINE_HPP

#include "core/BalanceLedger.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/LedgerRecords.hpp"
#include <boost/container/small_vector.hpp>

namespace LatticeMint {

/**
 * @brief Process-wide platform configuration of one ledger instance
 */
struct PlatformState {
  AccountId admin{};
  BasisPoints platformFeeBps{0};
};

/**
 * @brief Record of the payment legs a settlement applied, used to reverse it
 */
struct SettlementReceipt {
  struct Leg {
    AccountId to;
    Amount amount;
  };

  AccountId payer{};
  SettlementSplit split{};
  boost::container::small_vector<Leg, 3> legs{};
};

/**
 * @brief Fee and royalty arithmetic plus the three-way settlement transfer
 *
 * Rates are basis points out of 10000 and must not exceed 10000. Results are
 * floor(amount * bps / 10000), computed without 64-bit overflow.
 */
class FeeEngine {
public:
  FeeEngine(IBalanceLedger &balances, const PlatformState &platform)
      : m_balances(balances), m_platform(platform) {}

  static constexpr Amount applyBps(Amount amount, BasisPoints bps) noexcept {
    // amount = q * 10000 + r  =>  floor(amount * bps / 10000)
    //                           = q * bps + floor(r * bps / 10000)
    return (amount / BPS_DENOMINATOR) * bps +
           ((amount % BPS_DENOMINATOR) * bps) / BPS_DENOMINATOR;
  }

  static constexpr Amount platformFee(Amount amount, BasisPoints feeBps) noexcept {
    return applyBps(amount, feeBps);
  }

  static constexpr Amount royalty(Amount amount, BasisPoints royaltyBps) noexcept {
    return applyBps(amount, royaltyBps);
  }

  // feeBps + royaltyBps must not exceed 10000
  static constexpr SettlementSplit computeSplit(Amount amount, BasisPoints feeBps,
                                                BasisPoints royaltyBps) noexcept {
    SettlementSplit split;
    split.price = amount;
    split.platformFee = platformFee(amount, feeBps);
    split.royalty = royalty(amount, royaltyBps);
    split.sellerAmount = amount - split.platformFee - split.royalty;
    return split;
  }

  // Split at the current platform fee rate
  SettlementSplit previewSplit(Amount amount, BasisPoints royaltyBps) const {
    return computeSplit(amount, m_platform.platformFeeBps, royaltyBps);
  }

  /**
   * @brief Pays a sale price out of payer: fee to the platform admin, royalty
   * to the creator, remainder to the seller
   * @param receipt Receives the applied legs on success
   * @return Success, or InsufficientPayment with every applied leg reversed
   */
  LedgerResult settle(Amount amount, const AccountId &payer,
                      const AccountId &seller, const AccountId &creator,
                      BasisPoints royaltyBps, SettlementReceipt &receipt);

  /**
   * @brief Reverses the legs of a completed settlement, newest first
   * @return false if a reversal leg was refused by the balance ledger
   */
  bool rollback(const SettlementReceipt &receipt);

private:
  IBalanceLedger &m_balances;
  const PlatformState &m_platform;
};

} // namespace LatticeMint

#endif // FEE_ENGINE_HPP
