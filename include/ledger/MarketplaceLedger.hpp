/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MARKETPLACE_LEDGER_HPP
#define MARKETPLACE_LEDGER_HPP

#include "core/BalanceLedger.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/CollectionRegistry.hpp"
#include "ledger/FeeEngine.hpp"
#include "ledger/LedgerRecords.hpp"
#include "ledger/TokenRegistry.hpp"
#include "utils/BinarySerializer.hpp"
#include <map>
#include <optional>
#include <vector>

namespace LatticeMint {

/**
 * @brief Fixed-price listings and atomic sale settlement
 *
 * A listing only exists while its seller owns the token: the marketplace
 * subscribes to TokenRegistry transfers and drops the listing of any token
 * that changes hands.
 */
class MarketplaceLedger : public ISerializable {
public:
  MarketplaceLedger(TokenRegistry &tokens, CollectionRegistry &collections,
                    FeeEngine &fees, IBalanceLedger &balances);

  // Success, NftNotFound, NotOwner, InvalidParameters or ListingExists
  LedgerResult list(const TokenId &tokenId, Amount price,
                    const AccountId &caller, Height height);

  // Success, ListingNotFound or NotAuthorized
  LedgerResult cancel(const TokenId &tokenId, const AccountId &caller);

  /**
   * @brief Buys a listed token at its listed price
   *
   * Settlement and the ownership move either both happen or neither does.
   * @param outSplit Receives the fee/royalty/seller split on Success
   * @return Success, ListingNotFound, CollectionNotFound, NftNotFound,
   *         NotAuthorized, InsufficientPayment or PortfolioFull
   */
  LedgerResult buy(const TokenId &tokenId, const AccountId &caller,
                   SettlementSplit &outSplit);

  std::optional<Listing> getListing(const TokenId &tokenId) const;
  // Ordered by token id
  std::vector<Listing> getActiveListings() const;
  std::vector<Listing> getCollectionListings(CollectionId collectionId) const;
  size_t size() const { return m_listings.size(); }

  DECLARE_SERIALIZABLE()

private:
  MarketplaceLedger(const MarketplaceLedger &) = delete;
  MarketplaceLedger &operator=(const MarketplaceLedger &) = delete;

  void onTokenTransferred(const TokenId &tokenId);

  std::map<TokenId, Listing> m_listings;
  TokenRegistry &m_tokens;
  CollectionRegistry &m_collections;
  FeeEngine &m_fees;
  IBalanceLedger &m_balances;
};

} // namespace LatticeMint

#endif // MARKETPLACE_LEDGER_HPP
