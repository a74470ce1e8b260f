/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/MarketplaceLedger.hpp"
#include "core/Logger.hpp"
#include <format>

namespace LatticeMint {

MarketplaceLedger::MarketplaceLedger(TokenRegistry &tokens,
                                     CollectionRegistry &collections,
                                     FeeEngine &fees, IBalanceLedger &balances)
    : m_tokens(tokens), m_collections(collections), m_fees(fees),
      m_balances(balances) {
  m_tokens.addTransferListener(
      [this](const TokenId &tokenId, const AccountId &, const AccountId &) {
        onTokenTransferred(tokenId);
      });
}

void MarketplaceLedger::onTokenTransferred(const TokenId &tokenId) {
  if (m_listings.erase(tokenId) > 0) {
    MARKET_DEBUG("Dropped listing of transferred token " + tokenId.toString());
  }
}

LedgerResult MarketplaceLedger::list(const TokenId &tokenId, Amount price,
                                     const AccountId &caller, Height height) {
  const Token *token = m_tokens.find(tokenId);
  if (!token) {
    MARKET_WARN(std::format("list - {} not found", tokenId.toString()));
    return LedgerResult::NftNotFound;
  }
  if (token->owner != caller) {
    MARKET_WARN(std::format("list - {} does not own {}", caller,
                            tokenId.toString()));
    return LedgerResult::NotOwner;
  }
  if (price == 0) {
    MARKET_WARN("list - price must be positive for " + tokenId.toString());
    return LedgerResult::InvalidParameters;
  }
  if (m_listings.count(tokenId) > 0) {
    MARKET_WARN(std::format("list - {} is already listed", tokenId.toString()));
    return LedgerResult::ListingExists;
  }

  Listing listing;
  listing.tokenId = tokenId;
  listing.seller = caller;
  listing.price = price;
  listing.listedAtHeight = height;
  m_listings.emplace(tokenId, std::move(listing));

  MARKET_INFO(std::format("{} listed {} at {}", caller, tokenId.toString(),
                          price));
  return LedgerResult::Success;
}

LedgerResult MarketplaceLedger::cancel(const TokenId &tokenId,
                                       const AccountId &caller) {
  auto it = m_listings.find(tokenId);
  if (it == m_listings.end()) {
    MARKET_WARN(std::format("cancel - no listing for {}", tokenId.toString()));
    return LedgerResult::ListingNotFound;
  }
  if (it->second.seller != caller) {
    MARKET_WARN(std::format("cancel - {} is not the seller of {}", caller,
                            tokenId.toString()));
    return LedgerResult::NotAuthorized;
  }

  m_listings.erase(it);
  MARKET_INFO(std::format("{} cancelled listing of {}", caller,
                          tokenId.toString()));
  return LedgerResult::Success;
}

LedgerResult MarketplaceLedger::buy(const TokenId &tokenId,
                                    const AccountId &caller,
                                    SettlementSplit &outSplit) {
  auto it = m_listings.find(tokenId);
  if (it == m_listings.end()) {
    MARKET_WARN(std::format("buy - no listing for {}", tokenId.toString()));
    return LedgerResult::ListingNotFound;
  }

  // Copy: the listing is erased by the transfer below
  const Listing listing = it->second;

  const Collection *collection =
      m_collections.find(tokenId.getCollectionId());
  if (!collection) {
    MARKET_ERROR(std::format("buy - collection of {} not found",
                             tokenId.toString()));
    return LedgerResult::CollectionNotFound;
  }
  if (!m_tokens.find(tokenId)) {
    MARKET_ERROR(std::format("buy - {} not found", tokenId.toString()));
    return LedgerResult::NftNotFound;
  }
  if (caller == listing.seller) {
    MARKET_WARN(std::format("buy - {} cannot buy its own listing of {}",
                            caller, tokenId.toString()));
    return LedgerResult::NotAuthorized;
  }
  if (m_balances.balanceOf(caller) < listing.price) {
    MARKET_WARN(std::format("buy - {} cannot pay {} for {}", caller,
                            listing.price, tokenId.toString()));
    return LedgerResult::InsufficientPayment;
  }

  LedgerResult transferable =
      m_tokens.canTransfer(tokenId, listing.seller, caller);
  if (transferable != LedgerResult::Success) {
    MARKET_WARN(std::format("buy - {} cannot move to {}: {}",
                            tokenId.toString(), caller,
                            ledgerResultToString(transferable)));
    return transferable;
  }

  SettlementReceipt receipt;
  LedgerResult settled =
      m_fees.settle(listing.price, caller, listing.seller, collection->creator,
                    collection->royaltyBps, receipt);
  if (settled != LedgerResult::Success) {
    return settled;
  }

  LedgerResult moved = m_tokens.transfer(tokenId, listing.seller, caller);
  if (moved != LedgerResult::Success) {
    MARKET_CRITICAL(std::format("buy - transfer of {} failed after settlement, "
                                "reversing payment",
                                tokenId.toString()));
    if (!m_fees.rollback(receipt)) {
      MARKET_CRITICAL("buy - payment reversal incomplete for " +
                      tokenId.toString());
    }
    return moved;
  }

  // The transfer listener already dropped it
  m_listings.erase(tokenId);

  MARKET_INFO(std::format(
      "{} bought {} from {} for {} (fee: {}, royalty: {}, seller: {})", caller,
      tokenId.toString(), listing.seller, listing.price,
      receipt.split.platformFee, receipt.split.royalty,
      receipt.split.sellerAmount));
  outSplit = receipt.split;
  return LedgerResult::Success;
}

std::optional<Listing>
MarketplaceLedger::getListing(const TokenId &tokenId) const {
  auto it = m_listings.find(tokenId);
  if (it == m_listings.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Listing> MarketplaceLedger::getActiveListings() const {
  std::vector<Listing> listings;
  listings.reserve(m_listings.size());
  for (const auto &[_, listing] : m_listings) {
    listings.push_back(listing);
  }
  return listings;
}

std::vector<Listing>
MarketplaceLedger::getCollectionListings(CollectionId collectionId) const {
  std::vector<Listing> listings;
  // Keys are ordered by collection first
  auto it = m_listings.lower_bound(TokenId(collectionId, 1));
  for (; it != m_listings.end() &&
         it->first.getCollectionId() == collectionId;
       ++it) {
    listings.push_back(it->second);
  }
  return listings;
}

bool MarketplaceLedger::serialize(std::ostream &stream) const {
  BinarySerial::Writer writer(stream);

  if (!writer.writeCount(m_listings.size()))
    return false;

  for (const auto &[tokenId, listing] : m_listings) {
    SERIALIZE_PRIMITIVE(writer, tokenId.getCollectionId())
    SERIALIZE_PRIMITIVE(writer, tokenId.getTokenIndex())
    SERIALIZE_STRING(writer, listing.seller)
    SERIALIZE_PRIMITIVE(writer, listing.price)
    SERIALIZE_PRIMITIVE(writer, listing.listedAtHeight)
  }
  return writer.good();
}

bool MarketplaceLedger::deserialize(std::istream &stream) {
  BinarySerial::Reader reader(stream);
  std::map<TokenId, Listing> loaded;

  size_t count = 0;
  if (!reader.readCount(count))
    return false;

  for (size_t i = 0; i < count; ++i) {
    CollectionId collectionId = INVALID_COLLECTION_ID;
    TokenIndex tokenIndex = INVALID_TOKEN_INDEX;
    Listing listing;
    DESERIALIZE_PRIMITIVE(reader, collectionId)
    DESERIALIZE_PRIMITIVE(reader, tokenIndex)
    DESERIALIZE_STRING(reader, listing.seller)
    DESERIALIZE_PRIMITIVE(reader, listing.price)
    DESERIALIZE_PRIMITIVE(reader, listing.listedAtHeight)
    listing.tokenId = TokenId(collectionId, tokenIndex);

    const Token *token = m_tokens.find(listing.tokenId);
    if (!token || token->owner != listing.seller || listing.price == 0 ||
        loaded.count(listing.tokenId) > 0) {
      SNAPSHOT_ERROR(std::format("Listing of {} violates marketplace invariants",
                                 listing.tokenId.toString()));
      return false;
    }
    const TokenId id = listing.tokenId;
    loaded.emplace(id, std::move(listing));
  }

  m_listings = std::move(loaded);
  return true;
}

} // namespace LatticeMint
