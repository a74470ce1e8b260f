/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LATTICE_LEDGER_HPP
#define LATTICE_LEDGER_HPP

/**
 * @file LatticeLedger.hpp
 * @brief Transactional entry point of a lattice NFT ledger instance
 *
 * LatticeLedger owns every ledger component (collections, lattice parameters,
 * tokens, ownership index, fee engine, marketplace) plus the platform state,
 * and serializes access to them:
 * - Mutating operations run under an exclusive lock, one transaction at a
 *   time. Preconditions are checked before any mutation, so a rejected call
 *   leaves no trace.
 * - Reads run concurrently under a shared lock and return copies.
 *
 * Several instances can coexist in one process; they share nothing except the
 * collaborators handed to them.
 */

#include "core/BalanceLedger.hpp"
#include "core/HeightClock.hpp"
#include "core/LedgerConfig.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/LedgerRecords.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace LatticeMint {

/**
 * @brief Operation counters of one ledger instance
 */
struct LedgerStats {
  std::atomic<uint64_t> collectionsCreated{0};
  std::atomic<uint64_t> tokensMinted{0};
  std::atomic<uint64_t> transfers{0};
  std::atomic<uint64_t> listingsCreated{0};
  std::atomic<uint64_t> listingsCancelled{0};
  std::atomic<uint64_t> sales{0};
  std::atomic<uint64_t> salesVolume{0};
  std::atomic<uint64_t> rejectedOperations{0};

  LedgerStats() = default;
  LedgerStats(const LedgerStats &other)
      : collectionsCreated(other.collectionsCreated.load()),
        tokensMinted(other.tokensMinted.load()),
        transfers(other.transfers.load()),
        listingsCreated(other.listingsCreated.load()),
        listingsCancelled(other.listingsCancelled.load()),
        sales(other.sales.load()), salesVolume(other.salesVolume.load()),
        rejectedOperations(other.rejectedOperations.load()) {}

  LedgerStats &operator=(const LedgerStats &other) {
    if (this != &other) {
      collectionsCreated = other.collectionsCreated.load();
      tokensMinted = other.tokensMinted.load();
      transfers = other.transfers.load();
      listingsCreated = other.listingsCreated.load();
      listingsCancelled = other.listingsCancelled.load();
      sales = other.sales.load();
      salesVolume = other.salesVolume.load();
      rejectedOperations = other.rejectedOperations.load();
    }
    return *this;
  }

  void reset() {
    collectionsCreated = 0;
    tokensMinted = 0;
    transfers = 0;
    listingsCreated = 0;
    listingsCancelled = 0;
    sales = 0;
    salesVolume = 0;
    rejectedOperations = 0;
  }
};

class LatticeLedger {
public:
  /**
   * @throws std::invalid_argument if config is invalid or a collaborator is
   *         null
   */
  LatticeLedger(const LedgerConfig &config,
                std::shared_ptr<IBalanceLedger> balances,
                std::shared_ptr<IHeightClock> clock);
  ~LatticeLedger();

  // Collections

  LedgerResult createCollection(const CollectionDraft &draft,
                                LatticeParameters params,
                                const AccountId &caller, CollectionId &outId);
  LedgerResult setCollectionStatus(CollectionId collectionId, bool isOpen,
                                   const AccountId &caller);

  // Tokens

  LedgerResult mint(CollectionId collectionId, uint64_t seed,
                    const AccountId &caller, TokenId &outTokenId);
  LedgerResult transferNft(CollectionId collectionId, TokenIndex tokenIndex,
                           const AccountId &recipient, const AccountId &caller);

  // Marketplace

  LedgerResult listForSale(CollectionId collectionId, TokenIndex tokenIndex,
                           Amount price, const AccountId &caller);
  LedgerResult cancelListing(CollectionId collectionId, TokenIndex tokenIndex,
                             const AccountId &caller);
  LedgerResult buyNft(CollectionId collectionId, TokenIndex tokenIndex,
                      const AccountId &caller, SettlementSplit &outSplit);

  // Platform administration, admin only

  LedgerResult setPlatformFeeBps(BasisPoints newFeeBps, const AccountId &caller);
  LedgerResult setAdmin(const AccountId &newAdmin, const AccountId &caller);

  // Reads

  std::optional<Collection> getCollection(CollectionId collectionId) const;
  std::optional<LatticeParameters>
  getLatticeParameters(CollectionId collectionId) const;
  std::optional<Token> getNft(CollectionId collectionId,
                              TokenIndex tokenIndex) const;
  std::optional<AccountId> getNftOwner(CollectionId collectionId,
                                       TokenIndex tokenIndex) const;
  std::optional<Listing> getListing(CollectionId collectionId,
                                    TokenIndex tokenIndex) const;
  // In acquisition order
  std::vector<TokenId> getOwnedNfts(const AccountId &owner) const;
  uint64_t getCollectionsCount() const;
  BasisPoints getPlatformFeeBps() const;
  AccountId getAdmin() const;
  std::vector<Listing> getActiveListings() const;
  std::vector<Listing> getCollectionListings(CollectionId collectionId) const;
  std::vector<TokenId> getCollectionTokens(CollectionId collectionId) const;
  std::vector<CollectionId> getCollectionsByCreator(const AccountId &creator) const;
  // Compact JSON document for the token's locator
  std::optional<std::string> getTokenMetadata(CollectionId collectionId,
                                              TokenIndex tokenIndex) const;

  LedgerStats getStats() const { return m_stats; }
  void resetStats() { m_stats.reset(); }

  /**
   * @brief Cross-checks the components against each other
   *
   * Verifies supply counters, that every token is indexed exactly once under
   * its owner and that every listing is held by the token's owner. Logs each
   * violation found.
   * @return true if the ledger is consistent
   */
  bool checkInvariants() const;

  // Persistence. A failed load leaves the current state untouched.

  bool saveSnapshot(const std::string &filepath) const;
  bool loadSnapshot(const std::string &filepath);

private:
  struct LedgerState;

  LatticeLedger(const LatticeLedger &) = delete;
  LatticeLedger &operator=(const LatticeLedger &) = delete;

  std::unique_ptr<LedgerState> makeState() const;
  Height currentHeight() const { return m_clock->currentHeight(); }
  LedgerResult record(LedgerResult result, std::atomic<uint64_t> &counter);

  LedgerConfig m_config;
  std::shared_ptr<IBalanceLedger> m_balances;
  std::shared_ptr<IHeightClock> m_clock;
  std::unique_ptr<LedgerState> m_state;

  mutable LedgerStats m_stats;
  mutable std::shared_mutex m_ledgerMutex;
};

} // namespace LatticeMint

#endif // LATTICE_LEDGER_HPP
