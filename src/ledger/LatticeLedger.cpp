/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/LatticeLedger.hpp"
#include "core/Logger.hpp"
#include "ledger/CollectionRegistry.hpp"
#include "ledger/FeeEngine.hpp"
#include "ledger/LatticeParameterStore.hpp"
#include "ledger/MarketplaceLedger.hpp"
#include "ledger/OwnershipIndex.hpp"
#include "ledger/TokenMetadata.hpp"
#include "ledger/TokenRegistry.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace LatticeMint {

namespace {

constexpr char SNAPSHOT_SIGNATURE[] = "LATTICEMINT";
constexpr size_t SNAPSHOT_SIGNATURE_SIZE = sizeof(SNAPSHOT_SIGNATURE) - 1;
constexpr uint32_t SNAPSHOT_VERSION = 1;

bool writeSnapshotHeader(std::ostream &stream) {
  stream.write(SNAPSHOT_SIGNATURE, SNAPSHOT_SIGNATURE_SIZE);
  BinarySerial::Writer writer(stream);
  return writer.write(SNAPSHOT_VERSION);
}

bool readSnapshotHeader(std::istream &stream) {
  char signature[SNAPSHOT_SIGNATURE_SIZE]{};
  stream.read(signature, SNAPSHOT_SIGNATURE_SIZE);
  if (!stream.good() ||
      !std::equal(signature, signature + SNAPSHOT_SIGNATURE_SIZE,
                  SNAPSHOT_SIGNATURE)) {
    SNAPSHOT_ERROR("Missing snapshot signature");
    return false;
  }

  BinarySerial::Reader reader(stream);
  uint32_t version = 0;
  if (!reader.read(version)) {
    SNAPSHOT_ERROR("Truncated snapshot header");
    return false;
  }
  if (version != SNAPSHOT_VERSION) {
    SNAPSHOT_ERROR(std::format("Unsupported snapshot version {} (expected {})",
                               version, SNAPSHOT_VERSION));
    return false;
  }
  return true;
}

} // namespace

// Component graph of one ledger. Members are declared in dependency order.
struct LatticeLedger::LedgerState {
  LedgerState(const LedgerConfig &config, IBalanceLedger &balances)
      : ownership(config.maxTokensPerAccount), collections(parameters, config),
        tokens(collections, ownership, balances), fees(balances, platform),
        market(tokens, collections, fees, balances) {}

  PlatformState platform;
  LatticeParameterStore parameters;
  OwnershipIndex ownership;
  CollectionRegistry collections;
  TokenRegistry tokens;
  FeeEngine fees;
  MarketplaceLedger market;
};

LatticeLedger::LatticeLedger(const LedgerConfig &config,
                             std::shared_ptr<IBalanceLedger> balances,
                             std::shared_ptr<IHeightClock> clock)
    : m_config(config), m_balances(std::move(balances)),
      m_clock(std::move(clock)) {
  if (!m_config.isValid()) {
    throw std::invalid_argument(std::format(
        "LatticeLedger config invalid - admin: '{}', platformFeeBps: {}",
        m_config.admin, m_config.platformFeeBps));
  }
  if (!m_balances || !m_clock) {
    throw std::invalid_argument(
        "LatticeLedger requires a balance ledger and a height clock");
  }

  m_state = makeState();
  LEDGER_INFO(std::format("Ledger ready - admin: {}, platform fee: {} bps, "
                          "max tokens per account: {}",
                          m_config.admin, m_config.platformFeeBps,
                          m_config.maxTokensPerAccount));
}

LatticeLedger::~LatticeLedger() = default;

std::unique_ptr<LatticeLedger::LedgerState> LatticeLedger::makeState() const {
  auto state = std::make_unique<LedgerState>(m_config, *m_balances);
  state->platform.admin = m_config.admin;
  state->platform.platformFeeBps = m_config.platformFeeBps;
  return state;
}

LedgerResult LatticeLedger::record(LedgerResult result,
                                   std::atomic<uint64_t> &counter) {
  if (result == LedgerResult::Success) {
    counter.fetch_add(1, std::memory_order_relaxed);
  } else {
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
  }
  return result;
}

// ----------------------------------------------------------------------------
// Mutating operations
// ----------------------------------------------------------------------------

LedgerResult LatticeLedger::createCollection(const CollectionDraft &draft,
                                             LatticeParameters params,
                                             const AccountId &caller,
                                             CollectionId &outId) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  return record(m_state->collections.createCollection(
                    caller, draft, std::move(params), currentHeight(), outId),
                m_stats.collectionsCreated);
}

LedgerResult LatticeLedger::setCollectionStatus(CollectionId collectionId,
                                                bool isOpen,
                                                const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  LedgerResult result =
      m_state->collections.setCollectionStatus(collectionId, isOpen, caller);
  if (result != LedgerResult::Success) {
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
  }
  return result;
}

LedgerResult LatticeLedger::mint(CollectionId collectionId, uint64_t seed,
                                 const AccountId &caller, TokenId &outTokenId) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  return record(m_state->tokens.mint(collectionId, seed, caller,
                                     currentHeight(), outTokenId),
                m_stats.tokensMinted);
}

LedgerResult LatticeLedger::transferNft(CollectionId collectionId,
                                        TokenIndex tokenIndex,
                                        const AccountId &recipient,
                                        const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  return record(m_state->tokens.transferNft(TokenId(collectionId, tokenIndex),
                                            recipient, caller),
                m_stats.transfers);
}

LedgerResult LatticeLedger::listForSale(CollectionId collectionId,
                                        TokenIndex tokenIndex, Amount price,
                                        const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  return record(m_state->market.list(TokenId(collectionId, tokenIndex), price,
                                     caller, currentHeight()),
                m_stats.listingsCreated);
}

LedgerResult LatticeLedger::cancelListing(CollectionId collectionId,
                                          TokenIndex tokenIndex,
                                          const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  return record(m_state->market.cancel(TokenId(collectionId, tokenIndex), caller),
                m_stats.listingsCancelled);
}

LedgerResult LatticeLedger::buyNft(CollectionId collectionId,
                                   TokenIndex tokenIndex,
                                   const AccountId &caller,
                                   SettlementSplit &outSplit) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  SettlementSplit split;
  LedgerResult result = record(
      m_state->market.buy(TokenId(collectionId, tokenIndex), caller, split),
      m_stats.sales);
  if (result == LedgerResult::Success) {
    m_stats.salesVolume.fetch_add(split.price, std::memory_order_relaxed);
    outSplit = split;
  }
  return result;
}

LedgerResult LatticeLedger::setPlatformFeeBps(BasisPoints newFeeBps,
                                              const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  PlatformState &platform = m_state->platform;
  if (caller != platform.admin) {
    LEDGER_WARN(std::format("setPlatformFeeBps - {} is not the admin", caller));
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
    return LedgerResult::NotAuthorized;
  }
  if (newFeeBps > MAX_PLATFORM_FEE_BPS) {
    LEDGER_WARN(std::format("setPlatformFeeBps - {} bps exceeds {} bps",
                            newFeeBps, MAX_PLATFORM_FEE_BPS));
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
    return LedgerResult::InvalidParameters;
  }

  LEDGER_INFO(std::format("Platform fee changed from {} to {} bps",
                          platform.platformFeeBps, newFeeBps));
  platform.platformFeeBps = newFeeBps;
  return LedgerResult::Success;
}

LedgerResult LatticeLedger::setAdmin(const AccountId &newAdmin,
                                     const AccountId &caller) {
  std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
  PlatformState &platform = m_state->platform;
  if (caller != platform.admin) {
    LEDGER_WARN(std::format("setAdmin - {} is not the admin", caller));
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
    return LedgerResult::NotAuthorized;
  }
  if (newAdmin.empty()) {
    LEDGER_WARN("setAdmin - new admin account is empty");
    m_stats.rejectedOperations.fetch_add(1, std::memory_order_relaxed);
    return LedgerResult::InvalidParameters;
  }

  LEDGER_INFO(std::format("Admin changed from {} to {}", platform.admin,
                          newAdmin));
  platform.admin = newAdmin;
  return LedgerResult::Success;
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

std::optional<Collection>
LatticeLedger::getCollection(CollectionId collectionId) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->collections.getCollection(collectionId);
}

std::optional<LatticeParameters>
LatticeLedger::getLatticeParameters(CollectionId collectionId) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->parameters.get(collectionId);
}

std::optional<Token> LatticeLedger::getNft(CollectionId collectionId,
                                           TokenIndex tokenIndex) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->tokens.getNft(TokenId(collectionId, tokenIndex));
}

std::optional<AccountId>
LatticeLedger::getNftOwner(CollectionId collectionId,
                           TokenIndex tokenIndex) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->tokens.getNftOwner(TokenId(collectionId, tokenIndex));
}

std::optional<Listing> LatticeLedger::getListing(CollectionId collectionId,
                                                 TokenIndex tokenIndex) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->market.getListing(TokenId(collectionId, tokenIndex));
}

std::vector<TokenId> LatticeLedger::getOwnedNfts(const AccountId &owner) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->ownership.getOwnedTokens(owner);
}

uint64_t LatticeLedger::getCollectionsCount() const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->collections.getCollectionsCount();
}

BasisPoints LatticeLedger::getPlatformFeeBps() const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->platform.platformFeeBps;
}

AccountId LatticeLedger::getAdmin() const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->platform.admin;
}

std::vector<Listing> LatticeLedger::getActiveListings() const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->market.getActiveListings();
}

std::vector<Listing>
LatticeLedger::getCollectionListings(CollectionId collectionId) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->market.getCollectionListings(collectionId);
}

std::vector<TokenId>
LatticeLedger::getCollectionTokens(CollectionId collectionId) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->tokens.getCollectionTokens(collectionId);
}

std::vector<CollectionId>
LatticeLedger::getCollectionsByCreator(const AccountId &creator) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  return m_state->collections.getCollectionsByCreator(creator);
}

std::optional<std::string>
LatticeLedger::getTokenMetadata(CollectionId collectionId,
                                TokenIndex tokenIndex) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  const Token *token = m_state->tokens.find(TokenId(collectionId, tokenIndex));
  const Collection *collection = m_state->collections.find(collectionId);
  const LatticeParameters *params = m_state->parameters.find(collectionId);
  if (!token || !collection || !params) {
    return std::nullopt;
  }
  return buildTokenMetadata(*collection, *params, *token).toString();
}

bool LatticeLedger::checkInvariants() const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  const LedgerState &state = *m_state;
  bool consistent = true;
  uint64_t expectedTokens = 0;

  for (CollectionId id = 1; id <= state.collections.getCollectionsCount(); ++id) {
    const Collection *collection = state.collections.find(id);
    if (collection->currentSupply > collection->maxSupply) {
      LEDGER_ERROR(std::format("Collection {} supply {} exceeds max {}", id,
                               collection->currentSupply,
                               collection->maxSupply));
      consistent = false;
    }
    if (!state.parameters.contains(id)) {
      LEDGER_ERROR(std::format("Collection {} has no lattice parameters", id));
      consistent = false;
    }
    expectedTokens += collection->currentSupply;

    for (const TokenId &tokenId : state.tokens.getCollectionTokens(id)) {
      const Token *token = state.tokens.find(tokenId);
      if (!token) {
        LEDGER_ERROR(std::format("{} is missing", tokenId.toString()));
        consistent = false;
      } else if (!state.ownership.contains(token->owner, tokenId)) {
        LEDGER_ERROR(std::format("{} is not indexed under its owner {}",
                                 tokenId.toString(), token->owner));
        consistent = false;
      }
    }
  }

  // Reverse direction: every indexed entry must match Token::owner
  const size_t cap = state.ownership.getMaxTokensPerAccount();
  for (const AccountId &owner : state.ownership.getOwners()) {
    const std::vector<TokenId> owned = state.ownership.getOwnedTokens(owner);
    if (owned.empty() || owned.size() > cap) {
      LEDGER_ERROR(std::format("Portfolio of {} holds {} tokens (cap {})", owner,
                               owned.size(), cap));
      consistent = false;
    }
    for (const TokenId &tokenId : owned) {
      const Token *token = state.tokens.find(tokenId);
      if (!token || token->owner != owner) {
        LEDGER_ERROR(std::format("Stale ownership entry {} for {}",
                                 tokenId.toString(), owner));
        consistent = false;
      }
    }
  }

  if (state.tokens.size() != expectedTokens ||
      state.ownership.totalEntries() != state.tokens.size()) {
    LEDGER_ERROR(std::format("Token count mismatch - registry: {}, index: {}, "
                             "supply: {}",
                             state.tokens.size(), state.ownership.totalEntries(),
                             expectedTokens));
    consistent = false;
  }

  for (const Listing &listing : state.market.getActiveListings()) {
    const Token *token = state.tokens.find(listing.tokenId);
    if (!token || token->owner != listing.seller) {
      LEDGER_ERROR(std::format("Listing of {} is not held by the token owner",
                               listing.tokenId.toString()));
      consistent = false;
    }
  }

  return consistent;
}

// ----------------------------------------------------------------------------
// Snapshots
// ----------------------------------------------------------------------------

bool LatticeLedger::saveSnapshot(const std::string &filepath) const {
  std::shared_lock<std::shared_mutex> lock(m_ledgerMutex);
  try {
    std::filesystem::path path(filepath);
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
      std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::out);
    if (!file.is_open()) {
      SNAPSHOT_ERROR("Could not open file " + filepath + " for writing");
      return false;
    }

    if (!writeSnapshotHeader(file)) {
      SNAPSHOT_ERROR("Failed to write snapshot header");
      return false;
    }

    BinarySerial::Writer writer(file);
    const LedgerState &state = *m_state;
    if (!writer.writeString(state.platform.admin) ||
        !writer.write(state.platform.platformFeeBps)) {
      SNAPSHOT_ERROR("Failed to write platform state");
      return false;
    }
    if (!writer.writeSerializable(state.parameters)) {
      SNAPSHOT_ERROR("Failed to write lattice parameters");
      return false;
    }
    if (!writer.writeSerializable(state.collections)) {
      SNAPSHOT_ERROR("Failed to write collections");
      return false;
    }
    if (!writer.writeSerializable(state.tokens)) {
      SNAPSHOT_ERROR("Failed to write tokens");
      return false;
    }
    if (!writer.writeSerializable(state.market)) {
      SNAPSHOT_ERROR("Failed to write listings");
      return false;
    }

    file.flush();
    if (!file.good()) {
      SNAPSHOT_ERROR("Write error on " + filepath);
      return false;
    }

    SNAPSHOT_INFO(std::format("Saved snapshot {} - {} collections, {} tokens, "
                              "{} listings",
                              filepath, state.collections.getCollectionsCount(),
                              state.tokens.size(), state.market.size()));
    return true;
  } catch (const std::exception &e) {
    SNAPSHOT_ERROR("Error saving snapshot: " + std::string(e.what()));
    return false;
  }
}

bool LatticeLedger::loadSnapshot(const std::string &filepath) {
  try {
    std::ifstream file(filepath, std::ios::binary | std::ios::in);
    if (!file.is_open()) {
      SNAPSHOT_ERROR("Could not open file for reading: " + filepath);
      return false;
    }

    if (!readSnapshotHeader(file)) {
      SNAPSHOT_ERROR("Invalid snapshot file format: " + filepath);
      return false;
    }

    // Built off to the side, swapped in only once fully validated
    std::unique_ptr<LedgerState> state = makeState();
    BinarySerial::Reader reader(file);

    PlatformState platform;
    if (!reader.readString(platform.admin) ||
        !reader.read(platform.platformFeeBps)) {
      SNAPSHOT_ERROR("Error reading platform state");
      return false;
    }
    if (platform.admin.empty() ||
        platform.platformFeeBps > MAX_PLATFORM_FEE_BPS) {
      SNAPSHOT_ERROR(std::format("Invalid platform state - admin: '{}', fee: {} bps",
                                 platform.admin, platform.platformFeeBps));
      return false;
    }
    state->platform = platform;

    if (!reader.readSerializable(state->parameters)) {
      SNAPSHOT_ERROR("Error reading lattice parameters");
      return false;
    }
    if (!reader.readSerializable(state->collections)) {
      SNAPSHOT_ERROR("Error reading collections");
      return false;
    }
    if (!reader.readSerializable(state->tokens)) {
      SNAPSHOT_ERROR("Error reading tokens");
      return false;
    }
    if (!reader.readSerializable(state->market)) {
      SNAPSHOT_ERROR("Error reading listings");
      return false;
    }
    if (file.peek() != std::ifstream::traits_type::eof()) {
      SNAPSHOT_ERROR("Unexpected data after listings in " + filepath);
      return false;
    }

    [[maybe_unused]] const uint64_t collections =
        state->collections.getCollectionsCount();
    [[maybe_unused]] const size_t tokens = state->tokens.size();
    [[maybe_unused]] const size_t listings = state->market.size();
    {
      std::unique_lock<std::shared_mutex> lock(m_ledgerMutex);
      m_state = std::move(state);
    }

    SNAPSHOT_INFO(std::format("Loaded snapshot {} - {} collections, {} tokens, "
                              "{} listings",
                              filepath, collections, tokens, listings));
    return true;
  } catch (const std::exception &e) {
    SNAPSHOT_ERROR("Error loading snapshot: " + std::string(e.what()));
    return false;
  }
}

} // namespace LatticeMint
