/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEDGER_TYPES_HPP
#define LEDGER_TYPES_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace LatticeMint {

// Account identity as verified by the embedding service
using AccountId = std::string;
using Amount = uint64_t;
using Height = uint64_t;
using CollectionId = uint64_t;
using TokenIndex = uint64_t;
using BasisPoints = uint32_t;

inline constexpr BasisPoints BPS_DENOMINATOR = 10000;
inline constexpr BasisPoints MAX_ROYALTY_BPS = 3000;
inline constexpr BasisPoints MAX_PLATFORM_FEE_BPS = 1000;
inline constexpr CollectionId INVALID_COLLECTION_ID = 0;
inline constexpr TokenIndex INVALID_TOKEN_INDEX = 0;

/**
 * @brief Identity of a minted token: (collection, index within collection)
 *
 * Both components start at 1, so a default-constructed TokenId is invalid.
 * Ordering is by collection first, then index.
 */
class TokenId {
public:
  constexpr TokenId() noexcept
      : m_collectionId(INVALID_COLLECTION_ID), m_tokenIndex(INVALID_TOKEN_INDEX) {}

  constexpr TokenId(CollectionId collectionId, TokenIndex tokenIndex) noexcept
      : m_collectionId(collectionId), m_tokenIndex(tokenIndex) {}

  constexpr CollectionId getCollectionId() const noexcept {
    return m_collectionId;
  }
  constexpr TokenIndex getTokenIndex() const noexcept { return m_tokenIndex; }

  constexpr bool isValid() const noexcept {
    return m_collectionId != INVALID_COLLECTION_ID &&
           m_tokenIndex != INVALID_TOKEN_INDEX;
  }

  constexpr bool operator==(const TokenId &other) const noexcept {
    return m_collectionId == other.m_collectionId &&
           m_tokenIndex == other.m_tokenIndex;
  }

  constexpr bool operator!=(const TokenId &other) const noexcept {
    return !(*this == other);
  }

  constexpr bool operator<(const TokenId &other) const noexcept {
    if (m_collectionId != other.m_collectionId)
      return m_collectionId < other.m_collectionId;
    return m_tokenIndex < other.m_tokenIndex;
  }

  std::size_t hash() const noexcept {
    // boost::hash_combine style mix of the two halves
    std::size_t seed = std::hash<uint64_t>{}(m_collectionId);
    seed ^= std::hash<uint64_t>{}(m_tokenIndex) + 0x9e3779b97f4a7c15ULL +
            (seed << 6) + (seed >> 2);
    return seed;
  }

  std::string toString() const {
    if (!isValid())
      return "TokenId::INVALID";
    return "TokenId(" + std::to_string(m_collectionId) + ":" +
           std::to_string(m_tokenIndex) + ")";
  }

private:
  CollectionId m_collectionId;
  TokenIndex m_tokenIndex;
};

/**
 * @brief Outcome of every state-mutating ledger operation
 *
 * Every non-Success value is a precondition rejection: the operation had no
 * side effects.
 */
enum class LedgerResult {
  Success,
  NotAuthorized,
  CollectionNotFound,
  CollectionClosed,
  CollectionLimitReached,
  InvalidParameters,
  InvalidRoyalty,
  InsufficientPayment,
  NftNotFound,
  NotOwner,
  ListingExists,
  ListingNotFound,
  PortfolioFull
};

inline const char *ledgerResultToString(LedgerResult result) {
  switch (result) {
  case LedgerResult::Success:
    return "Success";
  case LedgerResult::NotAuthorized:
    return "NotAuthorized";
  case LedgerResult::CollectionNotFound:
    return "CollectionNotFound";
  case LedgerResult::CollectionClosed:
    return "CollectionClosed";
  case LedgerResult::CollectionLimitReached:
    return "CollectionLimitReached";
  case LedgerResult::InvalidParameters:
    return "InvalidParameters";
  case LedgerResult::InvalidRoyalty:
    return "InvalidRoyalty";
  case LedgerResult::InsufficientPayment:
    return "InsufficientPayment";
  case LedgerResult::NftNotFound:
    return "NftNotFound";
  case LedgerResult::NotOwner:
    return "NotOwner";
  case LedgerResult::ListingExists:
    return "ListingExists";
  case LedgerResult::ListingNotFound:
    return "ListingNotFound";
  case LedgerResult::PortfolioFull:
    return "PortfolioFull";
  }
  return "Unknown";
}

// Stream operator for LedgerResult (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, LedgerResult result) {
  return os << ledgerResultToString(result);
}

inline std::ostream &operator<<(std::ostream &os, const TokenId &tokenId) {
  return os << tokenId.toString();
}

} // namespace LatticeMint

// Hash function for std::unordered_map support
namespace std {
template <> struct hash<LatticeMint::TokenId> {
  std::size_t operator()(const LatticeMint::TokenId &tokenId) const noexcept {
    return tokenId.hash();
  }
};
} // namespace std

#endif // LEDGER_TYPES_HPP
