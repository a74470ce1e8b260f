/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEDGER_RECORDS_HPP
#define LEDGER_RECORDS_HPP

#include "core/LedgerTypes.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace LatticeMint {

/**
 * @brief A named, capped series of tokens sharing one set of lattice
 * parameters and royalty terms
 */
struct Collection {
  CollectionId id{INVALID_COLLECTION_ID};
  AccountId creator{};
  std::string name{};
  std::string description{};
  uint64_t maxSupply{0};
  uint64_t currentSupply{0};
  Amount mintPrice{0};
  BasisPoints royaltyBps{0};
  bool isOpen{true};
  Height createdAtHeight{0};
  std::string metadataLocator{};
};

/**
 * @brief Caller-supplied fields of a new collection
 */
struct CollectionDraft {
  std::string name{};
  std::string description{};
  uint64_t maxSupply{0};
  Amount mintPrice{0};
  BasisPoints royaltyBps{0};
  std::string metadataLocator{};
};

struct LatticeConnection {
  uint32_t from{0};
  uint32_t to{0};
  double weight{0.0};

  bool operator==(const LatticeConnection &other) const {
    return from == other.from && to == other.to && weight == other.weight;
  }
};

using LatticeTransformations = boost::container::small_vector<std::string, 8>;
using LatticeExtraParams =
    boost::container::small_vector<std::pair<std::string, std::string>, 8>;

/**
 * @brief Immutable structural description shared by every token of a
 * collection. Combined with a token seed it determines the rendering.
 */
struct LatticeParameters {
  CollectionId collectionId{INVALID_COLLECTION_ID};
  uint32_t dimensions{0};
  uint32_t nodeCount{0};
  std::vector<LatticeConnection> connections{};
  std::string colorScheme{};
  LatticeTransformations transformations{};
  LatticeExtraParams extraParams{};
};

struct Token {
  TokenId id{};
  AccountId owner{};
  uint64_t seed{0};
  Height mintedAtHeight{0};
  std::string metadataLocator{};
};

struct Listing {
  TokenId tokenId{};
  AccountId seller{};
  Amount price{0};
  Height listedAtHeight{0};
};

/**
 * @brief Three-way split of a sale price. The seller share is derived by
 * subtraction so the parts always sum to price.
 */
struct SettlementSplit {
  Amount price{0};
  Amount platformFee{0};
  Amount royalty{0};
  Amount sellerAmount{0};
};

} // namespace LatticeMint

#endif // LEDGER_RECORDS_HPP
