/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLECTION_REGISTRY_HPP
#define COLLECTION_REGISTRY_HPP

#include "core/LedgerConfig.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/LatticeParameterStore.hpp"
#include "ledger/LedgerRecords.hpp"
#include "utils/BinarySerializer.hpp"
#include <optional>
#include <vector>

namespace LatticeMint {

/**
 * @brief Owns every Collection record and its open/closed state
 *
 * Ids are assigned sequentially from 1 and records are never deleted, so the
 * record for id N lives at position N - 1. Not synchronized; LatticeLedger
 * serializes access.
 */
class CollectionRegistry : public ISerializable {
public:
  CollectionRegistry(LatticeParameterStore &parameterStore,
                     const LedgerConfig &config)
      : m_parameterStore(parameterStore), m_config(config) {}

  /**
   * @brief Validates and registers a collection together with its lattice
   * parameters
   * @param outId Receives the new id on Success, untouched otherwise
   * @return Success, InvalidParameters or InvalidRoyalty
   */
  LedgerResult createCollection(const AccountId &creator,
                                const CollectionDraft &draft,
                                LatticeParameters params, Height height,
                                CollectionId &outId);

  // Creator only
  LedgerResult setCollectionStatus(CollectionId collectionId, bool isOpen,
                                   const AccountId &caller);

  /**
   * @brief Compare-and-increment of currentSupply
   * @return The newly allocated token index, or INVALID_TOKEN_INDEX if the
   *         collection is unknown or already at maxSupply
   */
  TokenIndex allocateTokenIndex(CollectionId collectionId);

  const Collection *find(CollectionId collectionId) const;
  std::optional<Collection> getCollection(CollectionId collectionId) const;
  uint64_t getCollectionsCount() const { return m_collections.size(); }
  std::vector<CollectionId> getCollectionsByCreator(const AccountId &creator) const;

  DECLARE_SERIALIZABLE()

private:
  CollectionRegistry(const CollectionRegistry &) = delete;
  CollectionRegistry &operator=(const CollectionRegistry &) = delete;

  Collection *findMutable(CollectionId collectionId);

  std::vector<Collection> m_collections;
  LatticeParameterStore &m_parameterStore;
  const LedgerConfig &m_config;
};

} // namespace LatticeMint

#endif // COLLECTION_REGISTRY_HPP
