/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/CollectionRegistry.hpp"
#include "core/Logger.hpp"
#include <format>

namespace LatticeMint {

LedgerResult CollectionRegistry::createCollection(const AccountId &creator,
                                                  const CollectionDraft &draft,
                                                  LatticeParameters params,
                                                  Height height,
                                                  CollectionId &outId) {
  if (draft.maxSupply == 0) {
    COLLECTION_WARN("createCollection rejected - maxSupply must be positive");
    return LedgerResult::InvalidParameters;
  }
  if (draft.royaltyBps > MAX_ROYALTY_BPS) {
    COLLECTION_WARN(std::format(
        "createCollection rejected - royalty {} bps exceeds {} bps",
        draft.royaltyBps, MAX_ROYALTY_BPS));
    return LedgerResult::InvalidRoyalty;
  }
  if (draft.name.size() > m_config.maxNameLength ||
      draft.description.size() > m_config.maxDescriptionLength) {
    COLLECTION_WARN("createCollection rejected - name or description too long");
    return LedgerResult::InvalidParameters;
  }

  LedgerResult paramsResult = LatticeParameterStore::validate(params, m_config);
  if (paramsResult != LedgerResult::Success) {
    return paramsResult;
  }

  CollectionId id = m_collections.size() + 1;

  // Parameters first: it is the only step that can refuse
  if (!m_parameterStore.store(id, std::move(params))) {
    COLLECTION_CRITICAL(std::format(
        "Parameter store already holds collection {}, registry out of sync", id));
    return LedgerResult::InvalidParameters;
  }

  Collection collection;
  collection.id = id;
  collection.creator = creator;
  collection.name = draft.name;
  collection.description = draft.description;
  collection.maxSupply = draft.maxSupply;
  collection.currentSupply = 0;
  collection.mintPrice = draft.mintPrice;
  collection.royaltyBps = draft.royaltyBps;
  collection.isOpen = true;
  collection.createdAtHeight = height;
  collection.metadataLocator = draft.metadataLocator;
  m_collections.push_back(std::move(collection));

  COLLECTION_INFO(std::format(
      "Created collection {} '{}' by {} - maxSupply: {}, mintPrice: {}, royalty: {} bps",
      id, draft.name, creator, draft.maxSupply, draft.mintPrice,
      draft.royaltyBps));

  outId = id;
  return LedgerResult::Success;
}

LedgerResult CollectionRegistry::setCollectionStatus(CollectionId collectionId,
                                                     bool isOpen,
                                                     const AccountId &caller) {
  Collection *collection = findMutable(collectionId);
  if (!collection) {
    COLLECTION_WARN(std::format("setCollectionStatus - collection {} not found",
                                collectionId));
    return LedgerResult::CollectionNotFound;
  }
  if (collection->creator != caller) {
    COLLECTION_WARN(std::format(
        "setCollectionStatus - {} is not the creator of collection {}", caller,
        collectionId));
    return LedgerResult::NotAuthorized;
  }

  collection->isOpen = isOpen;
  COLLECTION_INFO(std::format("Collection {} is now {}", collectionId,
                              isOpen ? "open" : "closed"));
  return LedgerResult::Success;
}

TokenIndex CollectionRegistry::allocateTokenIndex(CollectionId collectionId) {
  Collection *collection = findMutable(collectionId);
  if (!collection || collection->currentSupply >= collection->maxSupply) {
    return INVALID_TOKEN_INDEX;
  }
  return ++collection->currentSupply;
}

const Collection *CollectionRegistry::find(CollectionId collectionId) const {
  if (collectionId == INVALID_COLLECTION_ID ||
      collectionId > m_collections.size()) {
    return nullptr;
  }
  return &m_collections[collectionId - 1];
}

Collection *CollectionRegistry::findMutable(CollectionId collectionId) {
  return const_cast<Collection *>(
      static_cast<const CollectionRegistry *>(this)->find(collectionId));
}

std::optional<Collection>
CollectionRegistry::getCollection(CollectionId collectionId) const {
  const Collection *collection = find(collectionId);
  if (!collection) {
    return std::nullopt;
  }
  return *collection;
}

std::vector<CollectionId>
CollectionRegistry::getCollectionsByCreator(const AccountId &creator) const {
  std::vector<CollectionId> ids;
  for (const auto &collection : m_collections) {
    if (collection.creator == creator) {
      ids.push_back(collection.id);
    }
  }
  return ids;
}

bool CollectionRegistry::serialize(std::ostream &stream) const {
  BinarySerial::Writer writer(stream);

  if (!writer.writeCount(m_collections.size()))
    return false;

  for (const auto &collection : m_collections) {
    SERIALIZE_PRIMITIVE(writer, collection.id)
    SERIALIZE_STRING(writer, collection.creator)
    SERIALIZE_STRING(writer, collection.name)
    SERIALIZE_STRING(writer, collection.description)
    SERIALIZE_PRIMITIVE(writer, collection.maxSupply)
    SERIALIZE_PRIMITIVE(writer, collection.currentSupply)
    SERIALIZE_PRIMITIVE(writer, collection.mintPrice)
    SERIALIZE_PRIMITIVE(writer, collection.royaltyBps)
    if (!writer.writeBool(collection.isOpen))
      return false;
    SERIALIZE_PRIMITIVE(writer, collection.createdAtHeight)
    SERIALIZE_STRING(writer, collection.metadataLocator)
  }
  return writer.good();
}

bool CollectionRegistry::deserialize(std::istream &stream) {
  BinarySerial::Reader reader(stream);
  std::vector<Collection> loaded;

  size_t count = 0;
  if (!reader.readCount(count))
    return false;
  loaded.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    Collection collection;
    DESERIALIZE_PRIMITIVE(reader, collection.id)
    DESERIALIZE_STRING(reader, collection.creator)
    DESERIALIZE_STRING(reader, collection.name)
    DESERIALIZE_STRING(reader, collection.description)
    DESERIALIZE_PRIMITIVE(reader, collection.maxSupply)
    DESERIALIZE_PRIMITIVE(reader, collection.currentSupply)
    DESERIALIZE_PRIMITIVE(reader, collection.mintPrice)
    DESERIALIZE_PRIMITIVE(reader, collection.royaltyBps)
    if (!reader.readBool(collection.isOpen))
      return false;
    DESERIALIZE_PRIMITIVE(reader, collection.createdAtHeight)
    DESERIALIZE_STRING(reader, collection.metadataLocator)

    if (collection.id != i + 1 || collection.maxSupply == 0 ||
        collection.currentSupply > collection.maxSupply ||
        collection.royaltyBps > MAX_ROYALTY_BPS ||
        !m_parameterStore.contains(collection.id)) {
      SNAPSHOT_ERROR(std::format("Collection record {} violates registry invariants",
                                 collection.id));
      return false;
    }
    loaded.push_back(std::move(collection));
  }

  if (loaded.size() != m_parameterStore.size()) {
    SNAPSHOT_ERROR("Parameter records do not match collection records");
    return false;
  }

  m_collections = std::move(loaded);
  return true;
}

} // namespace LatticeMint
