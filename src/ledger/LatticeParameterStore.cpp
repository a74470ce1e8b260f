/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/LatticeParameterStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace LatticeMint {

LedgerResult LatticeParameterStore::validate(const LatticeParameters &params,
                                             const LedgerConfig &config) {
  if (params.dimensions < 1) {
    PARAMS_WARN("Rejected lattice parameters - dimensions must be at least 1");
    return LedgerResult::InvalidParameters;
  }
  if (params.nodeCount < 2) {
    PARAMS_WARN(std::format(
        "Rejected lattice parameters - node count {} is below 2",
        params.nodeCount));
    return LedgerResult::InvalidParameters;
  }
  if (params.connections.size() > config.maxConnections ||
      params.transformations.size() > config.maxTransformations ||
      params.extraParams.size() > config.maxExtraParams) {
    PARAMS_WARN(std::format(
        "Rejected lattice parameters - list bounds exceeded ({} connections, "
        "{} transformations, {} extra params)",
        params.connections.size(), params.transformations.size(),
        params.extraParams.size()));
    return LedgerResult::InvalidParameters;
  }
  return LedgerResult::Success;
}

bool LatticeParameterStore::store(CollectionId collectionId,
                                  LatticeParameters params) {
  if (m_parameters.find(collectionId) != m_parameters.end()) {
    PARAMS_ERROR(std::format(
        "Parameters for collection {} already stored, refusing overwrite",
        collectionId));
    return false;
  }

  params.collectionId = collectionId;
  m_parameters.emplace(collectionId, std::move(params));
  PARAMS_DEBUG(std::format("Stored lattice parameters for collection {}",
                           collectionId));
  return true;
}

const LatticeParameters *
LatticeParameterStore::find(CollectionId collectionId) const {
  auto it = m_parameters.find(collectionId);
  return it == m_parameters.end() ? nullptr : &it->second;
}

std::optional<LatticeParameters>
LatticeParameterStore::get(CollectionId collectionId) const {
  const LatticeParameters *params = find(collectionId);
  if (!params) {
    return std::nullopt;
  }
  return *params;
}

bool LatticeParameterStore::contains(CollectionId collectionId) const {
  return m_parameters.find(collectionId) != m_parameters.end();
}

bool LatticeParameterStore::serialize(std::ostream &stream) const {
  BinarySerial::Writer writer(stream);

  // Sorted for a deterministic snapshot
  std::vector<CollectionId> ids;
  ids.reserve(m_parameters.size());
  for (const auto &[id, _] : m_parameters) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());

  if (!writer.writeCount(ids.size()))
    return false;

  for (CollectionId id : ids) {
    const LatticeParameters &params = m_parameters.at(id);
    SERIALIZE_PRIMITIVE(writer, params.collectionId)
    SERIALIZE_PRIMITIVE(writer, params.dimensions)
    SERIALIZE_PRIMITIVE(writer, params.nodeCount)
    SERIALIZE_STRING(writer, params.colorScheme)

    if (!writer.writeCount(params.connections.size()))
      return false;
    for (const auto &connection : params.connections) {
      SERIALIZE_PRIMITIVE(writer, connection.from)
      SERIALIZE_PRIMITIVE(writer, connection.to)
      SERIALIZE_PRIMITIVE(writer, connection.weight)
    }

    if (!writer.writeCount(params.transformations.size()))
      return false;
    for (const auto &transformation : params.transformations) {
      SERIALIZE_STRING(writer, transformation)
    }

    if (!writer.writeCount(params.extraParams.size()))
      return false;
    for (const auto &[key, value] : params.extraParams) {
      SERIALIZE_STRING(writer, key)
      SERIALIZE_STRING(writer, value)
    }
  }
  return writer.good();
}

bool LatticeParameterStore::deserialize(std::istream &stream) {
  BinarySerial::Reader reader(stream);
  std::unordered_map<CollectionId, LatticeParameters> loaded;

  size_t count = 0;
  if (!reader.readCount(count))
    return false;

  for (size_t i = 0; i < count; ++i) {
    LatticeParameters params;
    DESERIALIZE_PRIMITIVE(reader, params.collectionId)
    DESERIALIZE_PRIMITIVE(reader, params.dimensions)
    DESERIALIZE_PRIMITIVE(reader, params.nodeCount)
    DESERIALIZE_STRING(reader, params.colorScheme)

    size_t connectionCount = 0;
    if (!reader.readCount(connectionCount))
      return false;
    params.connections.resize(connectionCount);
    for (auto &connection : params.connections) {
      DESERIALIZE_PRIMITIVE(reader, connection.from)
      DESERIALIZE_PRIMITIVE(reader, connection.to)
      DESERIALIZE_PRIMITIVE(reader, connection.weight)
    }

    size_t transformationCount = 0;
    if (!reader.readCount(transformationCount))
      return false;
    params.transformations.resize(transformationCount);
    for (auto &transformation : params.transformations) {
      DESERIALIZE_STRING(reader, transformation)
    }

    size_t extraCount = 0;
    if (!reader.readCount(extraCount))
      return false;
    params.extraParams.resize(extraCount);
    for (auto &[key, value] : params.extraParams) {
      DESERIALIZE_STRING(reader, key)
      DESERIALIZE_STRING(reader, value)
    }

    if (params.collectionId == INVALID_COLLECTION_ID ||
        loaded.count(params.collectionId) > 0) {
      SNAPSHOT_ERROR(std::format("Invalid or duplicate parameter record for collection {}",
                                 params.collectionId));
      return false;
    }
    CollectionId id = params.collectionId;
    loaded.emplace(id, std::move(params));
  }

  m_parameters = std::move(loaded);
  return true;
}

} // namespace LatticeMint
