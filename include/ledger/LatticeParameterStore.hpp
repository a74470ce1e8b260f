/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LATTICE_PARAMETER_STORE_HPP
#define LATTICE_PARAMETER_STORE_HPP

#include "core/LedgerConfig.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/LedgerRecords.hpp"
#include "utils/BinarySerializer.hpp"
#include <optional>
#include <unordered_map>

namespace LatticeMint {

/**
 * @brief Write-once store of the structural parameters of each collection
 *
 * Parameters are part of the asset's identity: once a collection exists its
 * parameters can be read but never replaced or removed.
 */
class LatticeParameterStore : public ISerializable {
public:
  LatticeParameterStore() = default;

  /**
   * @brief Checks structural bounds (dimensions, node count, list sizes)
   * @return Success or InvalidParameters
   */
  static LedgerResult validate(const LatticeParameters &params,
                               const LedgerConfig &config);

  // Returns false if parameters already exist for collectionId
  bool store(CollectionId collectionId, LatticeParameters params);

  const LatticeParameters *find(CollectionId collectionId) const;
  std::optional<LatticeParameters> get(CollectionId collectionId) const;
  bool contains(CollectionId collectionId) const;
  size_t size() const { return m_parameters.size(); }

  DECLARE_SERIALIZABLE()

private:
  LatticeParameterStore(const LatticeParameterStore &) = delete;
  LatticeParameterStore &operator=(const LatticeParameterStore &) = delete;

  std::unordered_map<CollectionId, LatticeParameters> m_parameters;
};

} // namespace LatticeMint

#endif // LATTICE_PARAMETER_STORE_HPP
