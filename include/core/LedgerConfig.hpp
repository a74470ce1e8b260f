/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEDGER_CONFIG_HPP
#define LEDGER_CONFIG_HPP

#include "core/LedgerTypes.hpp"
#include <cstddef>
#include <string>

namespace LatticeMint {

/**
 * @brief Startup configuration for a LatticeLedger instance
 *
 * The admin account is the deployer and becomes the first platform admin.
 * List bounds cap the size of the lattice parameters accepted at collection
 * creation.
 */
struct LedgerConfig {
  AccountId admin{};
  BasisPoints platformFeeBps{250};
  size_t maxTokensPerAccount{1000};
  size_t maxConnections{512};
  size_t maxTransformations{32};
  size_t maxExtraParams{32};
  size_t maxNameLength{128};
  size_t maxDescriptionLength{4096};

  bool isValid() const {
    return !admin.empty() && platformFeeBps <= MAX_PLATFORM_FEE_BPS &&
           maxTokensPerAccount > 0 && maxConnections > 0 &&
           maxTransformations > 0 && maxExtraParams > 0 && maxNameLength > 0 &&
           maxDescriptionLength > 0;
  }
};

/**
 * @brief Loads a LedgerConfig from a JSON file
 * @param filepath Path to a JSON object with snake_case keys
 * @param config Receives the loaded values; keys absent from the file keep
 *               the value already in config
 * @return true if the file parsed and the resulting config is valid. On
 *         failure config is left unchanged.
 */
bool loadLedgerConfig(const std::string &filepath, LedgerConfig &config);

/**
 * @brief Same as loadLedgerConfig but reads from an in-memory JSON string
 */
bool parseLedgerConfig(const std::string &json, LedgerConfig &config);

} // namespace LatticeMint

#endif // LEDGER_CONFIG_HPP
