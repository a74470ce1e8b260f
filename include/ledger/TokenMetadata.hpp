/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TOKEN_METADATA_HPP
#define TOKEN_METADATA_HPP

#include "ledger/LedgerRecords.hpp"
#include "utils/JsonReader.hpp"

namespace LatticeMint {

/**
 * @brief Builds the metadata document served at a token's locator
 *
 * Seeds are emitted as decimal strings since JSON numbers lose precision
 * above 2^53. Lattice parameters appear under "attributes".
 */
JsonValue buildTokenMetadata(const Collection &collection,
                             const LatticeParameters &params,
                             const Token &token);

} // namespace LatticeMint

#endif // TOKEN_METADATA_HPP
