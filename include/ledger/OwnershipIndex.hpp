/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OWNERSHIP_INDEX_HPP
#define OWNERSHIP_INDEX_HPP

#include "core/LedgerTypes.hpp"
#include <cstdint>
#include <list>
#include <unordered_map>
#include <vector>

namespace LatticeMint {

/**
 * @brief Per-account portfolio of owned tokens
 *
 * Derived index over Token::owner, never a source of truth. Add, remove and
 * membership are expected O(1). Enumeration returns tokens in the order the
 * account acquired them.
 */
class OwnershipIndex {
public:
  explicit OwnershipIndex(size_t maxTokensPerAccount)
      : m_maxTokensPerAccount(maxTokensPerAccount) {}

  // Refuses duplicates and full portfolios
  bool add(const AccountId &owner, const TokenId &tokenId);
  // Returns false if the entry was not present
  bool remove(const AccountId &owner, const TokenId &tokenId);

  bool contains(const AccountId &owner, const TokenId &tokenId) const;
  bool canAccept(const AccountId &owner) const;
  size_t count(const AccountId &owner) const;
  size_t totalEntries() const { return m_totalEntries; }
  size_t getMaxTokensPerAccount() const { return m_maxTokensPerAccount; }

  std::vector<TokenId> getOwnedTokens(const AccountId &owner) const;
  std::vector<AccountId> getOwners() const;

  void clear();

private:
  struct Portfolio {
    std::list<TokenId> acquisitionOrder;
    std::unordered_map<TokenId, std::list<TokenId>::iterator> positionOf;
  };

  std::unordered_map<AccountId, Portfolio> m_portfolios;
  size_t m_maxTokensPerAccount;
  size_t m_totalEntries{0};
};

} // namespace LatticeMint

#endif // OWNERSHIP_INDEX_HPP
