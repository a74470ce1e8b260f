/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/OwnershipIndex.hpp"
#include "core/Logger.hpp"
#include <format>
#include <iterator>

namespace LatticeMint {

bool OwnershipIndex::add(const AccountId &owner, const TokenId &tokenId) {
  Portfolio &portfolio = m_portfolios[owner];

  if (portfolio.positionOf.count(tokenId) > 0) {
    OWNERSHIP_ERROR(std::format("{} already indexed for {}", tokenId.toString(),
                                owner));
    return false;
  }
  if (portfolio.positionOf.size() >= m_maxTokensPerAccount) {
    OWNERSHIP_WARN(std::format("Portfolio of {} is full ({} tokens)", owner,
                               portfolio.positionOf.size()));
    if (portfolio.positionOf.empty()) {
      m_portfolios.erase(owner);
    }
    return false;
  }

  portfolio.acquisitionOrder.push_back(tokenId);
  portfolio.positionOf.emplace(tokenId,
                               std::prev(portfolio.acquisitionOrder.end()));
  ++m_totalEntries;
  return true;
}

bool OwnershipIndex::remove(const AccountId &owner, const TokenId &tokenId) {
  auto portfolioIt = m_portfolios.find(owner);
  if (portfolioIt == m_portfolios.end()) {
    OWNERSHIP_ERROR(std::format("Cannot remove {} - {} owns nothing",
                                tokenId.toString(), owner));
    return false;
  }

  Portfolio &portfolio = portfolioIt->second;
  auto entryIt = portfolio.positionOf.find(tokenId);
  if (entryIt == portfolio.positionOf.end()) {
    OWNERSHIP_ERROR(std::format("Cannot remove {} - not indexed for {}",
                                tokenId.toString(), owner));
    return false;
  }

  portfolio.acquisitionOrder.erase(entryIt->second);
  portfolio.positionOf.erase(entryIt);
  --m_totalEntries;

  if (portfolio.positionOf.empty()) {
    m_portfolios.erase(portfolioIt);
  }
  return true;
}

bool OwnershipIndex::contains(const AccountId &owner,
                              const TokenId &tokenId) const {
  auto it = m_portfolios.find(owner);
  return it != m_portfolios.end() && it->second.positionOf.count(tokenId) > 0;
}

bool OwnershipIndex::canAccept(const AccountId &owner) const {
  return count(owner) < m_maxTokensPerAccount;
}

size_t OwnershipIndex::count(const AccountId &owner) const {
  auto it = m_portfolios.find(owner);
  return it == m_portfolios.end() ? 0 : it->second.positionOf.size();
}

std::vector<TokenId> OwnershipIndex::getOwnedTokens(const AccountId &owner) const {
  auto it = m_portfolios.find(owner);
  if (it == m_portfolios.end()) {
    return {};
  }

  const std::list<TokenId> &order = it->second.acquisitionOrder;
  return std::vector<TokenId>(order.begin(), order.end());
}

std::vector<AccountId> OwnershipIndex::getOwners() const {
  std::vector<AccountId> owners;
  owners.reserve(m_portfolios.size());
  for (const auto &[owner, _] : m_portfolios) {
    owners.push_back(owner);
  }
  return owners;
}

void OwnershipIndex::clear() {
  m_portfolios.clear();
  m_totalEntries = 0;
}

} // namespace LatticeMint
