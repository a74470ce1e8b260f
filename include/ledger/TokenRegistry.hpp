/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TOKEN_REGISTRY_HPP
#define TOKEN_REGISTRY_HPP

#include "core/BalanceLedger.hpp"
#include "core/LedgerTypes.hpp"
#include "ledger/CollectionRegistry.hpp"
#include "ledger/LedgerRecords.hpp"
#include "ledger/OwnershipIndex.hpp"
#include "utils/BinarySerializer.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace LatticeMint {

/**
 * @brief Sole authority over token existence and ownership
 *
 * Every ownership change goes through transfer(), which notifies transfer
 * listeners (the marketplace drops listings there) and keeps the
 * OwnershipIndex in step with Token::owner.
 */
class TokenRegistry : public ISerializable {
public:
  using TransferListener =
      std::function<void(const TokenId &tokenId, const AccountId &from,
                         const AccountId &to)>;

  TokenRegistry(CollectionRegistry &collections, OwnershipIndex &ownership,
                IBalanceLedger &balances)
      : m_collections(collections), m_ownership(ownership),
        m_balances(balances) {}

  /**
   * @brief Mints the next token of a collection to caller, paying mintPrice
   * to the collection creator
   * @param outTokenId Receives the new token id on Success
   * @return Success, CollectionNotFound, CollectionClosed,
   *         CollectionLimitReached, PortfolioFull or InsufficientPayment
   */
  LedgerResult mint(CollectionId collectionId, uint64_t seed,
                    const AccountId &caller, Height height, TokenId &outTokenId);

  /**
   * @brief Ownership move primitive shared by direct transfers and sales
   * @return Success, NftNotFound, NotOwner or PortfolioFull
   */
  LedgerResult transfer(const TokenId &tokenId, const AccountId &from,
                        const AccountId &to);

  // Same checks as transfer() without mutating anything
  LedgerResult canTransfer(const TokenId &tokenId, const AccountId &from,
                           const AccountId &to) const;

  // Caller-facing wrapper: caller must be the current owner
  LedgerResult transferNft(const TokenId &tokenId, const AccountId &recipient,
                           const AccountId &caller);

  const Token *find(const TokenId &tokenId) const;
  std::optional<Token> getNft(const TokenId &tokenId) const;
  std::optional<AccountId> getNftOwner(const TokenId &tokenId) const;
  std::vector<TokenId> getCollectionTokens(CollectionId collectionId) const;
  size_t size() const { return m_tokens.size(); }

  void addTransferListener(TransferListener listener);

  // Rebuilds the OwnershipIndex from token owners on load
  DECLARE_SERIALIZABLE()

private:
  TokenRegistry(const TokenRegistry &) = delete;
  TokenRegistry &operator=(const TokenRegistry &) = delete;

  static std::string makeLocator(const std::string &base, TokenIndex index);

  std::unordered_map<TokenId, Token> m_tokens;
  std::vector<TransferListener> m_transferListeners;
  CollectionRegistry &m_collections;
  OwnershipIndex &m_ownership;
  IBalanceLedger &m_balances;
};

} // namespace LatticeMint

#endif // TOKEN_REGISTRY_HPP
