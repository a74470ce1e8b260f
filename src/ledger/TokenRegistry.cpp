/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/TokenRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace LatticeMint {

std::string TokenRegistry::makeLocator(const std::string &base,
                                       TokenIndex index) {
  return base + "/" + std::to_string(index);
}

LedgerResult TokenRegistry::mint(CollectionId collectionId, uint64_t seed,
                                 const AccountId &caller, Height height,
                                 TokenId &outTokenId) {
  const Collection *collection = m_collections.find(collectionId);
  if (!collection) {
    TOKEN_WARN(std::format("mint - collection {} not found", collectionId));
    return LedgerResult::CollectionNotFound;
  }
  if (!collection->isOpen) {
    TOKEN_WARN(std::format("mint - collection {} is closed", collectionId));
    return LedgerResult::CollectionClosed;
  }
  if (collection->currentSupply >= collection->maxSupply) {
    TOKEN_WARN(std::format("mint - collection {} reached its supply of {}",
                           collectionId, collection->maxSupply));
    return LedgerResult::CollectionLimitReached;
  }
  if (!m_ownership.canAccept(caller)) {
    TOKEN_WARN(std::format("mint - portfolio of {} is full", caller));
    return LedgerResult::PortfolioFull;
  }
  if (m_balances.balanceOf(caller) < collection->mintPrice) {
    TOKEN_WARN(std::format("mint - {} cannot pay mint price {}", caller,
                           collection->mintPrice));
    return LedgerResult::InsufficientPayment;
  }

  const AccountId creator = collection->creator;
  const Amount price = collection->mintPrice;
  const std::string baseLocator = collection->metadataLocator;

  if (price > 0 && m_balances.transfer(price, caller, creator) !=
                       BalanceTransferResult::Success) {
    TOKEN_WARN(std::format("mint - payment of {} from {} refused", price,
                           caller));
    return LedgerResult::InsufficientPayment;
  }

  TokenIndex index = m_collections.allocateTokenIndex(collectionId);
  if (index == INVALID_TOKEN_INDEX) {
    // Supply was checked above under the same ledger lock
    TOKEN_CRITICAL(std::format("mint - index allocation failed for collection {}",
                               collectionId));
    if (price > 0 && m_balances.transfer(price, creator, caller) !=
                         BalanceTransferResult::Success) {
      TOKEN_CRITICAL(std::format("mint - refund of {} to {} failed", price,
                                 caller));
    }
    return LedgerResult::CollectionLimitReached;
  }

  Token token;
  token.id = TokenId(collectionId, index);
  token.owner = caller;
  token.seed = seed;
  token.mintedAtHeight = height;
  token.metadataLocator = makeLocator(baseLocator, index);

  const TokenId tokenId = token.id;
  m_tokens.emplace(tokenId, std::move(token));
  if (!m_ownership.add(caller, tokenId)) {
    TOKEN_CRITICAL(std::format("mint - ownership index refused {} for {}",
                               tokenId.toString(), caller));
  }

  TOKEN_INFO(std::format("Minted {} to {} (seed {}, paid {})",
                         tokenId.toString(), caller, seed, price));
  outTokenId = tokenId;
  return LedgerResult::Success;
}

LedgerResult TokenRegistry::canTransfer(const TokenId &tokenId,
                                        const AccountId &from,
                                        const AccountId &to) const {
  const Token *token = find(tokenId);
  if (!token) {
    return LedgerResult::NftNotFound;
  }
  if (token->owner != from) {
    return LedgerResult::NotOwner;
  }
  if (to != from && !m_ownership.canAccept(to)) {
    return LedgerResult::PortfolioFull;
  }
  return LedgerResult::Success;
}

LedgerResult TokenRegistry::transfer(const TokenId &tokenId,
                                     const AccountId &from,
                                     const AccountId &to) {
  LedgerResult check = canTransfer(tokenId, from, to);
  if (check != LedgerResult::Success) {
    TOKEN_WARN(std::format("transfer of {} from {} to {} rejected - {}",
                           tokenId.toString(), from, to,
                           ledgerResultToString(check)));
    return check;
  }

  // Every successful transfer notifies, including one to the current owner
  for (const auto &listener : m_transferListeners) {
    listener(tokenId, from, to);
  }

  if (from == to) {
    return LedgerResult::Success;
  }

  m_tokens.at(tokenId).owner = to;
  if (!m_ownership.remove(from, tokenId) || !m_ownership.add(to, tokenId)) {
    TOKEN_CRITICAL(std::format("Ownership index out of sync moving {} from {} to {}",
                               tokenId.toString(), from, to));
  }

  TOKEN_INFO(std::format("Transferred {} from {} to {}", tokenId.toString(),
                         from, to));
  return LedgerResult::Success;
}

LedgerResult TokenRegistry::transferNft(const TokenId &tokenId,
                                        const AccountId &recipient,
                                        const AccountId &caller) {
  const Token *token = find(tokenId);
  if (!token) {
    TOKEN_WARN(std::format("transferNft - {} not found", tokenId.toString()));
    return LedgerResult::NftNotFound;
  }
  if (token->owner != caller) {
    TOKEN_WARN(std::format("transferNft - {} does not own {}", caller,
                           tokenId.toString()));
    return LedgerResult::NotOwner;
  }
  return transfer(tokenId, caller, recipient);
}

const Token *TokenRegistry::find(const TokenId &tokenId) const {
  auto it = m_tokens.find(tokenId);
  return it == m_tokens.end() ? nullptr : &it->second;
}

std::optional<Token> TokenRegistry::getNft(const TokenId &tokenId) const {
  const Token *token = find(tokenId);
  if (!token) {
    return std::nullopt;
  }
  return *token;
}

std::optional<AccountId>
TokenRegistry::getNftOwner(const TokenId &tokenId) const {
  const Token *token = find(tokenId);
  if (!token) {
    return std::nullopt;
  }
  return token->owner;
}

std::vector<TokenId>
TokenRegistry::getCollectionTokens(CollectionId collectionId) const {
  const Collection *collection = m_collections.find(collectionId);
  if (!collection) {
    return {};
  }

  // Indices 1..currentSupply all exist, nothing is ever burned
  std::vector<TokenId> tokens;
  tokens.reserve(collection->currentSupply);
  for (TokenIndex index = 1; index <= collection->currentSupply; ++index) {
    tokens.emplace_back(collectionId, index);
  }
  return tokens;
}

void TokenRegistry::addTransferListener(TransferListener listener) {
  m_transferListeners.push_back(std::move(listener));
}

bool TokenRegistry::serialize(std::ostream &stream) const {
  BinarySerial::Writer writer(stream);

  std::vector<TokenId> ids;
  ids.reserve(m_tokens.size());
  for (const auto &[id, _] : m_tokens) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());

  if (!writer.writeCount(ids.size()))
    return false;

  for (const TokenId &id : ids) {
    const Token &token = m_tokens.at(id);
    SERIALIZE_PRIMITIVE(writer, id.getCollectionId())
    SERIALIZE_PRIMITIVE(writer, id.getTokenIndex())
    SERIALIZE_STRING(writer, token.owner)
    SERIALIZE_PRIMITIVE(writer, token.seed)
    SERIALIZE_PRIMITIVE(writer, token.mintedAtHeight)
    SERIALIZE_STRING(writer, token.metadataLocator)
  }
  return writer.good();
}

bool TokenRegistry::deserialize(std::istream &stream) {
  BinarySerial::Reader reader(stream);
  std::unordered_map<TokenId, Token> loaded;

  size_t count = 0;
  if (!reader.readCount(count))
    return false;

  for (size_t i = 0; i < count; ++i) {
    CollectionId collectionId = INVALID_COLLECTION_ID;
    TokenIndex tokenIndex = INVALID_TOKEN_INDEX;
    Token token;
    DESERIALIZE_PRIMITIVE(reader, collectionId)
    DESERIALIZE_PRIMITIVE(reader, tokenIndex)
    DESERIALIZE_STRING(reader, token.owner)
    DESERIALIZE_PRIMITIVE(reader, token.seed)
    DESERIALIZE_PRIMITIVE(reader, token.mintedAtHeight)
    DESERIALIZE_STRING(reader, token.metadataLocator)
    token.id = TokenId(collectionId, tokenIndex);

    const Collection *collection = m_collections.find(collectionId);
    if (!token.id.isValid() || !collection ||
        tokenIndex > collection->currentSupply || loaded.count(token.id) > 0) {
      SNAPSHOT_ERROR(std::format("Token record {} violates registry invariants",
                                 token.id.toString()));
      return false;
    }
    const TokenId id = token.id;
    loaded.emplace(id, std::move(token));
  }

  // Every index up to currentSupply must be present
  uint64_t expected = 0;
  for (CollectionId id = 1; id <= m_collections.getCollectionsCount(); ++id) {
    expected += m_collections.find(id)->currentSupply;
  }
  if (expected != loaded.size()) {
    SNAPSHOT_ERROR(std::format("Snapshot holds {} tokens, collections account for {}",
                               loaded.size(), expected));
    return false;
  }

  std::vector<TokenId> ids;
  ids.reserve(loaded.size());
  for (const auto &[id, _] : loaded) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());

  m_ownership.clear();
  for (const TokenId &id : ids) {
    if (!m_ownership.add(loaded.at(id).owner, id)) {
      SNAPSHOT_ERROR(std::format("Could not index {} for {}", id.toString(),
                                 loaded.at(id).owner));
      m_ownership.clear();
      return false;
    }
  }

  m_tokens = std::move(loaded);
  return true;
}

} // namespace LatticeMint
