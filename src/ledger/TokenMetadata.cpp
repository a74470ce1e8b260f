/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ledger/TokenMetadata.hpp"
#include <format>

namespace LatticeMint {

namespace {

JsonValue connectionsToJson(const std::vector<LatticeConnection> &connections) {
  JsonArray array;
  array.reserve(connections.size());
  for (const auto &connection : connections) {
    JsonObject entry;
    entry["from"] = JsonValue(connection.from);
    entry["to"] = JsonValue(connection.to);
    entry["weight"] = JsonValue(connection.weight);
    array.emplace_back(std::move(entry));
  }
  return JsonValue(std::move(array));
}

JsonValue attributesToJson(const LatticeParameters &params) {
  JsonObject attributes;
  attributes["dimensions"] = JsonValue(params.dimensions);
  attributes["node_count"] = JsonValue(params.nodeCount);
  attributes["color_scheme"] = JsonValue(params.colorScheme);
  attributes["connections"] = connectionsToJson(params.connections);

  JsonArray transformations;
  for (const auto &transformation : params.transformations) {
    transformations.emplace_back(transformation);
  }
  attributes["transformations"] = JsonValue(std::move(transformations));

  JsonObject extra;
  for (const auto &[key, value] : params.extraParams) {
    extra[key] = JsonValue(value);
  }
  attributes["extra_params"] = JsonValue(std::move(extra));
  return JsonValue(std::move(attributes));
}

} // namespace

JsonValue buildTokenMetadata(const Collection &collection,
                             const LatticeParameters &params,
                             const Token &token) {
  JsonObject document;
  document["name"] = JsonValue(
      std::format("{} #{}", collection.name, token.id.getTokenIndex()));
  document["description"] = JsonValue(collection.description);
  document["collection_id"] = JsonValue(token.id.getCollectionId());
  document["token_index"] = JsonValue(token.id.getTokenIndex());
  document["seed"] = JsonValue(std::to_string(token.seed));
  document["owner"] = JsonValue(token.owner);
  document["minted_at_height"] = JsonValue(token.mintedAtHeight);
  document["locator"] = JsonValue(token.metadataLocator);
  document["attributes"] = attributesToJson(params);
  return JsonValue(std::move(document));
}

} // namespace LatticeMint
