/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/LedgerConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <limits>

namespace LatticeMint {

namespace {

template <typename T>
void readUnsigned(const JsonValue &root, const char *key, T &target) {
  if (!root.hasKey(key)) {
    return;
  }
  auto value = root[key].tryAsUnsigned();
  if (!value || *value > std::numeric_limits<T>::max()) {
    CONFIG_WARN(std::format(
        "Config key '{}' is not a non-negative integer, keeping {}", key,
        target));
    return;
  }
  target = static_cast<T>(*value);
}

bool applyConfig(const JsonReader &reader, const std::string &source,
                 LedgerConfig &config) {
  const JsonValue &root = reader.getRoot();
  if (!root.isObject()) {
    CONFIG_ERROR("Config root is not a JSON object: " + source);
    return false;
  }

  LedgerConfig loaded = config;

  if (root.hasKey("admin")) {
    auto admin = root["admin"].tryAsString();
    if (admin) {
      loaded.admin = *admin;
    } else {
      CONFIG_WARN("Config key 'admin' is not a string, skipping");
    }
  }

  readUnsigned(root, "platform_fee_bps", loaded.platformFeeBps);
  readUnsigned(root, "max_tokens_per_account", loaded.maxTokensPerAccount);
  readUnsigned(root, "max_connections", loaded.maxConnections);
  readUnsigned(root, "max_transformations", loaded.maxTransformations);
  readUnsigned(root, "max_extra_params", loaded.maxExtraParams);
  readUnsigned(root, "max_name_length", loaded.maxNameLength);
  readUnsigned(root, "max_description_length", loaded.maxDescriptionLength);

  for (const auto &[key, _] : root.asObject()) {
    if (key != "admin" && key != "platform_fee_bps" &&
        key != "max_tokens_per_account" && key != "max_connections" &&
        key != "max_transformations" && key != "max_extra_params" &&
        key != "max_name_length" && key != "max_description_length") {
      CONFIG_WARN("Unknown config key '" + key + "', ignoring");
    }
  }

  if (!loaded.isValid()) {
    CONFIG_ERROR(std::format(
        "Invalid ledger configuration in {} (admin '{}', fee {} bps)", source,
        loaded.admin, loaded.platformFeeBps));
    return false;
  }

  config = loaded;
  CONFIG_INFO(std::format("Loaded ledger configuration from {} - admin: {}, fee: {} bps",
                          source, config.admin, config.platformFeeBps));
  return true;
}

} // namespace

bool loadLedgerConfig(const std::string &filepath, LedgerConfig &config) {
  JsonReader reader;
  if (!reader.loadFromFile(filepath)) {
    CONFIG_ERROR("Failed to load config from file: " + filepath + " - " +
                 reader.getLastError());
    return false;
  }
  return applyConfig(reader, filepath, config);
}

bool parseLedgerConfig(const std::string &json, LedgerConfig &config) {
  JsonReader reader;
  if (!reader.parse(json)) {
    CONFIG_ERROR("Failed to parse config - " + reader.getLastError());
    return false;
  }
  return applyConfig(reader, "<memory>", config);
}

} // namespace LatticeMint
