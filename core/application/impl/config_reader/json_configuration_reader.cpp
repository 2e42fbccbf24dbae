/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/json_configuration_reader.hpp"

#include <algorithm>
#include <array>
#include <charconv>

#include <boost/property_tree/json_parser.hpp>

#include "application/impl/config_reader/error.hpp"

namespace blockforge::application {
  namespace pt = boost::property_tree;

  namespace {
    constexpr std::string_view kCoinbasePayment = "coinbase_payment";
    constexpr std::string_view kDeadline = "build_duration_deadline_ms";
    constexpr std::string_view kPrivateKey = "filler_tx_private_key";
    constexpr std::string_view kTxValue = "filler_tx_value";

    constexpr std::array kKnownEntries{
        kCoinbasePayment, kDeadline, kPrivateKey, kTxValue};

    // property_tree keeps every json scalar as a string, json null included
    bool isNull(const pt::ptree &entry) {
      return entry.empty() and entry.data() == "null";
    }

    outcome::result<uint64_t> parseUint(const pt::ptree &entry) {
      if (not entry.empty()) {
        return ConfigReaderError::INVALID_VALUE;
      }
      const auto &str = entry.data();
      uint64_t value{};
      auto [ptr, ec] =
          std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return ConfigReaderError::INVALID_VALUE;
      }
      return value;
    }

    outcome::result<bool> parseBool(const pt::ptree &entry) {
      if (entry.empty()) {
        if (entry.data() == "true") {
          return true;
        }
        if (entry.data() == "false") {
          return false;
        }
      }
      return ConfigReaderError::INVALID_VALUE;
    }
  }  // namespace

  outcome::result<FillerBuilderConfig> JsonConfigurationReader::initConfig(
      std::istream &config_file_data) {
    OUTCOME_TRY(tree, readPropertyTree(config_file_data));
    return initConfigFromPropertyTree(tree);
  }

  outcome::result<FillerBuilderConfig>
  JsonConfigurationReader::initConfigFromPropertyTree(const pt::ptree &tree) {
    for (const auto &[key, _] : tree) {
      if (std::find(kKnownEntries.begin(), kKnownEntries.end(), key)
          == kKnownEntries.end()) {
        return ConfigReaderError::UNKNOWN_ENTRY;
      }
    }

    FillerBuilderConfig config;

    if (auto entry = tree.get_child_optional(std::string{kCoinbasePayment})) {
      OUTCOME_TRY(value, parseBool(*entry));
      config.coinbase_payment = value;
    }

    if (auto entry = tree.get_child_optional(std::string{kDeadline});
        entry and not isNull(*entry)) {
      OUTCOME_TRY(value, parseUint(*entry));
      config.build_duration_deadline_ms = value;
    }

    auto key_entry = tree.get_child_optional(std::string{kPrivateKey});
    if (not key_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    if (not key_entry->empty()) {
      return ConfigReaderError::INVALID_VALUE;
    }
    config.filler_tx_private_key = key_entry->data();

    if (auto entry = tree.get_child_optional(std::string{kTxValue})) {
      OUTCOME_TRY(value, parseUint(*entry));
      config.filler_tx_value = value;
    }

    if (not config.fillerSigner()) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return config;
  }

  outcome::result<boost::property_tree::ptree>
  JsonConfigurationReader::readPropertyTree(std::istream &data) {
    pt::ptree tree;
    try {
      pt::read_json(data, tree);
    } catch (pt::json_parser_error &e) {
      return ConfigReaderError::PARSER_ERROR;
    }
    return tree;
  }

}  // namespace blockforge::application
