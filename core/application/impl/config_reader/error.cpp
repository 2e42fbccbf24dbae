/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockforge::application, ConfigReaderError, e) {
  using E = blockforge::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::UNKNOWN_ENTRY:
      return "The provided config file contains an unknown entry";
    case E::INVALID_VALUE:
      return "An entry of the provided config file has an invalid value";
  }
  return "Unknown error";
}
