/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blockforge::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    UNKNOWN_ENTRY,
    INVALID_VALUE,
  };

}  // namespace blockforge::application

OUTCOME_HPP_DECLARE_ERROR(blockforge::application, ConfigReaderError);
