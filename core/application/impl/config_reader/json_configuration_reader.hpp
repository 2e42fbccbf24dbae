/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <istream>

#include <boost/property_tree/ptree.hpp>

#include "application/filler_builder_config.hpp"

namespace blockforge::application {

  /**
   * Reads a filler builder configuration from JSON. Entries other than the
   * known ones are rejected.
   */
  class JsonConfigurationReader {
   public:
    /**
     * @param config_file_data stream with the config file data
     * @return configuration if the data was correctly read, contained every
     * required entry and a usable filler key
     */
    static outcome::result<FillerBuilderConfig> initConfig(
        std::istream &config_file_data);

    static outcome::result<FillerBuilderConfig> initConfigFromPropertyTree(
        const boost::property_tree::ptree &tree);

   private:
    static outcome::result<boost::property_tree::ptree> readPropertyTree(
        std::istream &data);
  };
}  // namespace blockforge::application
