/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "building/block_building_algorithm.hpp"

#include "application/filler_builder_config.hpp"
#include "building/root_hash_task_pool.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "telemetry/built_block_metrics.hpp"

namespace blockforge::building {

  /**
   * Block building algorithm that fills blocks with filler transactions. Each
   * call of buildBlocks() makes exactly one build attempt and turns its
   * failures into slot level decisions.
   */
  class FillerBuilderAlgorithm : public BlockBuildingAlgorithm {
   public:
    /**
     * @throws std::system_error if the filler key of config is malformed
     */
    FillerBuilderAlgorithm(std::shared_ptr<RootHashTaskPool> root_hash_pool,
                           std::shared_ptr<telemetry::BuiltBlockMetrics> metrics,
                           std::shared_ptr<clock::SteadyClock> steady_clock,
                           std::shared_ptr<clock::SystemClock> system_clock,
                           application::FillerBuilderConfig config,
                           std::string name);

    std::string name() const override;

    void buildBlocks(const BlockBuildingAlgorithmInput &input) override;

    const primitives::Address &fillerSender() const {
      return filler_signer_.address();
    }

   private:
    std::optional<std::chrono::milliseconds> effectiveDeadline(
        const std::optional<std::chrono::milliseconds> &slot_deadline) const;

    log::Logger log_;
    std::shared_ptr<RootHashTaskPool> root_hash_pool_;
    std::shared_ptr<telemetry::BuiltBlockMetrics> metrics_;
    std::shared_ptr<clock::SteadyClock> steady_clock_;
    std::shared_ptr<clock::SystemClock> system_clock_;
    application::FillerBuilderConfig config_;
    crypto::Secp256k1Signer filler_signer_;
    std::string name_;
  };

}  // namespace blockforge::building
