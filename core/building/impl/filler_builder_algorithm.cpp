/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/impl/filler_builder_algorithm.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "building/build_error.hpp"
#include "building/impl/filler_builder.hpp"
#include "common/outcome_throw.hpp"

namespace blockforge::building {

  namespace {
    crypto::Secp256k1Signer resolveFillerSigner(
        const application::FillerBuilderConfig &config) {
      auto signer = config.fillerSigner();
      if (not signer) {
        common::raise(signer.error());
      }
      return std::move(signer.value());
    }
  }  // namespace

  FillerBuilderAlgorithm::FillerBuilderAlgorithm(
      std::shared_ptr<RootHashTaskPool> root_hash_pool,
      std::shared_ptr<telemetry::BuiltBlockMetrics> metrics,
      std::shared_ptr<clock::SteadyClock> steady_clock,
      std::shared_ptr<clock::SystemClock> system_clock,
      application::FillerBuilderConfig config,
      std::string name)
      : log_{log::createLogger("FillerBuilderAlgorithm", "building")},
        root_hash_pool_{std::move(root_hash_pool)},
        metrics_{std::move(metrics)},
        steady_clock_{std::move(steady_clock)},
        system_clock_{std::move(system_clock)},
        config_{std::move(config)},
        filler_signer_{resolveFillerSigner(config_)},
        name_{std::move(name)} {
    BOOST_ASSERT(root_hash_pool_ != nullptr);
    BOOST_ASSERT(metrics_ != nullptr);
    BOOST_ASSERT(steady_clock_ != nullptr);
    BOOST_ASSERT(system_clock_ != nullptr);
  }

  std::string FillerBuilderAlgorithm::name() const {
    return name_;
  }

  std::optional<std::chrono::milliseconds>
  FillerBuilderAlgorithm::effectiveDeadline(
      const std::optional<std::chrono::milliseconds> &slot_deadline) const {
    auto configured = config_.buildDurationDeadline();
    if (slot_deadline and configured) {
      return std::min(*slot_deadline, *configured);
    }
    return slot_deadline ? slot_deadline : configured;
  }

  void FillerBuilderAlgorithm::buildBlocks(
      const BlockBuildingAlgorithmInput &input) {
    BOOST_ASSERT(input.provider_factory != nullptr);
    BOOST_ASSERT(input.sink != nullptr);
    BOOST_ASSERT(input.slot_bidder != nullptr);
    BOOST_ASSERT(input.cancel != nullptr);
    BOOST_ASSERT(input.partial_block_factory != nullptr);

    const auto block_number = input.ctx.block_number;

    FillerBuilder builder{input.provider_factory,
                          input.partial_block_factory,
                          input.slot_bidder,
                          root_hash_pool_,
                          metrics_,
                          steady_clock_,
                          system_clock_,
                          name_,
                          input.ctx,
                          config_,
                          filler_signer_,
                          effectiveDeadline(input.deadline)};

    auto block_res = builder.buildBlock();
    if (block_res.has_value()) {
      if (auto &block = block_res.value()) {
        input.sink->newBlock(std::move(*block));
      }
      return;
    }

    const auto &error = block_res.error();
    switch (classifyBuildError(error)) {
      case BuildErrorClass::CANCEL_SLOT: {
        auto last_block_res = input.provider_factory->lastBlockNumber();
        const primitives::BlockNumber last_block_number =
            last_block_res ? last_block_res.value() : 0;
        SL_DEBUG(log_,
                 "Can't build on this head, cancelling slot: block_number={} "
                 "last_block_number={}",
                 block_number,
                 last_block_number);
        input.cancel->cancel();
        break;
      }
      case BuildErrorClass::NOT_PROFITABLE:
        break;
      case BuildErrorClass::INFRASTRUCTURE:
        SL_ERROR(log_,
                 "Cancelling building due to provider factory error: {}",
                 error.message());
        break;
      case BuildErrorClass::OTHER:
        SL_WARN(log_, "Error filling orders: {}", error.message());
        break;
    }
  }

}  // namespace blockforge::building
