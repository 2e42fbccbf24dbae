/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/filler_builder_config.hpp"

#include "clock/clock.hpp"

namespace blockforge::application {

  std::optional<std::chrono::milliseconds>
  FillerBuilderConfig::buildDurationDeadline() const {
    if (not build_duration_deadline_ms) {
      return std::nullopt;
    }
    // longer deadlines are unbounded for a steady clock
    constexpr auto kMaxDeadline =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::SteadyClock::Duration::max());
    if (*build_duration_deadline_ms
        >= static_cast<uint64_t>(kMaxDeadline.count())) {
      return kMaxDeadline;
    }
    return std::chrono::milliseconds(*build_duration_deadline_ms);
  }

  outcome::result<crypto::Secp256k1Signer> FillerBuilderConfig::fillerSigner()
      const {
    return crypto::Secp256k1Signer::fromHex(filler_tx_private_key);
  }

}  // namespace blockforge::application
