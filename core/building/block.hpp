/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "building/built_block_trace.hpp"
#include "primitives/block.hpp"

namespace blockforge::building {

  /**
   * Block produced by a building algorithm, ready to be bid with
   */
  struct Block {
    BuiltBlockTrace trace;
    primitives::SealedBlock sealed_block;
    std::vector<primitives::BlobSidecar> txs_blobs_sidecars;
    std::string builder_name;
  };

}  // namespace blockforge::building
