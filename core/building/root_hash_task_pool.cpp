/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/root_hash_task_pool.hpp"

namespace blockforge::building {

  RootHashTaskPool::RootHashTaskPool(size_t thread_count)
      : pool_{"root_hash", thread_count} {}

}  // namespace blockforge::building
