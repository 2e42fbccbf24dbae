/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

namespace blockforge::building {

  /**
   * Slot wide cancellation flag shared by all algorithms building for the
   * slot. Builders only ever set it, resetting is up to whoever owns the slot.
   */
  class CancellationToken {
   public:
    void cancel() {
      cancelled_.store(true, std::memory_order_release);
    }

    bool isCancelled() const {
      return cancelled_.load(std::memory_order_acquire);
    }

   private:
    std::atomic_bool cancelled_{false};
  };

}  // namespace blockforge::building
