/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <future>
#include <memory>
#include <type_traits>

#include <boost/asio/post.hpp>

#include "utils/thread_pool.hpp"

namespace blockforge::building {

  /**
   * Bounded pool shared by all builders of the process for state root
   * computation, so that one expensive root does not starve the threads
   * driving the other builds.
   */
  class RootHashTaskPool {
   public:
    explicit RootHashTaskPool(size_t thread_count);

    /**
     * Runs task on the pool and blocks the calling thread until it completes.
     * Must not be called from a thread of this pool.
     * @return whatever task returns, exceptions of task are rethrown
     */
    template <typename F>
    std::invoke_result_t<F> runBlocking(F &&task) {
      using R = std::invoke_result_t<F>;
      auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
      auto future = job->get_future();
      boost::asio::post(*pool_.io_context(), [job] { (*job)(); });
      return future.get();
    }

    size_t threadCount() const {
      return pool_.size();
    }

   private:
    ThreadPool pool_;
  };

}  // namespace blockforge::building
