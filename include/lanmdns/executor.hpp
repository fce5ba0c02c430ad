/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#pragma once
#include "utils.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lanmdns {
/**
 * @short Single worker queue. Listener callbacks run here, off the network
 * path and the timer thread.
 *
 * Each job runs on its own; an exception is logged and the worker goes on.
 */
class executor_t {
  NON_COPYABLE_NOR_MOVABLE(executor_t)

  std::string name;
  std::mutex mutex;
  std::condition_variable wakeup;
  std::deque<std::function<void()>> jobs;
  bool shutting_down = false;
  std::thread worker;

  void run_loop();

public:
  explicit executor_t(std::string name);
  ~executor_t();

  // False once shut down
  bool submit(std::function<void()> job);
  // Runs all queued jobs and stops the worker
  void shutdown();
  bool is_shutdown();
};
} // namespace lanmdns
