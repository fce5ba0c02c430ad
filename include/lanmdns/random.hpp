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
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace lanmdns {
/**
 * Random source for the protocol delays. Each engine gets one explicitly;
 * tests seed it to get repeatable timings.
 */
class random_t {
  NON_COPYABLE_NOR_MOVABLE(random_t)

  std::mutex mutex;
  std::mt19937 generator;

public:
  // Seeded from /dev/urandom
  random_t();
  explicit random_t(uint32_t seed) : generator(seed) {}

  // In [0, bound), 0 if bound <= 0
  int next_int(int bound);
  // In [min, max], both included
  std::chrono::milliseconds between(std::chrono::milliseconds min,
                                    std::chrono::milliseconds max);
};
} // namespace lanmdns
