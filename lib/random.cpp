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

#include <errno.h>
#include <fcntl.h>
#include <lanmdns/logger.hpp>
#include <lanmdns/random.hpp>
#include <string.h>
#include <unistd.h>

namespace lanmdns {

static uint32_t urandom_seed() {
  int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    WARNING("Cannot access /dev/urandom! {}", strerror(errno));
    return std::random_device()();
  }

  uint32_t tgt = 0;
  uint8_t *p = reinterpret_cast<uint8_t *>(&tgt);
  size_t n_left = sizeof tgt;

  while (n_left > 0) {
    auto rc = read(fd, p, n_left);
    if (rc <= 0) {
      WARNING("Cannot read from /dev/urandom! {}", strerror(errno));
      close(fd);
      return std::random_device()();
    }
    p += rc;
    n_left -= rc;
  }

  close(fd);
  return tgt;
}

random_t::random_t() : generator(urandom_seed()) {}

int random_t::next_int(int bound) {
  if (bound <= 0) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex);
  return std::uniform_int_distribution<int>(0, bound - 1)(generator);
}

std::chrono::milliseconds random_t::between(std::chrono::milliseconds min,
                                            std::chrono::milliseconds max) {
  if (max <= min) {
    return min;
  }
  return min + std::chrono::milliseconds(next_int(int((max - min).count()) + 1));
}

} // namespace lanmdns
