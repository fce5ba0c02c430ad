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
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace lanmdns {
/**
 * Simplified fd poller
 *
 * Internally uses epoll, it is level triggered, so data must be read or
 * will retrigger.
 *
 * Each multicast socket owns one and waits on it from its receive thread;
 * the daemon main thread owns another one that only gets closed by the
 * signal handlers. Listeners can be added and removed from any thread.
 */
class poller_t {
  NON_COPYABLE_NOR_MOVABLE(poller_t)

  int epollfd = -1;
  std::mutex fd_events_mutex;
  std::map<int, std::shared_ptr<std::function<void(int)>>> fd_events;

public:
  class listener_t;

  poller_t();
  ~poller_t();

  [[nodiscard]] listener_t add_fd_in(int fd, std::function<void(int)> event_f);
  void __remove_fd(int fd);

  // Returns after one round of events, or at timeout.
  void wait(std::optional<std::chrono::milliseconds> wait_ms = {});

  // Safe to call from a signal handler
  void close();
  bool is_open() const;
};

class poller_t::listener_t {
  poller_t *poller = nullptr;

public:
  int fd = -1;

  listener_t() {}
  listener_t(poller_t *poller_, int fd_) : poller(poller_), fd(fd_) {}
  listener_t(listener_t &&other) : poller(other.poller), fd(other.fd) {
    other.fd = -1;
  }
  ~listener_t() { stop(); }

  listener_t &operator=(const listener_t &other) = delete;
  listener_t &operator=(listener_t &&other) {
    stop();
    poller = other.poller;
    fd = other.fd;
    other.fd = -1;
    return *this;
  }
  void stop() {
    if (fd >= 0 && poller)
      poller->__remove_fd(fd);
    fd = -1;
  }
};
} // namespace lanmdns
