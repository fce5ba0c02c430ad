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

#include <string.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <array>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/poller.hpp>

namespace lanmdns {

poller_t::poller_t() {
  epollfd = epoll_create1(EPOLL_CLOEXEC);
  if (epollfd < 0) {
    throw exception("Could not start epoll: {}", strerror(errno));
  }
}

poller_t::~poller_t() {
  close();
  std::lock_guard<std::mutex> lock(fd_events_mutex);
  fd_events.clear();
}

bool poller_t::is_open() const { return epollfd > 0; }

void poller_t::close() {
  if (epollfd > 0) {
    ::close(epollfd);
    epollfd = -1;
  }
}

poller_t::listener_t poller_t::add_fd_in(int fd, std::function<void(int)> f) {
  {
    std::lock_guard<std::mutex> lock(fd_events_mutex);
    fd_events[fd] = std::make_shared<std::function<void(int)>>(std::move(f));
  }
  struct epoll_event ev {};
  memset(&ev, 0, sizeof(ev));

  ev.events = EPOLLIN;
  ev.data.fd = fd;
  auto r = epoll_ctl(epollfd, EPOLL_CTL_ADD, fd, &ev);
  if (r == -1) {
    auto error = errno;
    std::lock_guard<std::mutex> lock(fd_events_mutex);
    fd_events.erase(fd);
    throw exception("Can't add fd {} to poller: {} ({})", fd, strerror(error),
                    error);
  }
  return poller_t::listener_t(this, fd);
}

void poller_t::__remove_fd(int fd) {
  {
    std::lock_guard<std::mutex> lock(fd_events_mutex);
    fd_events.erase(fd);
  }
  if (is_open()) {
    auto r = epoll_ctl(epollfd, EPOLL_CTL_DEL, fd, NULL);
    // The fd may be closed already, the kernel dropped it from the set
    if (r == -1 && errno != EBADF && errno != ENOENT) {
      ERROR("Error from poller! fd: {}, error: {}", fd, strerror(errno));
    }
  }
}

void poller_t::wait(std::optional<std::chrono::milliseconds> max_wait_ms) {
  const auto MAX_EVENTS = 10;
  std::array<struct epoll_event, MAX_EVENTS> events{};
  auto wait_ms = 10'000'000; // not forever, but a lot (10'000s)

  if (max_wait_ms.has_value()) {
    wait_ms = int(max_wait_ms.value().count());
  }

  auto nfds = epoll_wait(epollfd, events.data(), MAX_EVENTS, wait_ms);
  if (nfds == -1) {
    // Signals interrupt the wait, and the handler may have closed us
    if (errno != EINTR && is_open())
      ERROR("epoll_wait failed: {}", strerror(errno));
    return;
  }

  for (auto n = 0; n < nfds; n++) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
    auto fd = events[n].data.fd;
    std::shared_ptr<std::function<void(int)>> callback;
    {
      std::lock_guard<std::mutex> lock(fd_events_mutex);
      auto I = fd_events.find(fd);
      if (I == fd_events.end()) {
        continue; // removed while waiting
      }
      callback = I->second;
    }
    try {
      (*callback)(fd);
    } catch (const std::exception &e) {
      ERROR_ONCE("Caught exception at poller: {}", e.what());
    }
  }
}

} // namespace lanmdns
