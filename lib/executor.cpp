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

#include <lanmdns/executor.hpp>
#include <lanmdns/logger.hpp>

namespace lanmdns {

executor_t::executor_t(std::string name_) : name(std::move(name_)) {
  worker = std::thread([this] { run_loop(); });
}

executor_t::~executor_t() { shutdown(); }

bool executor_t::submit(std::function<void()> job) {
  std::lock_guard<std::mutex> lock(mutex);
  if (shutting_down) {
    DEBUG("{}: shut down, job not accepted", name);
    return false;
  }
  jobs.push_back(std::move(job));
  wakeup.notify_one();
  return true;
}

void executor_t::run_loop() {
  std::unique_lock<std::mutex> lock(mutex);
  while (true) {
    wakeup.wait(lock, [this] { return shutting_down || !jobs.empty(); });
    if (jobs.empty()) {
      return; // shutting down, and drained
    }
    auto job = std::move(jobs.front());
    jobs.pop_front();

    lock.unlock();
    try {
      job();
    } catch (const std::exception &e) {
      ERROR("{}: exception at job: {}", name, e.what());
    } catch (...) {
      ERROR("{}: unknown exception at job", name);
    }
    lock.lock();
  }
}

void executor_t::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    shutting_down = true;
    wakeup.notify_all();
  }
  if (!worker.joinable()) {
    return;
  }
  if (std::this_thread::get_id() == worker.get_id()) {
    WARNING("{}: shut down from its own worker. Detaching.", name);
    worker.detach();
    return;
  }
  worker.join();
}

bool executor_t::is_shutdown() {
  std::lock_guard<std::mutex> lock(mutex);
  return shutting_down;
}

} // namespace lanmdns
