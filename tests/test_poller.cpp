/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "./test_case.hpp"
#include <chrono>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/poller.hpp>
#include <unistd.h>
using namespace std::chrono_literals;

static int32_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

struct pipe_t {
  int fds[2] = {-1, -1};
  pipe_t() {
    if (::pipe(fds) < 0) {
      throw lanmdns::exception("Can not create pipe");
    }
  }
  ~pipe_t() {
    ::close(fds[0]);
    ::close(fds[1]);
  }
  void write(char c) {
    if (::write(fds[1], &c, 1) != 1) {
      throw lanmdns::exception("Can not write to pipe");
    }
  }
};

void test_fd_events() {
  lanmdns::poller_t poller;
  pipe_t pipe;
  std::string received;

  auto listener = poller.add_fd_in(pipe.fds[0], [&received](int fd) {
    char c;
    if (::read(fd, &c, 1) == 1) {
      received += c;
    }
  });

  pipe.write('a');
  poller.wait(100ms);
  ASSERT_EQUAL(received, "a");

  pipe.write('b');
  pipe.write('c');
  while (received.size() < 3) {
    poller.wait(100ms);
  }
  ASSERT_EQUAL(received, "abc");

  // After stop, nothing is called
  listener.stop();
  pipe.write('d');
  poller.wait(20ms);
  ASSERT_EQUAL(received, "abc");
}

void test_wait_ms() {
  lanmdns::poller_t poller;
  for (auto ms : {10, 20, 50}) {
    auto start = std::chrono::steady_clock::now();
    poller.wait(std::chrono::milliseconds(ms));
    auto elapsed = elapsed_ms(start);
    DEBUG("Waited {}ms for {}ms", elapsed, ms);
    ASSERT_GTE(elapsed, ms - 1);
    ASSERT_LT(elapsed, 1000);
  }
}

void test_exceptions_at_callbacks() {
  lanmdns::poller_t poller;
  pipe_t pipe;
  int calls = 0;

  auto listener = poller.add_fd_in(pipe.fds[0], [&calls](int fd) {
    char c;
    if (::read(fd, &c, 1) == 1) {
      calls++;
    }
    throw lanmdns::exception("Bad callback");
  });

  pipe.write('a');
  poller.wait(100ms);
  pipe.write('b');
  poller.wait(100ms);
  // Still listening
  ASSERT_EQUAL(calls, 2);
}

void test_close() {
  lanmdns::poller_t poller;
  ASSERT_TRUE(poller.is_open());
  poller.close();
  ASSERT_FALSE(poller.is_open());
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_fd_events),
      TEST(test_wait_ms),
      TEST(test_exceptions_at_callbacks),
      TEST(test_close),
  };

  testcase.run(argc, argv);

  return testcase.exit_code();
}
