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

#include "./stringpp.hpp"

// Empty fields are kept, so "a::b" has three parts
std::vector<std::string> lanmdnsd::split(std::string const &str,
                                         const char delim) {
  std::vector<std::string> ret;
  size_t I = 0;
  size_t endI;

  while ((endI = str.find(delim, I)) != std::string::npos) {
    ret.push_back(str.substr(I, endI - I));
    I = endI + 1;
  }
  ret.push_back(str.substr(I));
  return ret;
}
