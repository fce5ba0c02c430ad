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

#include <lanmdns/exceptions.hpp>
#include <lanmdns/service_info.hpp>
#include <lanmdns/utils.hpp>

namespace lanmdns {

static const std::string LOCAL_DOMAIN = "local.";

static bool ends_with_local(const std::string &name) {
  if (name.size() < LOCAL_DOMAIN.size()) {
    return false;
  }
  return equal_ignore_case(
      name.substr(name.size() - LOCAL_DOMAIN.size()), LOCAL_DOMAIN);
}

static std::string local_name(const std::string &name) {
  auto ret = fqdn(name);
  if (!ends_with_local(ret)) {
    ret += LOCAL_DOMAIN;
  }
  return ret;
}

std::string normalize_service_type(const std::string &type) {
  if (type.empty() || type[0] != '_') {
    throw exception("Invalid service type: \"{}\". Must be like _http._tcp",
                    type);
  }
  return local_name(type);
}

void dns_entity_t::add_answers(const question_t &question,
                               std::unordered_set<record_t> &answers,
                               uint32_t ttl) const {
  if (!state.is_announced()) {
    return;
  }
  for (auto &record : get_records(ttl)) {
    if (question.is_answered_by(record)) {
      answers.insert(record);
    }
  }
}

bool dns_entity_t::is_conflicting(const record_t &record) const {
  for (auto &own : get_records(0)) {
    if (own.unique && own.type == record.type &&
        equal_ignore_case(own.name, record.name) && !own.same_data(record)) {
      return true;
    }
  }
  return false;
}

question_t dns_entity_t::get_probe_question() const {
  return question_t(get_name(), TYPE_ANY, true);
}

host_info_t::host_info_t(const std::string &name_,
                         const network_address_t &address)
    : dns_entity_t(local_name(name_)), name(local_name(name_)),
      address(address) {}

std::vector<record_t> host_info_t::get_records(uint32_t ttl) const {
  if (address.is_ipv6()) {
    return {record_t::make_aaaa(name, address.get_ipv6(), ttl)};
  }
  return {record_t::make_a(name, address.get_ipv4(), ttl)};
}

service_info_t::service_info_t(const std::string &type_,
                               const std::string &instance_name_,
                               uint16_t port_, std::vector<std::string> txt_,
                               uint16_t priority_, uint16_t weight_)
    : dns_entity_t(instance_name_ + "." + normalize_service_type(type_)),
      type(normalize_service_type(type_)), instance_name(instance_name_),
      port(port_), priority(priority_), weight(weight_),
      txt(std::move(txt_)) {
  if (instance_name.empty() || instance_name.size() > 63) {
    throw exception("Invalid service instance name: \"{}\"", instance_name);
  }
  if (instance_name.find('.') != std::string::npos) {
    throw exception("Service instance name can not contain dots: \"{}\"",
                    instance_name);
  }
  for (auto &str : txt) {
    if (str.size() > 255) {
      throw exception("TXT string too long ({}B) at {}", str.size(),
                      instance_name);
    }
  }
}

std::string service_info_t::get_server() const {
  std::lock_guard<std::mutex> lock(server_mutex);
  return server;
}

void service_info_t::set_server(const std::string &host_name) {
  std::lock_guard<std::mutex> lock(server_mutex);
  server = host_name;
}

std::vector<record_t> service_info_t::get_records(uint32_t ttl) const {
  auto qualified_name = get_qualified_name();
  return {
      record_t::make_ptr(type, qualified_name, ttl),
      record_t::make_srv(qualified_name, priority, weight, port, get_server(),
                         ttl),
      record_t::make_txt(qualified_name, txt, ttl),
  };
}

} // namespace lanmdns
