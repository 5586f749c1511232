/* Ping: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "ping/test/test_common_util.hpp"
#include "ping/test/test_logger.hpp"
#include "ping/test/test_config.hpp"

namespace ping::test
{

flow::log::Logger* process_logger()
{
  static Test_logger s_logger;
  return &s_logger;
}

echo::Buffer::Request_data counting_payload(size_t size, uint8_t first)
{
  echo::Buffer::Request_data payload(size);
  for (size_t idx = 0; idx != size; ++idx)
  {
    payload[idx] = uint8_t(first + idx);
  }
  return payload;
}

echo::Buffer::Request_data to_bytes(const util::Blob_const& blob)
{
  const auto data = util::blob_data(blob);
  return echo::Buffer::Request_data(data, data + blob.size());
}

util::Ipv4_address bogon_v4()
{
  return boost::asio::ip::make_address_v4("198.18.0.1");
}

bool network_tests_enabled()
{
  return !Test_config::get_singleton().m_no_network;
}

} // namespace ping::test
