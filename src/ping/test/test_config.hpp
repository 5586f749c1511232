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
#pragma once

#include <flow/log/log.hpp>
#include <cstdlib>
#include <sstream>

namespace ping::test
{

/**
 * Settings of the unit-test run, read once from the environment:
 *   - `PING_TEST_LOG_SEV`: lowest severity logged by Test_logger, e.g., `trace` or `warning` (default `info`).
 *   - `PING_TEST_NO_NETWORK`: if set and not `0`, tests that send real requests skip themselves.  For hosts whose
 *     sandbox lets a socket open but silently drops or blackholes ICMP.
 */
class Test_config
{
public:
  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static const Test_config& get_singleton()
  {
    static const Test_config s_config;
    return s_config;
  }

  /// See class doc header.
  flow::log::Sev m_sev;

  /// See class doc header.
  bool m_no_network;

private:
  /// Reads the environment.
  Test_config() :
    m_sev(flow::log::Sev::S_INFO),
    m_no_network(false)
  {
    if (const char* const sev_str = std::getenv("PING_TEST_LOG_SEV"))
    {
      std::istringstream is(sev_str);
      is >> m_sev; // Unknown value => S_NONE, i.e., silence; a fine outcome of a typo in a test knob.
    }

    const char* const no_network_str = std::getenv("PING_TEST_NO_NETWORK");
    m_no_network = no_network_str && (no_network_str[0] != '\0') && (no_network_str[0] != '0');
  }
}; // class Test_config

} // namespace ping::test
