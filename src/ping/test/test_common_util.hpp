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

#include <ping/echo/buffer.hpp>
#include <flow/log/log.hpp>
#include <type_traits>

namespace ping::test
{

/**
 * Returns a Test_logger that lives until the process exits.  Use it for anything that may reach the async worker,
 * which keeps logging to the first Logger it is given.
 *
 * @return See above.
 */
flow::log::Logger* process_logger();

/**
 * Returns a payload of `size` bytes counting up (modulo 256) from `first`.
 *
 * @param size
 *        Length.
 * @param first
 *        Value of byte 0.
 * @return See above.
 */
echo::Buffer::Request_data counting_payload(size_t size, uint8_t first = 0);

/**
 * Returns a copy of the given blob's bytes.
 *
 * @param blob
 *        Bytes.
 * @return See above.
 */
echo::Buffer::Request_data to_bytes(const util::Blob_const& blob);

/**
 * An address in 198.18.0.0/15 (benchmarking range): routable on a typical host via the default route, but no one
 * answers, so requests to it time out.
 *
 * @return See above.
 */
util::Ipv4_address bogon_v4();

/**
 * Whether tests that send real requests should run; see Test_config.
 *
 * @return See above.
 */
bool network_tests_enabled();

/**
 * Casts an enumeration to its primitive type.
 *
 * @tparam Enum The enumeration type.
 * @param e The enumeration value.
 *
 * @return The primitive type form of the enumeration value.
 */
template <class Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum e) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(e);
}

} // namespace ping::test
