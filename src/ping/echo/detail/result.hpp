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

#include "ping/echo/echo_fwd.hpp"

namespace ping::echo::detail
{

// Free functions.

/**
 * Turns the raw outcome of an echo primitive call into the user-facing request outcome; shared by Pinger (after
 * Icmp_handle::send_echo()) and Ping_future (after Icmp_handle::parse_replies()).
 *
 * If `n_replies` is 0, the outcome is error::from_sys_error() of `last_err`, and `*buf` stays empty.
 * Otherwise `*buf` is marked as holding a reply of the given family, and the reply record decides: status
 * error::Ip_status::S_SUCCESS means success with the record's round-trip time; any other status yields
 * error::from_ip_status().
 *
 * @param buf
 *        The Buffer whose reply region holds the raw outcome.
 * @param family
 *        IP version of the request.
 * @param n_replies
 *        What the primitive returned.
 * @param last_err
 *        The primitive's last error; meaningful only if `n_replies` is 0.
 * @param err_code
 *        Set to the outcome: falsy on success.
 * @return Round-trip time in milliseconds on success; else 0.
 */
unsigned int extract_result(Buffer* buf, Ip_family family, size_t n_replies, const Error_code& last_err,
                            Error_code* err_code);

} // namespace ping::echo::detail
