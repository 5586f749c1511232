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
#include "ping/echo/detail/result.hpp"
#include "ping/echo/detail/echo_reply.hpp"
#include "ping/echo/buffer.hpp"
#include "ping/echo/error.hpp"

namespace ping::echo::detail
{

// Implementations.

unsigned int extract_result(Buffer* buf, Ip_family family, size_t n_replies, const Error_code& last_err,
                            Error_code* err_code)
{
  if (n_replies == 0)
  {
    *err_code = error::from_sys_error(last_err);
    return 0;
  }
  // else

  const auto record = buf->set_filled(family);
  if (!record)
  {
    *err_code = error::Code::S_REPLY_BUFFER_TOO_SMALL;
    return 0;
  }
  // else

  if (record->m_status != uint32_t(error::Ip_status::S_SUCCESS))
  {
    *err_code = error::from_ip_status(record->m_status);
    return 0;
  }
  // else

  err_code->clear();
  return record->m_round_trip_time_ms;
} // extract_result()

} // namespace ping::echo::detail
