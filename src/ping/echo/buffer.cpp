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
#include "ping/echo/buffer.hpp"
#include "ping/echo/detail/echo_reply.hpp"
#include <cstring>

namespace ping::echo
{

// Implementations.

Buffer::Buffer() :
  m_reply_state(Reply_state::S_EMPTY)
{
  // That's it.
}

Buffer::Buffer(Request_data&& request_data) :
  m_request_data(std::move(request_data)),
  m_reply_state(Reply_state::S_EMPTY)
{
  // That's it.
}

Buffer::Request_data& Buffer::request_data()
{
  return m_request_data;
}

const Buffer::Request_data& Buffer::request_data() const
{
  return m_request_data;
}

void Buffer::init_for_send()
{
  using detail::S_ECHO_REPLY_RESERVED_SIZE;
  using detail::S_REPLY_REGION_SLACK_SIZE;

  const size_t size = S_ECHO_REPLY_RESERVED_SIZE + S_REPLY_REGION_SLACK_SIZE + m_request_data.size();
  const size_t n_chunks = (size / sizeof(Chunk)) + (((size % sizeof(Chunk)) == 0) ? 0 : 1);

  m_reply_region.resize(n_chunks);
  // Zero the record at least: a non-completed request must not look like a stale reply.
  std::memset(static_cast<void*>(m_reply_region.data()), 0, S_ECHO_REPLY_RESERVED_SIZE);
  m_reply_state = Reply_state::S_EMPTY;
}

util::Blob_const Buffer::request_blob() const
{
  return util::Blob_const(m_request_data.data(), m_request_data.size());
}

util::Blob_mutable Buffer::reply_region()
{
  return util::Blob_mutable(m_reply_region.data(), m_reply_region.size() * sizeof(Chunk));
}

const detail::Echo_reply* Buffer::reply_record() const
{
  if ((m_reply_region.size() * sizeof(Chunk)) < sizeof(detail::Echo_reply))
  {
    return nullptr;
  }
  // else
  return reinterpret_cast<const detail::Echo_reply*>(m_reply_region.data());
}

const detail::Echo_reply* Buffer::set_filled(Ip_family family)
{
  const auto record = reply_record();
  if (record)
  {
    m_reply_state = (family == Ip_family::S_V4) ? Reply_state::S_FILLED_V4 : Reply_state::S_FILLED_V6;
  }
  return record;
}

Buffer::Reply_state Buffer::reply_state() const
{
  return m_reply_state;
}

util::Blob_const Buffer::reply_data() const
{
  using detail::S_ECHO_REPLY_RESERVED_SIZE;

  if (m_reply_state == Reply_state::S_EMPTY)
  {
    return util::Blob_const();
  }
  // else
  const auto record = reply_record();
  assert(record && "set_filled() would not have let the state become non-EMPTY.");

  const size_t len = record->m_data_size;
  const size_t region_size = m_reply_region.size() * sizeof(Chunk);
  if ((len == 0) || ((S_ECHO_REPLY_RESERVED_SIZE + len) > region_size))
  {
    return util::Blob_const();
  }
  // else
  return util::Blob_const(reinterpret_cast<const uint8_t*>(m_reply_region.data()) + S_ECHO_REPLY_RESERVED_SIZE, len);
} // Buffer::reply_data()

std::optional<util::Ip_address> Buffer::responding_ip() const
{
  if (m_reply_state == Reply_state::S_EMPTY)
  {
    return std::nullopt;
  }
  // else
  const auto record = reply_record();
  assert(record && "set_filled() would not have let the state become non-EMPTY.");

  if (record->m_ip_version == 4)
  {
    util::Ipv4_address::bytes_type bytes;
    std::memcpy(bytes.data(), record->m_address, bytes.size());
    return util::Ipv4_address(bytes);
  }
  // else
  if (record->m_ip_version == 6)
  {
    util::Ipv6_address::bytes_type bytes;
    std::memcpy(bytes.data(), record->m_address, bytes.size());
    return util::Ipv6_address(bytes);
  }
  // else
  return std::nullopt;
} // Buffer::responding_ip()

} // namespace ping::echo
