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
#include "ping/echo/async_pinger.hpp"
#include "ping/echo/detail/async_worker.hpp"
#include "ping/echo/ip_pair.hpp"
#include <boost/make_shared.hpp>

namespace ping::echo
{

// Implementations.

Async_pinger::Async_pinger(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_ECHO),
  m_worker(detail::Async_worker::get_or_create(logger_ptr)),
  m_ttl(S_DEFAULT_TTL),
  m_df(S_DEFAULT_DF),
  m_timeout_ms(S_DEFAULT_TIMEOUT_MS)
{
  FLOW_LOG_INFO("Async_pinger [" << this << "]: Created; sharing worker [" << m_worker << "].");
}

Ping_future Async_pinger::send(const util::Ip_address& dst, Buffer buf)
{
  return send_impl(nullptr, dst, std::move(buf));
}

Ping_future Async_pinger::send_from(const Ip_pair& addrs, Buffer buf)
{
  return send_impl(&addrs.src(), addrs.dst(), std::move(buf));
}

Ping_future Async_pinger::send_impl(const util::Ip_address* src, const util::Ip_address& dst, Buffer&& buf)
{
  using detail::Async_worker;
  using detail::Completion_state;
  using boost::make_shared;

  buf.init_for_send();

  /* Take the views before the Buffer moves into the state: the moves that follow keep its storage where it is.
   * The Buffer stays inside the state until the future hands it back. */
  Async_worker::Job job;
  if (src)
  {
    job.m_src = *src;
  }
  job.m_dst = dst;
  job.m_opts = detail::Request_options{ m_ttl, m_df, m_timeout_ms };
  job.m_request = buf.request_blob();
  job.m_reply = buf.reply_region();

  const auto family = family_of(dst);
  // The state outlives *this (and possibly its Logger); so it logs where the worker does.
  job.m_state = make_shared<Completion_state>(m_worker->get_logger(), family, std::move(buf));

  FLOW_LOG_TRACE("Async_pinger [" << this << "]: Submitting ping [" << dst << "] with "
                 "[" << job.m_request.size() << "] payload bytes; TTL [" << int(m_ttl) << "], DF [" << m_df << "], "
                 "timeout [" << m_timeout_ms << " ms]; state [" << job.m_state.get() << "].");

  auto state = job.m_state;
  m_worker->submit(std::move(job));
  return Ping_future(std::move(state));
} // Async_pinger::send_impl()

bool Async_pinger::v4_available() const
{
  return m_worker->family_available(Ip_family::S_V4);
}

bool Async_pinger::v6_available() const
{
  return m_worker->family_available(Ip_family::S_V6);
}

uint8_t Async_pinger::ttl() const
{
  return m_ttl;
}

void Async_pinger::set_ttl(uint8_t ttl)
{
  m_ttl = ttl;
}

bool Async_pinger::df() const
{
  return m_df;
}

void Async_pinger::set_df(bool df)
{
  m_df = df;
}

unsigned int Async_pinger::timeout_ms() const
{
  return m_timeout_ms;
}

void Async_pinger::set_timeout_ms(unsigned int timeout_ms)
{
  m_timeout_ms = timeout_ms;
}

bool Async_pinger::set_queue_capacity(size_t capacity)
{
  return detail::Async_worker::set_queue_capacity(capacity);
}

size_t Async_pinger::queue_capacity()
{
  return detail::Async_worker::queue_capacity();
}

} // namespace ping::echo
