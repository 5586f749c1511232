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
#include "ping/echo/pinger.hpp"
#include "ping/echo/detail/icmp_handle.hpp"
#include "ping/echo/detail/result.hpp"
#include "ping/echo/buffer.hpp"
#include "ping/echo/ip_pair.hpp"
#include "ping/echo/error.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>

namespace ping::echo
{

// Implementations.

Pinger::Pinger(flow::log::Logger* logger_ptr, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_ECHO),
  m_ttl(S_DEFAULT_TTL),
  m_df(S_DEFAULT_DF),
  m_timeout_ms(S_DEFAULT_TIMEOUT_MS)
{
  using detail::Icmp_handle;
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  const auto open_handle = [&](Ip_family family) -> boost::movelib::unique_ptr<Icmp_handle>
  {
    Error_code handle_err_code;
    auto handle = make_unique<Icmp_handle>(get_logger(), family, &handle_err_code);
    if (handle_err_code)
    {
      handle.reset();
    }
    return handle;
  };

  m_icmp_v4 = open_handle(Ip_family::S_V4);
  m_icmp_v6 = open_handle(Ip_family::S_V6);

  Error_code sys_err_code;
  if ((!m_icmp_v4) && (!m_icmp_v6))
  {
    sys_err_code = error::Code::S_ICMP_HANDLES_UNAVAILABLE;
  }
  else if (!m_icmp_v4)
  {
    sys_err_code = error::Code::S_ICMP_V4_HANDLE_UNAVAILABLE;
  }
  else if (!m_icmp_v6)
  {
    sys_err_code = error::Code::S_ICMP_V6_HANDLE_UNAVAILABLE;
  }

  if (!sys_err_code)
  {
    FLOW_LOG_INFO("Pinger [" << this << "]: Ready for v4 and v6.");
    if (err_code)
    {
      err_code->clear();
    }
    return;
  }
  // else

  FLOW_LOG_WARNING("Pinger [" << this << "]: Created degraded; details follow.");
  FLOW_ERROR_SYS_ERROR_LOG_WARNING();

  if (err_code)
  {
    *err_code = sys_err_code;
  }
  else if (sys_err_code == error::Code::S_ICMP_HANDLES_UNAVAILABLE)
  {
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
} // Pinger::Pinger()

Pinger::~Pinger() = default;

unsigned int Pinger::send(const util::Ip_address& dst, Buffer* buf, Error_code* err_code)
{
  return send_impl(nullptr, dst, buf, err_code);
}

unsigned int Pinger::send_from(const Ip_pair& addrs, Buffer* buf, Error_code* err_code)
{
  return send_impl(&addrs.src(), addrs.dst(), buf, err_code);
}

unsigned int Pinger::send_impl(const util::Ip_address* src, const util::Ip_address& dst, Buffer* buf,
                               Error_code* err_code)
{
  assert(err_code && "Request outcomes are never thrown; supply err_code.");

  if (!buf)
  {
    FLOW_LOG_WARNING("Pinger [" << this << "]: send() to [" << dst << "] given null buffer.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  const auto family = family_of(dst);
  const auto& handle = (family == Ip_family::S_V4) ? m_icmp_v4 : m_icmp_v6;
  buf->init_for_send();

  if (!handle)
  {
    FLOW_LOG_TRACE("Pinger [" << this << "]: Family [" << family << "] unavailable; cannot ping [" << dst << "].");
    *err_code = error::Code::S_ICMP_HANDLE_UNAVAILABLE;
    return 0;
  }
  // else

  FLOW_LOG_TRACE("Pinger [" << this << "]: Pinging [" << dst << "] "
                 "(source [" << (src ? src->to_string() : std::string("auto")) << "]) with "
                 "[" << buf->request_data().size() << "] payload bytes; TTL [" << int(m_ttl) << "], "
                 "DF [" << m_df << "], timeout [" << m_timeout_ms << " ms].");

  const detail::Request_options opts{ m_ttl, m_df, m_timeout_ms };
  Error_code last_err;
  const auto n_replies = handle->send_echo(src, dst, buf->request_blob(), opts, buf->reply_region(), &last_err);
  const auto rtt = detail::extract_result(buf, family, n_replies, last_err, err_code);

  FLOW_LOG_TRACE("Pinger [" << this << "]: Ping [" << dst << "] result: [" << *err_code << "] "
                 "[" << err_code->message() << "]; RTT [" << rtt << " ms].");
  return rtt;
} // Pinger::send_impl()

bool Pinger::v4_available() const
{
  return bool(m_icmp_v4);
}

bool Pinger::v6_available() const
{
  return bool(m_icmp_v6);
}

uint8_t Pinger::ttl() const
{
  return m_ttl;
}

void Pinger::set_ttl(uint8_t ttl)
{
  m_ttl = ttl;
}

bool Pinger::df() const
{
  return m_df;
}

void Pinger::set_df(bool df)
{
  m_df = df;
}

unsigned int Pinger::timeout_ms() const
{
  return m_timeout_ms;
}

void Pinger::set_timeout_ms(unsigned int timeout_ms)
{
  m_timeout_ms = timeout_ms;
}

} // namespace ping::echo
