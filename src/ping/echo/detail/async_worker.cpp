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
#include "ping/echo/detail/async_worker.hpp"
#include "ping/echo/error.hpp"
#include <boost/move/make_unique.hpp>

#ifndef PING_ASYNC_QUEUE_CAPACITY
#  define PING_ASYNC_QUEUE_CAPACITY 1024
#endif

namespace ping::echo::detail
{

// Static initializers.

const size_t Async_worker::S_DEFAULT_QUEUE_CAPACITY = PING_ASYNC_QUEUE_CAPACITY;
boost::once_flag Async_worker::s_instance_once;
flow::util::Mutex_non_recursive Async_worker::s_config_mutex;
size_t Async_worker::s_queue_capacity = Async_worker::S_DEFAULT_QUEUE_CAPACITY;
Async_worker* Async_worker::s_instance = nullptr;

// Implementations.

Async_worker* Async_worker::get_or_create(flow::log::Logger* logger_ptr)
{
  using boost::call_once;
  using flow::util::Lock_guard;

  call_once(s_instance_once, [&]()
  {
    Lock_guard<decltype(s_config_mutex)> lock(s_config_mutex);
    // Never deleted: completions may be in flight at any time until exit.
    s_instance = new Async_worker(logger_ptr, s_queue_capacity);
  });

  assert(s_instance);
  return s_instance;
}

bool Async_worker::set_queue_capacity(size_t capacity)
{
  flow::util::Lock_guard<decltype(s_config_mutex)> lock(s_config_mutex);
  if (s_instance || (capacity == 0))
  {
    return false;
  }
  // else
  s_queue_capacity = capacity;
  return true;
}

size_t Async_worker::queue_capacity()
{
  flow::util::Lock_guard<decltype(s_config_mutex)> lock(s_config_mutex);
  return s_queue_capacity;
}

Async_worker::Async_worker(flow::log::Logger* logger_ptr, size_t queue_capacity) :
  flow::log::Log_context(logger_ptr, Log_component::S_ECHO),
  m_jobs(queue_capacity),
  m_drain_pending(false),
  m_worker(boost::movelib::make_unique<flow::async::Single_thread_task_loop>(get_logger(), "ping_async"))
{
  FLOW_LOG_INFO("Async_worker [" << this << "]: Starting worker thread; queue capacity [" << queue_capacity << "].");

  // Open the primitives from within the thread that will use them.  start() returns once this is done.
  m_worker->start([this]()
  {
    const auto open_handle = [&](std::optional<Icmp_handle>* handle, Ip_family family)
    {
      Error_code err_code;
      handle->emplace(get_logger(), family, &err_code);
      if (err_code)
      {
        FLOW_LOG_WARNING("Async_worker [" << this << "]: ICMP handle for family [" << family << "] unavailable "
                         "([" << err_code << "] [" << err_code.message() << "]); every async request of that family "
                         "will fail.");
        handle->reset();
      }
    };

    open_handle(&m_icmp_v4, Ip_family::S_V4);
    open_handle(&m_icmp_v6, Ip_family::S_V6);
  });

  FLOW_LOG_INFO("Async_worker [" << this << "]: Worker thread started; v4 available? = "
                "[" << bool(m_icmp_v4) << "]; v6 available? = [" << bool(m_icmp_v6) << "].");
} // Async_worker::Async_worker()

bool Async_worker::family_available(Ip_family family) const
{
  return bool((family == Ip_family::S_V4) ? m_icmp_v4 : m_icmp_v6);
}

void Async_worker::submit(Job&& job)
{
  FLOW_LOG_TRACE("Async_worker [" << this << "]: Queuing request to [" << job.m_dst << "]; state "
                 "[" << job.m_state.get() << "].");

  m_jobs.push(std::move(job)); // May block.

  // A drain already posted but not yet begun will see our Job; else post one.
  if (!m_drain_pending.exchange(true))
  {
    m_worker->post([this]() { drain(); });
  }
}

void Async_worker::drain()
{
  assert(m_worker->in_thread());

  // Clear first: a submit() after this point posts another drain, even if we end up popping its Job ourselves.
  m_drain_pending = false;

  while (auto job = m_jobs.try_pop())
  {
    issue(std::move(*job));
  }
}

void Async_worker::issue(Job&& job)
{
  const auto family = family_of(job.m_dst);
  auto& handle = (family == Ip_family::S_V4) ? m_icmp_v4 : m_icmp_v6;

  if (!handle)
  {
    FLOW_LOG_TRACE("Async_worker [" << this << "]: Family [" << family << "] unavailable; failing request to "
                   "[" << job.m_dst << "].");
    job.m_state->on_submit_result(0, error::Code::S_ICMP_HANDLE_UNAVAILABLE);
    return;
  }
  // else

  Error_code last_err;
  const auto context = Completion_state::to_opaque(job.m_state);
  const auto ret = handle->async_send_echo(m_worker->task_engine().get(),
                                           job.m_src ? &(*job.m_src) : nullptr, job.m_dst,
                                           job.m_request, job.m_opts, job.m_reply,
                                           &on_echo_completion, context, &last_err);

  if (Completion_state::settle_submission(context, ret, last_err))
  {
    FLOW_LOG_TRACE("Async_worker [" << this << "]: Request to [" << job.m_dst << "] in flight.");
  }
} // Async_worker::issue()

void Async_worker::on_echo_completion(void* context)
{
  Completion_state::from_opaque(context)->on_completion();
}

} // namespace ping::echo::detail
