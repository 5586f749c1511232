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
#include "ping/echo/ping_future.hpp"
#include "ping/echo/detail/completion_state.hpp"
#include <boost/thread/condition_variable.hpp>
#include <boost/make_shared.hpp>

namespace ping::echo
{

// Implementations.

Async_result::Async_result() :
  m_round_trip_time_ms(0)
{
  // That's it.
}

Ping_future::Ping_future(boost::shared_ptr<detail::Completion_state>&& state) :
  m_state(std::move(state))
{
  assert(m_state);
}

Ping_future::Ping_future(Ping_future&&) = default;

Ping_future::~Ping_future() = default;

Ping_future& Ping_future::operator=(Ping_future&&) = default;

bool Ping_future::poll(util::Task&& waker, Async_result* result)
{
  assert(m_state && "Polling a moved-from Ping_future.");
  return m_state->poll(std::move(waker), result);
}

Async_result Ping_future::wait()
{
  using flow::util::Lock_guard;
  using flow::util::Mutex_non_recursive;
  using boost::condition_variable;

  // Shared with the waker, which the worker might still hold briefly after we return.
  struct Wait_state
  {
    Mutex_non_recursive m_mutex;
    condition_variable m_cond;
    bool m_woken = false;
  };
  const auto wait_state = boost::make_shared<Wait_state>();

  Async_result result;
  while (!poll([wait_state]()
               {
                 {
                   Lock_guard<Mutex_non_recursive> lock(wait_state->m_mutex);
                   wait_state->m_woken = true;
                 }
                 wait_state->m_cond.notify_one();
               },
               &result))
  {
    Lock_guard<Mutex_non_recursive> lock(wait_state->m_mutex);
    wait_state->m_cond.wait(lock, [&]() -> bool { return wait_state->m_woken; });
    wait_state->m_woken = false;
  }

  return result;
} // Ping_future::wait()

} // namespace ping::echo
