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
#include "ping/echo/detail/completion_state.hpp"
#include "ping/echo/detail/icmp_handle.hpp"
#include "ping/echo/detail/result.hpp"
#include "ping/echo/ping_future.hpp"
#include "ping/echo/error.hpp"
#include <utility>

namespace ping::echo::detail
{

// Implementations.

Completion_state::Completion_state(flow::log::Logger* logger_ptr, Ip_family family, Buffer&& buf) :
  flow::log::Log_context(logger_ptr, Log_component::S_ECHO),
  m_family(family),
  m_state(Unsubmitted{ std::move(buf) })
{
  // That's it.
}

Completion_state::State Completion_state::take_state()
{
  return std::exchange(m_state, State(Consumed()));
}

void Completion_state::on_submit_result(size_t ret, const Error_code& last_err)
{
  using flow::util::Lock_guard;
  using std::get_if;

  if ((ret == 0) && (last_err == error::Code::S_REQUEST_PENDING))
  {
    FLOW_LOG_TRACE("Completion_state [" << this << "]: Submission accepted; completion pending.");
    return;
  }
  // else

  util::Task waker;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    auto prev = take_state();

    Buffer* buf = nullptr;
    if (auto unsubmitted = get_if<Unsubmitted>(&prev))
    {
      buf = &unsubmitted->m_buf;
    }
    else if (auto awaiting = get_if<Awaiting_wake>(&prev))
    {
      buf = &awaiting->m_buf;
      waker = std::move(awaiting->m_waker);
    }

    if (!buf)
    {
      // Cannot happen: nothing but submission leaves those two phases before this point.
      FLOW_LOG_WARNING("Completion_state [" << this << "]: Submission result arrived in phase "
                       "[" << Phase(prev.index()) << "]; leaving it alone.");
      m_state = std::move(prev);
      return;
    }
    // else

    if (ret == 0)
    {
      FLOW_LOG_TRACE("Completion_state [" << this << "]: Submission failed synchronously with "
                     "[" << last_err << "] [" << last_err.message() << "].");
      m_state = Failed_synchronously{ std::move(*buf), last_err };
    }
    else
    {
      FLOW_LOG_WARNING("Completion_state [" << this << "]: Submission returned [" << ret << "] with last error "
                       "[" << last_err << "]; the echo primitive broke its contract.  Polling will abort.");
      m_state = Failed_unexpected_submission{ std::move(*buf), ret };
    }
  } // Lock_guard lock(m_mutex);

  if (waker)
  {
    waker();
  }
} // Completion_state::on_submit_result()

void Completion_state::on_completion()
{
  using flow::util::Lock_guard;
  using std::get_if;

  util::Task waker;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    auto prev = take_state();

    if (auto unsubmitted = get_if<Unsubmitted>(&prev))
    {
      FLOW_LOG_TRACE("Completion_state [" << this << "]: Completed; not yet polled.");
      m_state = Ready_to_parse{ std::move(unsubmitted->m_buf) };
    }
    else if (auto awaiting = get_if<Awaiting_wake>(&prev))
    {
      FLOW_LOG_TRACE("Completion_state [" << this << "]: Completed; waking poller.");
      waker = std::move(awaiting->m_waker);
      m_state = Ready_to_parse{ std::move(awaiting->m_buf) };
    }
    else
    {
      FLOW_LOG_WARNING("Completion_state [" << this << "]: Completion arrived in phase "
                       "[" << Phase(prev.index()) << "]; double completion?  Leaving state alone.");
      m_state = std::move(prev);
    }
  } // Lock_guard lock(m_mutex);

  if (waker)
  {
    waker();
  }
} // Completion_state::on_completion()

bool Completion_state::poll(util::Task&& waker, Async_result* result)
{
  using flow::util::Lock_guard;
  using std::get_if;

  util::Task displaced_waker; // Destroyed after the lock is released.
  State prev;
  {
    Lock_guard<decltype(m_mutex)> lock(m_mutex);
    prev = take_state();

    if (auto unsubmitted = get_if<Unsubmitted>(&prev))
    {
      m_state = Awaiting_wake{ std::move(unsubmitted->m_buf), std::move(waker) };
      return false;
    }
    // else
    if (auto awaiting = get_if<Awaiting_wake>(&prev))
    {
      displaced_waker = std::move(awaiting->m_waker);
      m_state = Awaiting_wake{ std::move(awaiting->m_buf), std::move(waker) };
      return false;
    }
    // else: Terminal (or broken).  Leave Consumed in place; carry on outside the lock.
  }

  if (auto ready = get_if<Ready_to_parse>(&prev))
  {
    auto& buf = ready->m_buf;
    Error_code last_err;
    const auto n_replies = Icmp_handle::parse_replies(buf.reply_region(), &last_err);
    result->m_round_trip_time_ms = extract_result(&buf, m_family, n_replies, last_err, &result->m_err_code);
    result->m_buffer = std::move(buf);

    FLOW_LOG_TRACE("Completion_state [" << this << "]: Polled ready: result [" << result->m_err_code << "] "
                   "[" << result->m_err_code.message() << "]; RTT [" << result->m_round_trip_time_ms << " ms].");
    return true;
  }
  // else
  if (auto failed = get_if<Failed_synchronously>(&prev))
  {
    result->m_err_code = error::from_sys_error(failed->m_sys_err_code);
    result->m_round_trip_time_ms = 0;
    result->m_buffer = std::move(failed->m_buf);

    FLOW_LOG_TRACE("Completion_state [" << this << "]: Polled failed-synchronously: result "
                   "[" << result->m_err_code << "] [" << result->m_err_code.message() << "].");
    return true;
  }
  // else

  FLOW_LOG_FATAL("Completion_state [" << this << "]: Polled in phase [" << Phase(prev.index()) << "]; "
                 "either the echo primitive broke its contract, or the future was polled after yielding its "
                 "result.  Cannot continue.");
  assert(false && "Polled a broken or already-consumed completion state."); std::abort();
  return false;
} // Completion_state::poll()

Completion_state::Phase Completion_state::phase() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return Phase(m_state.index());
}

Ip_family Completion_state::family() const
{
  return m_family;
}

void* Completion_state::to_opaque(const Ptr& state)
{
  assert(state);
  return new Ptr(state);
}

Completion_state::Ptr Completion_state::from_opaque(void* context)
{
  assert(context);
  const auto holder = static_cast<Ptr*>(context);
  Ptr state = std::move(*holder);
  delete holder;
  return state;
}

bool Completion_state::settle_submission(void* context, size_t ret, const Error_code& last_err)
{
  if ((ret == 0) && (last_err == error::Code::S_REQUEST_PENDING))
  {
    return true;
  }
  // else: The routine will never run, or (ret != 0) we can no longer trust it to.  Either way the reference is ours.

  from_opaque(context)->on_submit_result(ret, last_err);
  return false;
}

std::ostream& operator<<(std::ostream& os, Completion_state::Phase val)
{
  using Phase = Completion_state::Phase;

  switch (val)
  {
  case Phase::S_UNSUBMITTED:
    return os << "UNSUBMITTED";
  case Phase::S_AWAITING_WAKE:
    return os << "AWAITING_WAKE";
  case Phase::S_READY_TO_PARSE:
    return os << "READY_TO_PARSE";
  case Phase::S_FAILED_SYNCHRONOUSLY:
    return os << "FAILED_SYNCHRONOUSLY";
  case Phase::S_FAILED_UNEXPECTED_SUBMISSION:
    return os << "FAILED_UNEXPECTED_SUBMISSION";
  case Phase::S_CONSUMED:
    return os << "CONSUMED";
  }
  return os << "UNKNOWN";
}

} // namespace ping::echo::detail
