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

#include "ping/echo/buffer.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/core/noncopyable.hpp>
#include <variant>
#include <ostream>

namespace ping::echo::detail
{

// Types.

/**
 * The lifecycle of one outstanding Async_pinger request, shared (via #Ptr) between the Ping_future polled by the user
 * and the worker thread (Async_worker) that submits the request and completes it.  It is a mutex-guarded tagged
 * union of the phases below; the Buffer travels through all of them (other than the transient one) and is handed
 * back exactly once, via poll(), upon reaching a terminal phase.
 *
 *   - Phase::S_UNSUBMITTED: Created; submission result not in yet, or accepted and pending.
 *   - Phase::S_AWAITING_WAKE: Polled while not ready; holds the waker to invoke upon completion.
 *   - Phase::S_READY_TO_PARSE: Completion arrived; the reply region is final but not yet interpreted.
 *   - Phase::S_FAILED_SYNCHRONOUSLY: The primitive refused the request outright; holds its error.
 *   - Phase::S_FAILED_UNEXPECTED_SUBMISSION: The primitive broke its return-value contract.  Polling this is fatal.
 *   - Phase::S_CONSUMED: Transient, while a transition is in progress; and, terminally, after the result has
 *     been handed out.  Polling this is fatal.
 *
 * Every transition swaps the current phase out for Phase::S_CONSUMED under the lock, inspects what came out, and
 * writes the next phase back, never modifying a phase in place.  Wakers are invoked after the lock is released.
 *
 * ### Crossing into the primitive ###
 * The echo primitive only knows a `void*` context.  to_opaque() turns a #Ptr into one (holding one reference);
 * from_opaque() turns it back (releasing that reference once the returned #Ptr goes away).  Each to_opaque() must
 * be matched by exactly one from_opaque(); settle_submission() does so for whatever the primitive did not accept.
 *
 * ### Thread safety ###
 * All public methods may be called concurrently.
 */
class Completion_state :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`.
  using Ptr = boost::shared_ptr<Completion_state>;

  /// Which alternative the state currently holds; see class doc header.
  enum class Phase
  {
    /// See class doc header.
    S_UNSUBMITTED,
    /// See class doc header.
    S_AWAITING_WAKE,
    /// See class doc header.
    S_READY_TO_PARSE,
    /// See class doc header.
    S_FAILED_SYNCHRONOUSLY,
    /// See class doc header.
    S_FAILED_UNEXPECTED_SUBMISSION,
    /// See class doc header.
    S_CONSUMED
  };

  // Constructors/destructor.

  /**
   * Constructs in Phase::S_UNSUBMITTED, owning `buf`.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param family
   *        IP version of the request.
   * @param buf
   *        The request's Buffer, already prepared via Buffer::init_for_send().
   */
  explicit Completion_state(flow::log::Logger* logger_ptr, Ip_family family, Buffer&& buf);

  // Methods.

  /**
   * Worker thread: records the immediate outcome of submitting to Icmp_handle::async_send_echo().
   * `ret == 0` with `last_err` error::Code::S_REQUEST_PENDING means accepted: nothing changes (on_completion() will
   * follow).  `ret == 0` otherwise means refused: Phase::S_FAILED_SYNCHRONOUSLY, waking the waiter if any.
   * Any other `ret` leads to Phase::S_FAILED_UNEXPECTED_SUBMISSION (also waking the waiter).
   *
   * @param ret
   *        Primitive's return value.
   * @param last_err
   *        Primitive's last error.
   */
  void on_submit_result(size_t ret, const Error_code& last_err);

  /**
   * Worker thread (from the primitive's completion routine): the reply region is final.
   * Phase::S_UNSUBMITTED or Phase::S_AWAITING_WAKE become Phase::S_READY_TO_PARSE, the latter also invoking its
   * waker.  Any other phase indicates a double completion: it is logged and left alone for poll() to trip over.
   */
  void on_completion();

  /**
   * Any thread: if the request has completed, hands out its result and returns `true`; else registers `waker`
   * (displacing any earlier one) to be invoked once from the worker thread upon completion, and returns `false`.
   *
   * Once this returned `true`, do not call it again: that is a fatal error, as is polling after the primitive broke
   * its contract (Phase::S_FAILED_UNEXPECTED_SUBMISSION).
   *
   * @param waker
   *        See above.
   * @param result
   *        Where to place the result, if `true` is returned.
   * @return See above.
   */
  bool poll(util::Task&& waker, Async_result* result);

  /**
   * Current phase: for logging and tests.
   * @return See above.
   */
  Phase phase() const;

  /**
   * IP version of the request.
   * @return See above.
   */
  Ip_family family() const;

  /**
   * Converts to a context pointer for the echo primitive, holding one reference to `*state`.
   *
   * @param state
   *        Non-null.
   * @return See above.
   */
  static void* to_opaque(const Ptr& state);

  /**
   * Reclaims a context pointer from to_opaque(); the reference it held is now in the returned #Ptr.
   *
   * @param context
   *        Result of to_opaque(), not yet reclaimed.
   * @return See above.
   */
  static Ptr from_opaque(void* context);

  /**
   * Worker thread: given the context passed to Icmp_handle::async_send_echo() and that call's outcome, either leaves
   * the context with the primitive (accepted: `ret == 0` with error::Code::S_REQUEST_PENDING; the completion routine
   * reclaims it) or reclaims it here and feeds the outcome to on_submit_result().  The latter covers refusal and a
   * broken contract (`ret != 0`) alike, so every to_opaque() is matched by exactly one from_opaque() even then.
   *
   * In the accepted case `context` is not touched: the completion routine may already have consumed it.
   *
   * @param context
   *        Result of to_opaque() just handed to the primitive.
   * @param ret
   *        Primitive's return value.
   * @param last_err
   *        Primitive's last error.
   * @return Whether the submission was accepted (context left with the primitive).
   */
  static bool settle_submission(void* context, size_t ret, const Error_code& last_err);

private:
  // Types.

  /// Phase::S_UNSUBMITTED.
  struct Unsubmitted
  {
    /// The Buffer.
    Buffer m_buf;
  };

  /// Phase::S_AWAITING_WAKE.
  struct Awaiting_wake
  {
    /// The Buffer.
    Buffer m_buf;
    /// To invoke upon completion.
    util::Task m_waker;
  };

  /// Phase::S_READY_TO_PARSE.
  struct Ready_to_parse
  {
    /// The Buffer.
    Buffer m_buf;
  };

  /// Phase::S_FAILED_SYNCHRONOUSLY.
  struct Failed_synchronously
  {
    /// The Buffer.
    Buffer m_buf;
    /// Primitive's last error.
    Error_code m_sys_err_code;
  };

  /// Phase::S_FAILED_UNEXPECTED_SUBMISSION.
  struct Failed_unexpected_submission
  {
    /// The Buffer.
    Buffer m_buf;
    /// Primitive's return value.
    size_t m_ret;
  };

  /// Phase::S_CONSUMED.
  struct Consumed
  {
  };

  /// The state proper; alternatives in the same order as Phase.
  using State = std::variant<Unsubmitted, Awaiting_wake, Ready_to_parse,
                             Failed_synchronously, Failed_unexpected_submission, Consumed>;

  // Methods.

  /**
   * Swaps #m_state for Consumed; returns what was there.  #m_mutex must be locked.
   * @return See above.
   */
  State take_state();

  // Data.

  /// See family().
  const Ip_family m_family;

  /// Protects #m_state.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// See class doc header.
  State m_state;
}; // class Completion_state

// Free functions.

/**
 * Prints string representation of the given Completion_state::Phase to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Completion_state::Phase val);

} // namespace ping::echo::detail
