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

#include "ping/echo/detail/icmp_handle.hpp"
#include "ping/echo/detail/completion_state.hpp"
#include "ping/echo/detail/job_queue.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/thread/once.hpp>
#include <atomic>
#include <optional>

namespace ping::echo::detail
{

// Types.

/**
 * The process-wide background worker behind every Async_pinger: one thread (a `flow::async::Single_thread_task_loop`)
 * plus a bounded Job_queue of submissions.  The thread is the only one that issues async echo requests (via
 * Icmp_handle::async_send_echo()) and the only one on which their completion routines run.
 *
 * ### Lifetime ###
 * Created lazily, exactly once, by the first get_or_create() (i.e., the first Async_pinger construction); it then
 * lives until the process exits.  There is no shutdown API.  It logs to the Logger given to that first call, which
 * therefore must live as long.
 *
 * ### Flow of a submission ###
 * submit() (any thread) pushes a Job, blocking if the queue is full, and makes sure a drain task is posted onto the
 * worker thread.  The drain task pops every queued Job in FIFO order and, for each, hands the Job's
 * Completion_state (converted via Completion_state::to_opaque()) to the Icmp_handle of the destination's family,
 * then records the immediate outcome via Completion_state::on_submit_result().  The completion routine
 * reclaims the state and calls Completion_state::on_completion().
 *
 * If a family's Icmp_handle could not be opened at startup, each Job of that family fails synchronously with
 * error::Code::S_ICMP_HANDLE_UNAVAILABLE.
 */
class Async_worker :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// One submission: everything needed to issue one async echo request.
  struct Job
  {
    /// Source address, if pinned.
    std::optional<util::Ip_address> m_src;

    /// Destination address.
    util::Ip_address m_dst;

    /// TTL, don't-fragment, timeout.
    Request_options m_opts;

    /// The Buffer's request payload; the Buffer lives inside #m_state.
    util::Blob_const m_request;

    /// The Buffer's reply region; ditto.
    util::Blob_mutable m_reply;

    /// The request's shared state.
    Completion_state::Ptr m_state;
  }; // struct Job

  // Constants.

  /// Queue capacity used unless set_queue_capacity() says otherwise: `PING_ASYNC_QUEUE_CAPACITY`, else 1024.
  static const size_t S_DEFAULT_QUEUE_CAPACITY;

  // Methods.

  /**
   * Returns the one Async_worker, creating it (and starting its thread) if necessary.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; used only if this call creates the worker.
   * @return See above.  Never null.
   */
  static Async_worker* get_or_create(flow::log::Logger* logger_ptr);

  /**
   * Sets the queue capacity that get_or_create() will use.  Fails (returning `false` and changing nothing) if the
   * worker already exists or if `capacity` is 0.
   *
   * @param capacity
   *        Capacity.
   * @return See above.
   */
  static bool set_queue_capacity(size_t capacity);

  /**
   * The queue capacity in effect, or to be in effect once the worker is created.
   * @return See above.
   */
  static size_t queue_capacity();

  /**
   * Queues a Job for issuing on the worker thread; blocks while the queue is full.  Do not call from the worker
   * thread (e.g., from a Ping_future waker) if the queue might be full: that would block forever.
   *
   * @param job
   *        The Job.  Its #Job::m_state is in Completion_state::Phase::S_UNSUBMITTED.
   */
  void submit(Job&& job);

  /**
   * Whether the Icmp_handle for `family` opened at startup.
   *
   * @param family
   *        IP version.
   * @return See above.
   */
  bool family_available(Ip_family family) const;

private:
  // Constructors/destructor.

  /**
   * Starts the thread; opens the Icmp_handle objects from within it; returns once that is done.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param queue_capacity
   *        Capacity of #m_jobs.
   */
  explicit Async_worker(flow::log::Logger* logger_ptr, size_t queue_capacity);

  // Methods.

  /// Worker thread: pops and issues every queued Job.
  void drain();

  /**
   * Worker thread: issues one Job.
   *
   * @param job
   *        The Job.
   */
  void issue(Job&& job);

  /**
   * The Icmp_handle completion routine: reclaims the Completion_state and completes it.
   *
   * @param context
   *        From Completion_state::to_opaque().
   */
  static void on_echo_completion(void* context);

  // Data.

  /// Guards creation of #s_instance.
  static boost::once_flag s_instance_once;

  /// Protects #s_queue_capacity and the transition of #s_instance from null.
  static flow::util::Mutex_non_recursive s_config_mutex;

  /// See queue_capacity().
  static size_t s_queue_capacity;

  /// The one Async_worker, once created.
  static Async_worker* s_instance;

  /// The submissions.
  Job_queue<Job> m_jobs;

  /// Whether a drain() is posted and has not yet begun.
  std::atomic<bool> m_drain_pending;

  /// ICMPv4 primitive; empty if unavailable.
  std::optional<Icmp_handle> m_icmp_v4;

  /// ICMPv6 primitive; empty if unavailable.
  std::optional<Icmp_handle> m_icmp_v6;

  /// The thread.
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_worker;
}; // class Async_worker

} // namespace ping::echo::detail
