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
#include <flow/util/util_fwd.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <queue>

namespace ping::echo::detail
{

// Types.

/**
 * Bounded FIFO of jobs, with any number of producers and one consumer: push() blocks while the queue is at
 * capacity; try_pop() never blocks.  The consumer is expected to learn of new jobs by other means (Async_worker
 * posts a drain task to its thread), so there is no blocking pop.
 *
 * @tparam Job
 *         Movable job type.
 */
template<typename Job>
class Job_queue :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty queue.
   *
   * @param capacity
   *        Most jobs held at once; at least 1.
   */
  explicit Job_queue(size_t capacity);

  // Methods.

  /**
   * Appends `job`, first waiting for room if the queue is full.
   *
   * @param job
   *        Job.
   */
  void push(Job&& job);

  /**
   * Removes and returns the oldest job; `nullopt` if empty.  Wakes one blocked push(), if any.
   * @return See above.
   */
  std::optional<Job> try_pop();

  /**
   * Number of jobs currently held.
   * @return See above.
   */
  size_t size() const;

  /**
   * See ctor.
   * @return See above.
   */
  size_t capacity() const;

private:
  // Data.

  /// See capacity().
  const size_t m_capacity;

  /// Protects #m_jobs.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Signaled whenever a job is removed.
  boost::condition_variable m_not_full;

  /// The jobs, oldest at front.
  std::queue<Job> m_jobs;
}; // class Job_queue

// Template implementations.

template<typename Job>
Job_queue<Job>::Job_queue(size_t capacity) :
  m_capacity(capacity)
{
  assert(m_capacity >= 1);
}

template<typename Job>
void Job_queue<Job>::push(Job&& job)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_not_full.wait(lock, [&]() -> bool { return m_jobs.size() < m_capacity; });
  m_jobs.emplace(std::move(job));
}

template<typename Job>
std::optional<Job> Job_queue<Job>::try_pop()
{
  std::optional<Job> job;
  {
    flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
    if (m_jobs.empty())
    {
      return job;
    }
    // else
    job.emplace(std::move(m_jobs.front()));
    m_jobs.pop();
  }
  m_not_full.notify_one();
  return job;
}

template<typename Job>
size_t Job_queue<Job>::size() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_jobs.size();
}

template<typename Job>
size_t Job_queue<Job>::capacity() const
{
  return m_capacity;
}

} // namespace ping::echo::detail
