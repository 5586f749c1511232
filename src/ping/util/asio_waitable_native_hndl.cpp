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
#include "ping/util/asio_waitable_native_hndl.hpp"
#include "ping/common.hpp"

namespace ping::util
{

// Implementations.

Asio_waitable_native_handle::Asio_waitable_native_handle(flow::util::Task_engine& task_engine) :
  Base(task_engine)
{
  // That's it.
}

Asio_waitable_native_handle::~Asio_waitable_native_handle()
{
  // release() deregisters (aborting any wait) and forgets the FD, so the base dtor does not close() it.
  if (is_open())
  {
    release();
  }
}

void Asio_waitable_native_handle::watch(const Native_handle& hndl, Error_code* err_code)
{
  // assign() registers with epoll; it reports failure through err_code and leaves us unopened in that case.
  Base::assign(hndl.m_native_handle, *err_code);
}

} // namespace ping::util
