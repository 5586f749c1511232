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
#include "ping/util/native_handle.hpp"
#include <unistd.h>

namespace ping::util
{

// Static initializers.

const Native_handle::handle_t Native_handle::S_NULL_HANDLE = -1;

// Native_handle implementations.

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nope.
}

Native_handle::Native_handle(Native_handle&& src) :
  m_native_handle(src.release())
{
  // Yep.
}

Native_handle::~Native_handle()
{
  reset();
}

Native_handle& Native_handle::operator=(Native_handle&& src)
{
  if (&src != this)
  {
    reset();
    m_native_handle = src.release();
  }
  return *this;
}

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

Native_handle::handle_t Native_handle::release()
{
  const auto native_handle = m_native_handle;
  m_native_handle = S_NULL_HANDLE;
  return native_handle;
}

void Native_handle::reset()
{
  using ::close;

  if (!null())
  {
    /* Ignore the result: the only failure of interest (EBADF) would be a bug in our ownership logic; and EINTR
     * leaves the FD closed in Linux regardless. */
    close(release());
  }
}

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "native_hndl[";
  if (val.null())
  {
    os << "NONE";
  }
  else
  {
    os << val.m_native_handle;
  }
  return os << ']';
}

} // namespace ping::util
