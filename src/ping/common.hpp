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

/* Same ordering constraint as in Flow itself: flow/common.hpp needs to #undef a couple things
 * before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*), so it must come before ping/detail/common.hpp. */
#include <flow/util/util.hpp>

#include "ping/detail/common.hpp"

/* The APIs and header-inlined stuff (templates, constexprs) require C++17 or newer; and that applies to the linking
 * user's `#include`ing .cpp file(s) as well.  Therefore enforce it. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any ping/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the ping project: A library/API in modern C++17 for issuing ICMP echo requests
 * (a/k/a pings) and reporting their round-trip outcomes, over both IPv4 and IPv6.
 *
 * From the user's perspective, one should view this namespace as the "root," meaning it consists of two parts:
 *   - Symbols directly in `ping`: The absolute most basic, commonly used symbols (such as the alias
 *     ping::Error_code).  In particular this includes `enum class` ping::Log_component which defines the set of
 *     possible `flow::log::Component` values logged from within all modules of ping.
 *   - Sub-namespaces (ping::echo, ping::util), each of which represents a ping *module*.
 *
 * Modules overview
 * ----------------
 *   - *ping::echo*: The point of the library.  Two issuers are available:
 *     - echo::Pinger sends a request and blocks until it completes (successfully or otherwise).
 *     - echo::Async_pinger submits a request and immediately returns an echo::Ping_future.  All `Async_pinger`s in
 *       the process share one background worker thread, which issues every submitted request and receives every
 *       completion.  The future can be polled from any thread; or one can simply block on it via
 *       Ping_future::wait().
 *
 *     Either way the request payload and (on completion) reply payload live in an echo::Buffer, and the
 *     outcome is an #Error_code: falsy on success (with a round-trip time), else an echo::error::Code or an
 *     "other" code in a different category.
 *   - *ping::util*: Miscellaneous items, such as util::Native_handle (a thin wrapper around an FD).
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * ping requires Flow and Boost, not only for internal implementation purposes but also in some of its APIs.
 * For example, `flow::log` is the assumed logging system, and `flow::Error_code` and related conventions are used
 * for error reporting; and `boost::asio::ip` address types appear throughout the echo API.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore, see the
 * `namespace flow` doc header's "Error reporting" section.  There is one major deviation: request *outcomes*
 * (timeout, unreachable destination, etc.) are never thrown; they are ordinary values.  See echo::Pinger::send().
 *
 * ### Logging ###
 * We use the Flow log module, in `flow::log` namespace, for logging.  We are just a consumer, but this does mean
 * the user must supply a `flow::log::Logger` into various APIs in order to enable logging.  (Worst-case,
 * passing `Logger == null` will make it log nowhere.)  See `flow::log` docs.
 */
namespace ping
{

// Types.  They're outside of `namespace ::ping::util` for brevity due to their frequent use.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef PING_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by ping internal logging.
 * Internal ping code specifies members thereof when indicating the log component for each particular piece of
 * logging code.  The user specifies it, albeit very rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are not documented right here, because `flow::log` auto-generates those via certain
 * macro magic, and Doxygen cannot understand what is happening.  However, you will find the same information
 * directly in the source file `log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only; see ping::Log_component doc header.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in ping::Log_component to its
 * string representation as used in log output and verbosity config.
 *
 * @see ping::Log_component first.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_PING_LOG_COMPONENT_NAME_MAP;

#endif // PING_DOXYGEN_ONLY

} // namespace ping
