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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* This is modeled off the similarly-named such file in Flow.  See that for docs.
 * One line per component: name, then its enum value. */

// Rarely used component corresponding to log call sites outside namespace `ping::X`, for all X in ::ping.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace ping::echo.
FLOW_LOG_CFG_COMPONENT_DEFINE(ECHO, 1)
// Logging from namespace ping::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 2)
// Logging from namespace ping::*::test.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 3)

// -v- Doxygen, please stop ignoring.
/// @endcond
