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

#include <flow/log/simple_ostream_logger.hpp>
#include <ping/common.hpp>
#include "ping/test/test_config.hpp"
#include <iostream>

namespace ping::test
{

/**
 * The unit tests' Logger: everything to `cerr` (so as not to interleave with gtest's own report on `cout`), with
 * ping's and Flow's component names registered, at the severity configured by Test_config.
 *
 * Since the async worker keeps the Logger it was first given, use the one from process_logger() rather than
 * making more.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity
   *        Lowest severity that will pass through the filter.
   */
  explicit Test_logger(flow::log::Sev min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config, std::cerr, std::cerr)
  {
    // Fine to do after m_logger took the pointer: nothing has been logged yet.
    register_components(&m_config);
  }

  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /**
   * Registers both component enums, in disjoint index ranges.
   *
   * @param config
   *        The Config.
   */
  static void register_components(flow::log::Config* config)
  {
    using flow::log::Config;
    using flow::Flow_log_component;

    config->init_component_to_union_idx_mapping<Log_component>
      (100, Config::standard_component_payload_enum_sparse_length<Log_component>());
    config->init_component_names<Log_component>(S_PING_LOG_COMPONENT_NAME_MAP, false, "ping-");
    config->init_component_to_union_idx_mapping<Flow_log_component>
      (200, Config::standard_component_payload_enum_sparse_length<Flow_log_component>());
    config->init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  /// Logging configuration; must precede #m_logger.
  flow::log::Config m_config;

  /// The console logger.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace ping::test
