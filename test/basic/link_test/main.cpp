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

#include <ping/echo/pinger.hpp>
#include <ping/echo/async_pinger.hpp>
#include <ping/echo/ping_future.hpp>
#include <ping/echo/error.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We issue one blocking and one non-blocking ping to loopback and report the results; a host
 * that denies this process ICMP sockets merely yields warnings, not a failure. */
int main(int argc, char const * const * argv)
{
  using ping::echo::Pinger;
  using ping::echo::Async_pinger;
  using ping::echo::Buffer;
  using ping::util::Ip_address;
  using ping::util::Ipv4_address;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "ping_core_link_test.log";
  const int BAD_EXIT = 1;

  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the ping/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for ping/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<ping::Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<ping::Log_component>());
  log_config.init_component_names<ping::Log_component>(ping::S_PING_LOG_COMPONENT_NAME_MAP, false, "ping-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation. */);

  /* The Async_pinger worker thread, and any Ping_future, log to the first Async_pinger's Logger until the process
   * exits; so that one (with its Config) is never destroyed.  It goes to the console, not the file: the file logger
   * is flushed by its destructor at the end of main(). */
  auto& worker_log_config = *(new Config(log_config));
  worker_log_config.configure_default_verbosity(Sev::S_INFO, true);
  auto& worker_logger = *(new Simple_ostream_logger(&worker_log_config));

  try
  {
    const Ip_address loopback(Ipv4_address::loopback());
    const string PAYLOAD = "Hello, world!";

    Error_code err_code;
    Pinger pinger(&log_logger, &err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Pinger is degraded: [" << err_code << "] [" << err_code.message() << "].");
    }

    Buffer buf(Buffer::Request_data(PAYLOAD.begin(), PAYLOAD.end()));
    const auto rtt = pinger.send(loopback, &buf, &err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Blocking ping failed: [" << err_code << "] [" << err_code.message() << "].");
    }
    else
    {
      const auto reply = buf.reply_data();
      FLOW_LOG_INFO("Blocking ping: RTT [" << rtt << " ms]; echoed "
                    "[" << string(static_cast<const char*>(reply.data()), reply.size()) << "].");
    }

    Async_pinger async_pinger(&worker_logger);
    auto future = async_pinger.send(loopback, Buffer(Buffer::Request_data(PAYLOAD.rbegin(), PAYLOAD.rend())));
    const auto result = future.wait();
    if (result.m_err_code)
    {
      FLOW_LOG_WARNING("Non-blocking ping failed: "
                       "[" << result.m_err_code << "] [" << result.m_err_code.message() << "].");
    }
    else
    {
      const auto reply = result.m_buffer.reply_data();
      FLOW_LOG_INFO("Non-blocking ping: RTT [" << result.m_round_trip_time_ms << " ms]; echoed "
                    "[" << string(static_cast<const char*>(reply.data()), reply.size()) << "].");
    }

    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
