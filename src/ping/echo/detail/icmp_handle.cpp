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
#include "ping/echo/detail/icmp_handle.hpp"
#include "ping/echo/detail/echo_reply.hpp"
#include "ping/echo/error.hpp"
#include "ping/util/asio_waitable_native_hndl.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <boost/chrono.hpp>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <netinet/icmp6.h>
#include <linux/errqueue.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <optional>
#include <cstring>
#include <cerrno>

namespace ping::echo::detail
{

namespace
{

/// Sequence number source shared by all requests in the process.
std::atomic<uint16_t> s_next_seq(0);

/// Size of an ICMP(v6) echo header: type, code, checksum, identifier, sequence.
constexpr size_t S_ECHO_HDR_SIZE = 8;

/// Most an IPv4 header can take (raw v4 sockets deliver it in front of the ICMP message).
constexpr size_t S_MAX_IPV4_HDR_SIZE = 60;

/// Control-message room for `recvmsg()`: extended error plus offender, or hop limit.
constexpr size_t S_CONTROL_BUF_SIZE = 512;

} // namespace (anon)

// Types.

/**
 * The state of one accepted async_send_echo() request, shared among the handlers waiting on its socket and on its
 * timeout.  Whichever of those decides the outcome first calls finish_async_echo(), which makes the other a no-op.
 */
struct Icmp_handle::Async_echo_op :
  private boost::noncopyable
{
  // Constructors/destructor.

  /**
   * Takes over the request socket.
   *
   * @param task_engine
   *        Loop on which the handlers run.
   * @param sock
   *        Request socket, opened and connected.
   */
  explicit Async_echo_op(flow::util::Task_engine* task_engine, util::Native_handle&& sock);

  // Data.

  /// The request socket; closed by finish_async_echo().
  util::Native_handle m_sock;

  /// Watches #m_sock for readability; emptied before #m_sock closes.
  std::optional<util::Asio_waitable_native_handle> m_watcher;

  /// Fires on timeout.
  flow::util::Timer m_timer;

  /// Sequence number sent.
  uint16_t m_seq;

  /// Request payload size.
  size_t m_request_size;

  /// When the request was sent.
  util::Fine_time_pt m_sent_at;

  /// Reply region being filled.
  util::Blob_mutable m_reply;

  /// To invoke upon completion.
  Completion_routine m_routine;

  /// To pass to #m_routine.
  void* m_context;

  /// Whether finish_async_echo() has run.
  bool m_done;
}; // struct Icmp_handle::Async_echo_op

// Implementations.

Icmp_handle::Async_echo_op::Async_echo_op(flow::util::Task_engine* task_engine, util::Native_handle&& sock) :
  m_sock(std::move(sock)),
  m_timer(*task_engine),
  m_seq(0),
  m_request_size(0),
  m_routine(nullptr),
  m_context(nullptr),
  m_done(false)
{
  // That's it.
}

Icmp_handle::Icmp_handle(flow::log::Logger* logger_ptr, Ip_family family, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_ECHO),
  m_family(family),
  m_socket_kind(Socket_kind::S_DATAGRAM),
  m_echo_id(static_cast<uint16_t>(::getpid() & 0xFFFF))
{
  using flow::error::Runtime_error;
  using boost::system::system_category;

  const int domain = (m_family == Ip_family::S_V4) ? AF_INET : AF_INET6;
  const int protocol = (m_family == Ip_family::S_V4) ? int(IPPROTO_ICMP) : int(IPPROTO_ICMPV6);

  FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Trying ICMP socket kinds.");

  // Prefer the unprivileged kind; fall back to raw.  Either way the trial socket is closed right away.
  Error_code sys_err_code;
  util::Native_handle trial(::socket(domain, SOCK_DGRAM | SOCK_CLOEXEC, protocol));
  if (trial.null())
  {
    FLOW_LOG_INFO("Icmp_handle [" << *this << "]: ICMP datagram socket unavailable (errno [" << errno << "]); "
                  "trying raw socket.");
    m_socket_kind = Socket_kind::S_RAW;
    trial = util::Native_handle(::socket(domain, SOCK_RAW | SOCK_CLOEXEC, protocol));
    if (trial.null())
    {
      sys_err_code = Error_code(errno, system_category());
    }
  }

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Icmp_handle [" << *this << "]: Could open neither an ICMP datagram nor a raw socket; "
                     "this family is unavailable.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    if (err_code)
    {
      *err_code = sys_err_code;
    }
    else
    {
      throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
    }
    return;
  }
  // else

  FLOW_LOG_INFO("Icmp_handle [" << *this << "]: Ready.");
  if (err_code)
  {
    err_code->clear();
  }
} // Icmp_handle::Icmp_handle()

Ip_family Icmp_handle::family() const
{
  return m_family;
}

Icmp_handle::Socket_kind Icmp_handle::socket_kind() const
{
  return m_socket_kind;
}

util::Native_handle Icmp_handle::open_request_socket(const util::Ip_address* src, const util::Ip_address& dst,
                                                     const Request_options& opts, Error_code* err_code) const
{
  using util::Native_handle;
  using boost::system::system_category;

  const bool v4 = m_family == Ip_family::S_V4;
  const int domain = v4 ? AF_INET : AF_INET6;
  const int protocol = v4 ? int(IPPROTO_ICMP) : int(IPPROTO_ICMPV6);
  const int type = (m_socket_kind == Socket_kind::S_DATAGRAM) ? SOCK_DGRAM : SOCK_RAW;

  // Sets *err_code from errno and returns null handle.  The socket (if any) closes on its way out.
  const auto fail = [&](util::String_view context) -> Native_handle
  {
    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Request to [" << dst << "]: [" << context << "] failed: "
                   "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
    return Native_handle();
  };

  Native_handle sock(::socket(domain, type | SOCK_CLOEXEC, protocol));
  if (sock.null())
  {
    return fail("socket()");
  }
  // else

  const auto set_int_opt = [&](int level, int name, int val) -> bool
  {
    return ::setsockopt(sock.m_native_handle, level, name, &val, sizeof(val)) == 0;
  };

  const int one = 1;
  if (v4)
  {
    if (!set_int_opt(IPPROTO_IP, IP_TTL, opts.m_ttl)
        || !set_int_opt(IPPROTO_IP, IP_MTU_DISCOVER, opts.m_df ? IP_PMTUDISC_DO : IP_PMTUDISC_DONT)
        || !set_int_opt(IPPROTO_IP, IP_RECVERR, one)
        || !set_int_opt(IPPROTO_IP, IP_RECVTTL, one))
    {
      return fail("setsockopt(IPPROTO_IP)");
    }
  }
  else
  {
    if (!set_int_opt(IPPROTO_IPV6, IPV6_UNICAST_HOPS, opts.m_ttl)
        || !set_int_opt(IPPROTO_IPV6, IPV6_DONTFRAG, opts.m_df ? 1 : 0)
        || !set_int_opt(IPPROTO_IPV6, IPV6_RECVERR, one)
        || !set_int_opt(IPPROTO_IPV6, IPV6_RECVHOPLIMIT, one))
    {
      return fail("setsockopt(IPPROTO_IPV6)");
    }

    if (m_socket_kind == Socket_kind::S_RAW)
    {
      // A raw v6 socket otherwise gets every ICMPv6 message for the host.  Errors still reach the error queue.
      ::icmp6_filter filter;
      ICMP6_FILTER_SETBLOCKALL(&filter);
      ICMP6_FILTER_SETPASS(ICMP6_ECHO_REPLY, &filter);
      if (::setsockopt(sock.m_native_handle, IPPROTO_ICMPV6, ICMP6_FILTER, &filter, sizeof(filter)) != 0)
      {
        return fail("setsockopt(ICMP6_FILTER)");
      }
    }
  } // else if (!v4)

  if (src)
  {
    const auto src_addr = util::to_sock_address(*src);
    if (::bind(sock.m_native_handle, src_addr.data(), src_addr.size()) != 0)
    {
      return fail("bind()");
    }
  }

  const auto dst_addr = util::to_sock_address(dst);
  if (::connect(sock.m_native_handle, dst_addr.data(), dst_addr.size()) != 0)
  {
    /* With the source pinned, the kernel rejects a source that cannot reach `dst` (say, loopback source toward a
     * non-local destination) with EINVAL rather than ENETUNREACH.  Either way no route satisfies the pair. */
    if (src && ((errno == EINVAL) || (errno == ENETUNREACH)))
    {
      errno = ENETUNREACH;
    }
    return fail("connect()");
  }
  // else

  err_code->clear();
  return sock;
} // Icmp_handle::open_request_socket()

void Icmp_handle::send_request(const util::Native_handle& sock, const util::Blob_const& request, uint16_t seq,
                               Error_code* err_code) const
{
  using boost::system::system_category;
  using std::memcpy;

  std::vector<uint8_t> packet(S_ECHO_HDR_SIZE + request.size());
  const bool v4 = m_family == Ip_family::S_V4;

  packet[0] = v4 ? uint8_t(ICMP_ECHO) : uint8_t(ICMP6_ECHO_REQUEST);
  packet[1] = 0;
  // Datagram sockets assign their own identifier.
  const uint16_t id_nbo = htons((m_socket_kind == Socket_kind::S_RAW) ? m_echo_id : 0);
  const uint16_t seq_nbo = htons(seq);
  memcpy(&packet[4], &id_nbo, sizeof(id_nbo));
  memcpy(&packet[6], &seq_nbo, sizeof(seq_nbo));
  if (request.size() != 0)
  {
    memcpy(&packet[S_ECHO_HDR_SIZE], request.data(), request.size());
  }

  // The kernel computes the ICMPv6 checksum (pseudo-header included) itself.
  if (v4)
  {
    const uint16_t checksum = util::internet_checksum(util::Blob_const(packet.data(), packet.size()));
    memcpy(&packet[2], &checksum, sizeof(checksum));
  }

  ssize_t n_sent;
  do
  {
    n_sent = ::send(sock.m_native_handle, packet.data(), packet.size(), 0);
  }
  while ((n_sent == -1) && (errno == EINTR));

  if (n_sent == -1)
  {
    const auto& sys_err_code = *err_code = Error_code(errno, system_category());
    FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: send() of seq [" << seq << "] failed: "
                   "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
    return;
  }
  // else

  FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Sent echo request seq [" << seq << "] on "
                 "[" << sock << "]: [" << request.size() << "] payload bytes.");
  err_code->clear();
} // Icmp_handle::send_request()

Icmp_handle::Read_outcome Icmp_handle::read_reply(const util::Native_handle& sock, uint16_t seq,
                                                  size_t request_size, const util::Fine_time_pt& sent_at,
                                                  const util::Blob_mutable& reply, Error_code* err_code) const
{
  using boost::system::system_category;
  using std::memcpy;

  const bool v4 = m_family == Ip_family::S_V4;
  const bool raw = m_socket_kind == Socket_kind::S_RAW;

  std::vector<uint8_t> buf(S_MAX_IPV4_HDR_SIZE + S_ECHO_HDR_SIZE + request_size + S_REPLY_REGION_SLACK_SIZE);
  alignas(::cmsghdr) uint8_t control[S_CONTROL_BUF_SIZE];
  ::sockaddr_storage peer;

  // Does the echo header at `hdr` carry our identity?  The kernel filters by identifier for datagram sockets.
  const auto is_ours = [&](const uint8_t* hdr) -> bool
  {
    uint16_t id_nbo;
    uint16_t seq_nbo;
    memcpy(&id_nbo, hdr + 4, sizeof(id_nbo));
    memcpy(&seq_nbo, hdr + 6, sizeof(seq_nbo));
    return (ntohs(seq_nbo) == seq) && ((!raw) || (ntohs(id_nbo) == m_echo_id));
  };

  while (true)
  {
    ::iovec iov{ buf.data(), buf.size() };
    ::msghdr msg{};
    msg.msg_name = &peer;
    msg.msg_namelen = sizeof(peer);
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    msg.msg_control = control;
    msg.msg_controllen = sizeof(control);

    // Error queue first: an ICMP error for our request (payload = our echo header and on), or a local failure.
    ssize_t n_rcvd = ::recvmsg(sock.m_native_handle, &msg, MSG_ERRQUEUE | MSG_DONTWAIT);
    if (n_rcvd >= 0)
    {
      const ::sock_extended_err* ee = nullptr;
      for (auto cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg))
      {
        if ((v4 && (cmsg->cmsg_level == SOL_IP) && (cmsg->cmsg_type == IP_RECVERR))
            || ((!v4) && (cmsg->cmsg_level == SOL_IPV6) && (cmsg->cmsg_type == IPV6_RECVERR)))
        {
          ee = reinterpret_cast<const ::sock_extended_err*>(CMSG_DATA(cmsg));
        }
      }

      if (!ee)
      {
        continue;
      }
      // else

      if (ee->ee_origin == SO_EE_ORIGIN_LOCAL)
      {
        const auto& sys_err_code = *err_code = Error_code(int(ee->ee_errno), system_category());
        FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Local error on seq [" << seq << "]: "
                       "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
        return Read_outcome::S_FAILED;
      }
      // else

      if (((ee->ee_origin != SO_EE_ORIGIN_ICMP) && (ee->ee_origin != SO_EE_ORIGIN_ICMP6))
          || (size_t(n_rcvd) < S_ECHO_HDR_SIZE) || (!is_ours(buf.data())))
      {
        continue;
      }
      // else

      const auto offender = reinterpret_cast<const ::sockaddr*>(SO_EE_OFFENDER(ee));
      const auto responder = util::from_sock_address(*offender);
      const auto status = icmp_error_to_ip_status(m_family, ee->ee_type, ee->ee_code);

      FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: ICMP error for seq [" << seq << "] from [" << responder << "]: "
                     "type [" << int(ee->ee_type) << "] code [" << int(ee->ee_code) << "] => "
                     "status [" << status << "].");
      record_reply(reply, status, sent_at, responder, 0, util::Blob_const());
      return Read_outcome::S_REPLIED;
    } // if (n_rcvd >= 0)
    // else
    if (errno == EINTR)
    {
      continue;
    }
    // else if EAGAIN: nothing queued there.  Anything else would be strange; the normal receive will tell.

    msg.msg_namelen = sizeof(peer);
    msg.msg_controllen = sizeof(control);
    msg.msg_flags = 0;
    n_rcvd = ::recvmsg(sock.m_native_handle, &msg, MSG_DONTWAIT);
    if (n_rcvd < 0)
    {
      if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
      {
        return Read_outcome::S_NONE;
      }
      // else
      if (errno == EINTR)
      {
        continue;
      }
      // else

      const auto& sys_err_code = *err_code = Error_code(errno, system_category());
      FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: recvmsg() for seq [" << seq << "] failed: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
      return Read_outcome::S_FAILED;
    }
    // else

    size_t offset = 0;
    int hop_limit = 0;
    if (v4 && raw)
    {
      if (n_rcvd < 1)
      {
        continue;
      }
      offset = size_t(buf[0] & 0x0F) * 4;
      hop_limit = buf[8];
    }
    if (size_t(n_rcvd) < (offset + S_ECHO_HDR_SIZE))
    {
      continue;
    }
    // else

    const uint8_t* hdr = buf.data() + offset;
    const uint8_t reply_type = v4 ? uint8_t(ICMP_ECHOREPLY) : uint8_t(ICMP6_ECHO_REPLY);
    if ((hdr[0] != reply_type) || (!is_ours(hdr)))
    {
      // E.g., on a raw socket: our own request looped back, or another process's traffic.
      continue;
    }
    // else

    for (auto cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg))
    {
      if ((v4 && (cmsg->cmsg_level == IPPROTO_IP) && (cmsg->cmsg_type == IP_TTL))
          || ((!v4) && (cmsg->cmsg_level == IPPROTO_IPV6) && (cmsg->cmsg_type == IPV6_HOPLIMIT)))
      {
        memcpy(&hop_limit, CMSG_DATA(cmsg), sizeof(hop_limit));
      }
    }

    const auto responder = util::from_sock_address(*reinterpret_cast<const ::sockaddr*>(&peer));
    const util::Blob_const payload(hdr + S_ECHO_HDR_SIZE, size_t(n_rcvd) - offset - S_ECHO_HDR_SIZE);

    FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Echo reply for seq [" << seq << "] from [" << responder << "]: "
                   "[" << payload.size() << "] payload bytes; hop limit [" << hop_limit << "].");
    record_reply(reply, uint32_t(error::Ip_status::S_SUCCESS), sent_at, responder, hop_limit, payload);
    return Read_outcome::S_REPLIED;
  } // while (true)
} // Icmp_handle::read_reply()

size_t Icmp_handle::send_echo(const util::Ip_address* src, const util::Ip_address& dst,
                              const util::Blob_const& request, const Request_options& opts,
                              const util::Blob_mutable& reply, Error_code* last_err) const
{
  using flow::Fine_clock;
  using boost::chrono::milliseconds;
  using boost::system::system_category;

  assert(family_of(dst) == m_family);

  const auto no_reply = [&](const Error_code& why) -> size_t
  {
    *last_err = why;
    record_no_reply(reply, why);
    return 0;
  };

  Error_code err_code;
  const auto sock = open_request_socket(src, dst, opts, &err_code);
  if (err_code)
  {
    return no_reply(err_code);
  }
  // else

  const uint16_t seq = s_next_seq++;
  const auto sent_at = Fine_clock::now();
  send_request(sock, request, seq, &err_code);
  if (err_code)
  {
    return no_reply(err_code);
  }
  // else

  const auto deadline = sent_at + milliseconds(opts.m_timeout_ms);
  while (true)
  {
    switch (read_reply(sock, seq, request.size(), sent_at, reply, &err_code))
    {
    case Read_outcome::S_REPLIED:
      last_err->clear();
      return 1;
    case Read_outcome::S_FAILED:
      return no_reply(err_code);
    case Read_outcome::S_NONE:
      break;
    }

    const auto now = Fine_clock::now();
    if (now >= deadline)
    {
      FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Seq [" << seq << "] to [" << dst << "] timed out.");
      return no_reply(Error_code(int(error::Ip_status::S_REQ_TIMED_OUT), error::ip_status_category()));
    }
    // else

    ::pollfd poll_fd{ sock.m_native_handle, POLLIN, 0 };
    if ((::poll(&poll_fd, 1, util::to_poll_timeout_ms(deadline - now)) == -1) && (errno != EINTR))
    {
      const auto& sys_err_code = Error_code(errno, system_category());
      FLOW_LOG_WARNING("Icmp_handle [" << *this << "]: poll() failed while awaiting seq [" << seq << "].  "
                       "Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return no_reply(sys_err_code);
    }
  } // while (true)
} // Icmp_handle::send_echo()

size_t Icmp_handle::async_send_echo(flow::util::Task_engine* task_engine,
                                    const util::Ip_address* src, const util::Ip_address& dst,
                                    const util::Blob_const& request, const Request_options& opts,
                                    const util::Blob_mutable& reply,
                                    Completion_routine completion_routine, void* context,
                                    Error_code* last_err) const
{
  using flow::Fine_clock;
  using boost::make_shared;
  using boost::chrono::milliseconds;

  assert(family_of(dst) == m_family);
  assert(completion_routine);

  const auto no_reply = [&](const Error_code& why) -> size_t
  {
    // Failed synchronously.  completion_routine shall never run.
    *last_err = why;
    record_no_reply(reply, why);
    return 0;
  };

  Error_code err_code;
  auto sock = open_request_socket(src, dst, opts, &err_code);
  if (err_code)
  {
    return no_reply(err_code);
  }
  // else

  const auto op = make_shared<Async_echo_op>(task_engine, std::move(sock));
  op->m_request_size = request.size();
  op->m_reply = reply;
  op->m_routine = completion_routine;
  op->m_context = context;

  /* Register with the reactor before sending anything: if that fails (epoll_ctl() out of watches or memory) the
   * request is not yet on the wire, and the failure is as synchronous as a failed bind(). */
  op->m_watcher.emplace(*task_engine);
  op->m_watcher->watch(op->m_sock, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Icmp_handle [" << *this << "]: Could not watch request socket [" << op->m_sock << "] "
                     "to [" << dst << "]: [" << err_code << "] [" << err_code.message() << "].");
    return no_reply(err_code);
  }
  // else

  op->m_seq = s_next_seq++;
  op->m_sent_at = Fine_clock::now();
  send_request(op->m_sock, request, op->m_seq, &err_code);
  if (err_code)
  {
    return no_reply(err_code);
  }
  // else

  op->m_timer.expires_after(milliseconds(opts.m_timeout_ms));
  op->m_timer.async_wait([this, op](const Error_code& async_err_code)
  {
    auto sys_err_code = async_err_code;
    if ((sys_err_code == boost::asio::error::operation_aborted) || op->m_done)
    {
      return;
    }
    // else

    if (sys_err_code)
    {
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      FLOW_LOG_WARNING("Icmp_handle [" << *this << "]: Timer system error; just logged; totally unexpected; "
                       "pretending it fired normally.");
    }

    FLOW_LOG_TRACE("Icmp_handle [" << *this << "]: Seq [" << op->m_seq << "] timed out.");
    record_no_reply(op->m_reply,
                    Error_code(int(error::Ip_status::S_REQ_TIMED_OUT), error::ip_status_category()));
    finish_async_echo(op.get());
  });

  async_wait_readable(op);

  *last_err = error::Code::S_REQUEST_PENDING;
  return 0;
} // Icmp_handle::async_send_echo()

void Icmp_handle::async_wait_readable(const boost::shared_ptr<Async_echo_op>& op) const
{
  using util::Asio_waitable_native_handle;

  op->m_watcher->async_wait(Asio_waitable_native_handle::Base::wait_read,
                            [this, op](const Error_code& async_err_code)
  {
    auto sys_err_code = async_err_code;
    if ((sys_err_code == boost::asio::error::operation_aborted) || op->m_done)
    {
      return;
    }
    // else

    if (sys_err_code)
    {
      FLOW_LOG_FATAL("Icmp_handle [" << *this << "]: Wait on request socket failed; this should never happen.  "
                     "Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_FATAL();
      assert(false && "Async-wait on ICMP socket failed; this should never happen."); std::abort();
      return;
    }
    // else

    Error_code err_code;
    switch (read_reply(op->m_sock, op->m_seq, op->m_request_size, op->m_sent_at, op->m_reply, &err_code))
    {
    case Read_outcome::S_NONE:
      async_wait_readable(op);
      return;
    case Read_outcome::S_FAILED:
      record_no_reply(op->m_reply, err_code);
      break;
    case Read_outcome::S_REPLIED:
      break;
    }

    finish_async_echo(op.get());
  });
} // Icmp_handle::async_wait_readable()

void Icmp_handle::finish_async_echo(Async_echo_op* op)
{
  if (op->m_done)
  {
    return;
  }
  // else

  op->m_done = true;
  op->m_timer.cancel();
  op->m_watcher.reset(); // Before the socket closes.
  op->m_sock.reset();

  op->m_routine(op->m_context);
} // Icmp_handle::finish_async_echo()

size_t Icmp_handle::parse_replies(const util::Blob_mutable& reply, Error_code* last_err)
{
  using boost::system::system_category;

  if (reply.size() < S_ECHO_REPLY_RESERVED_SIZE)
  {
    *last_err = error::Code::S_REPLY_BUFFER_TOO_SMALL;
    return 0;
  }
  // else

  const auto& record = *(reinterpret_cast<const Echo_reply*>(util::blob_data(reply)));
  if (record.m_n_replies != 0)
  {
    last_err->clear();
    return record.m_n_replies;
  }
  // else

  if (record.m_sys_errno != 0)
  {
    *last_err = Error_code(int(record.m_sys_errno), system_category());
  }
  else if (record.m_status != uint32_t(error::Ip_status::S_SUCCESS))
  {
    *last_err = Error_code(int(record.m_status), error::ip_status_category());
  }
  else
  {
    *last_err = Error_code(int(error::Ip_status::S_GENERAL_FAILURE), error::ip_status_category());
  }
  return 0;
} // Icmp_handle::parse_replies()

void Icmp_handle::record_no_reply(const util::Blob_mutable& reply, const Error_code& last_err)
{
  if (reply.size() < S_ECHO_REPLY_RESERVED_SIZE)
  {
    return;
  }
  // else

  auto& record = *(reinterpret_cast<Echo_reply*>(util::blob_data(reply)));
  std::memset(&record, 0, sizeof(record));

  if (last_err.category() == boost::system::system_category())
  {
    record.m_sys_errno = uint32_t(last_err.value());
  }
  else if (last_err.category() == error::ip_status_category())
  {
    record.m_status = uint32_t(last_err.value());
  }
  else
  {
    record.m_status = uint32_t(error::Ip_status::S_GENERAL_FAILURE);
  }
} // Icmp_handle::record_no_reply()

void Icmp_handle::record_reply(const util::Blob_mutable& reply, uint32_t status, const util::Fine_time_pt& sent_at,
                               const util::Ip_address& responder, int hop_limit, const util::Blob_const& payload)
{
  using flow::Fine_clock;
  using boost::chrono::duration_cast;
  using boost::chrono::milliseconds;
  using std::memcpy;

  if (reply.size() < S_ECHO_REPLY_RESERVED_SIZE)
  {
    return;
  }
  // else

  auto& record = *(reinterpret_cast<Echo_reply*>(util::blob_data(reply)));
  std::memset(&record, 0, sizeof(record));

  const size_t data_size = std::min(payload.size(), reply.size() - S_ECHO_REPLY_RESERVED_SIZE);
  if (data_size != 0)
  {
    memcpy(util::blob_data(reply) + S_ECHO_REPLY_RESERVED_SIZE, payload.data(), data_size);
  }

  record.m_n_replies = 1;
  record.m_status = status;
  record.m_round_trip_time_ms = uint32_t(duration_cast<milliseconds>(Fine_clock::now() - sent_at).count());
  record.m_data_size = uint32_t(data_size);
  record.m_hop_limit = uint8_t(std::max(0, std::min(hop_limit, 255)));
  if (responder.is_v4())
  {
    record.m_ip_version = 4;
    const auto bytes = responder.to_v4().to_bytes();
    memcpy(record.m_address, bytes.data(), bytes.size());
  }
  else
  {
    record.m_ip_version = 6;
    const auto bytes = responder.to_v6().to_bytes();
    memcpy(record.m_address, bytes.data(), bytes.size());
  }
} // Icmp_handle::record_reply()

uint32_t Icmp_handle::icmp_error_to_ip_status(Ip_family family, uint8_t type, uint8_t code)
{
  using error::Ip_status;

  Ip_status status = Ip_status::S_GENERAL_FAILURE;
  if (family == Ip_family::S_V4)
  {
    switch (type)
    {
    case ICMP_DEST_UNREACH:
      switch (code)
      {
      case ICMP_NET_UNREACH:
        status = Ip_status::S_DEST_NET_UNREACHABLE;
        break;
      case ICMP_HOST_UNREACH:
        status = Ip_status::S_DEST_HOST_UNREACHABLE;
        break;
      case ICMP_PROT_UNREACH:
        status = Ip_status::S_DEST_PROT_UNREACHABLE;
        break;
      case ICMP_PORT_UNREACH:
        status = Ip_status::S_DEST_PORT_UNREACHABLE;
        break;
      case ICMP_FRAG_NEEDED:
        status = Ip_status::S_PACKET_TOO_BIG;
        break;
      case ICMP_NET_ANO:
      case ICMP_HOST_ANO:
      case ICMP_PKT_FILTERED:
        status = Ip_status::S_DEST_PROHIBITED;
        break;
      default:
        break;
      }
      break;
    case ICMP_TIME_EXCEEDED:
      status = (code == ICMP_EXC_FRAGTIME) ? Ip_status::S_TTL_EXPIRED_REASSEM : Ip_status::S_TTL_EXPIRED_TRANSIT;
      break;
    case ICMP_SOURCE_QUENCH:
      status = Ip_status::S_SOURCE_QUENCH;
      break;
    case ICMP_PARAMETERPROB:
      status = Ip_status::S_PARAM_PROBLEM;
      break;
    default:
      break;
    }
  } // if (family == Ip_family::S_V4)
  else
  {
    switch (type)
    {
    case ICMP6_DST_UNREACH:
      switch (code)
      {
      case ICMP6_DST_UNREACH_NOROUTE:
        status = Ip_status::S_DEST_NET_UNREACHABLE;
        break;
      case ICMP6_DST_UNREACH_ADMIN:
        status = Ip_status::S_DEST_PROHIBITED;
        break;
      case ICMP6_DST_UNREACH_ADDR:
        status = Ip_status::S_DEST_HOST_UNREACHABLE;
        break;
      case ICMP6_DST_UNREACH_NOPORT:
        status = Ip_status::S_DEST_PORT_UNREACHABLE;
        break;
      default:
        break;
      }
      break;
    case ICMP6_PACKET_TOO_BIG:
      status = Ip_status::S_PACKET_TOO_BIG;
      break;
    case ICMP6_TIME_EXCEEDED:
      status = (code == ICMP6_TIME_EXCEED_REASSEMBLY) ? Ip_status::S_TTL_EXPIRED_REASSEM
                                                      : Ip_status::S_TTL_EXPIRED_TRANSIT;
      break;
    case ICMP6_PARAM_PROB:
      status = Ip_status::S_PARAM_PROBLEM;
      break;
    default:
      break;
    }
  } // else if (family == Ip_family::S_V6)

  return uint32_t(status);
} // Icmp_handle::icmp_error_to_ip_status()

std::ostream& operator<<(std::ostream& os, const Icmp_handle& val)
{
  return os << "icmp-" << val.family() << '/'
            << ((val.socket_kind() == Icmp_handle::Socket_kind::S_DATAGRAM) ? "dgram" : "raw")
            << "@" << static_cast<const void*>(&val);
}

} // namespace ping::echo::detail
