/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the ECHONET Lite Discovery Library.
*
*	The ECHONET Lite Discovery Library is free software; you can redistribute
*	it and/or modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The ECHONET Lite Discovery Library is distributed in the hope that it will
*	be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the ECHONET Lite Discovery Library; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		session.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_SESSION_HPP_
#define ECHONET_INCLUDE_SESSION_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/core/noncopyable.hpp>

#include <spdlog/spdlog.h>

#include "frame.hpp"
#include "lib_error.hpp"

namespace echonet {

namespace lite {

/**
 * @brief A datagram received during collection, unparsed.
 */
struct response {
	boost::asio::ip::udp::endpoint _sender;
	frame::bytes _payload;
};

enum struct collect_status {
	completed,		//!< deadline reached
	cancelled,		//!< session::cancel() invoked
	aborted,		//!< transport error, see collect_result::_error
};

struct collect_result {
	std::vector<response> _responses;				//!< in arrival order
	collect_status _status;
	std::optional<ex::receive_error> _error;		//!< set only if _status is aborted
};

enum struct session_state {
	unopened,
	open,
	closed,
};

/**
 * @brief UDP broadcast session: open, broadcast, collect, close.
 *
 * All the functions must be called from the same thread, except cancel().
 */
struct session : private boost::noncopyable {

	session();

	/**
	 * @param log_level	optional level for the session logger, overriding SPDLOG_LEVEL
	 */
	explicit session(const std::optional<spdlog::level::level_enum>& log_level);

	~session();

	/**
	 * @brief Create a broadcast capable UDP/IPv4 socket bound to the wildcard address.
	 * @param port			the local port, 0 for an ephemeral port
	 * @param icmp_errors	if true, ICMP errors received for the sent datagrams (port or host
	 * 						unreachable) terminate collect() as receive errors
	 * @throw ex::invalid_state if not unopened
	 * @throw ex::bind_error if socket creation, options or bind fail
	 */
	void open(std::uint16_t port, bool icmp_errors = false);

	/**
	 * @brief Send a single datagram.
	 * @throw ex::invalid_state if not open
	 * @throw ex::send_error if the transmission fails
	 */
	void broadcast(const frame::bytes& frame, const boost::asio::ip::address_v4& target, std::uint16_t port);

	/**
	 * @brief Receive datagrams until @p duration has elapsed.
	 *
	 * Expiry of the deadline is the normal termination. Datagrams sent by this
	 * session and looped back (sender port equal to the local port and sender
	 * address assigned to this host) are discarded. Datagrams larger than
	 * max_size::datagram are stored clipped. A receive failure terminates the
	 * collection with status aborted, keeping the responses received so far.
	 * @throw ex::invalid_state if not open
	 */
	collect_result collect(std::chrono::milliseconds duration);

	/**
	 * @brief Stop an in-progress collect(). Can be called from any thread.
	 *
	 * Sticky: every subsequent collect() returns immediately with status cancelled.
	 */
	void cancel();

	void close() noexcept;

	/**
	 * @throw ex::invalid_state if not open
	 */
	boost::asio::ip::udp::endpoint local_endpoint() const;

	session_state get_state() const noexcept;

	/**
	 * @brief The underlying socket descriptor, for system calls not covered by this class.
	 * @throw ex::invalid_state if not open
	 */
	boost::asio::ip::udp::socket::native_handle_type native_handle();

private:

	struct session_impl; // forward declaration
	std::unique_ptr<session_impl> _pimpl;

};

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_SESSION_HPP_ */
