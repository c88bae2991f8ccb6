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
*	\file		session.cpp
*	\brief
*
******************************************************************************/

#include "session.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/assert.hpp>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/scope_exit.hpp"
#include "cpp-utility/socket_option.hpp"
#include "interfaces.hpp"
#include "lib_definitions.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace echonet {

namespace lite {

namespace {

constexpr const char* state_name(session_state state) noexcept {
	switch (state) {
	case session_state::unopened:	return "unopened";
	case session_state::open:		return "open";
	case session_state::closed:		return "closed";
	}
	return "unknown";
}

} // unnamed namespace

struct session::session_impl {

	session_impl(const std::optional<spdlog::level::level_enum>& log_level)
	: _logger{library_logger::create_logger("session"s, log_level)}
	, _io_context{}
	, _socket(_io_context)
	, _state{session_state::unopened}
	, _cancelled{false}
	, _local_port{}
	, _local_addresses{}
	, _buffer{} {
	}

	~session_impl() {
		close();
	}

	void open(std::uint16_t port, bool icmp_errors) {

		check_state(session_state::unopened, "open"sv);

		const boost::asio::ip::udp::endpoint local_ep(boost::asio::ip::address_v4::any(), port);

		// release the socket on failure: the session stays unopened
		scope_exit socket_closer([this] {
			boost::system::error_code ec;
			_socket.close(ec);
		});

		boost::system::error_code ec;

		_socket.open(local_ep.protocol(), ec);
		if (ec)
			throw_bind_error("socket open", local_ep, ec);

		_socket.set_option(boost::asio::socket_base::reuse_address(true), ec);
		if (ec)
			throw_bind_error("set reuse_address", local_ep, ec);

		_socket.set_option(boost::asio::socket_base::broadcast(true), ec);
		if (ec)
			throw_bind_error("set broadcast", local_ep, ec);

		if (icmp_errors) {
			_socket.set_option(socket_option::recv_error(true), ec);
			if (ec)
				throw_bind_error("set recv_error", local_ep, ec);
		}

		_socket.bind(local_ep, ec);
		if (ec)
			throw_bind_error("bind", local_ep, ec);

		const auto bound_ep = _socket.local_endpoint(ec);
		if (ec)
			throw_bind_error("local_endpoint", local_ep, ec);

		socket_closer.release();

		_local_port = bound_ep.port();
		fill_local_addresses();

		_state = session_state::open;

		_logger->info("session opened on port {}", _local_port);
	}

	void broadcast(const frame::bytes& frame, const boost::asio::ip::address_v4& target, std::uint16_t port) {

		check_state(session_state::open, "broadcast"sv);

		const boost::asio::ip::udp::endpoint target_ep(target, port);

		boost::system::error_code ec;
		const auto sent = _socket.send_to(boost::asio::buffer(frame), target_ep, 0, ec);
		if (ec) {
			const auto msg = fmt::format("send to {}:{} failed: {}", target.to_string(), port, ec.message());
			_logger->warn(msg);
			throw ex::send_error(msg);
		}

		BOOST_ASSERT_MSG(sent == frame.size(), "datagram sent partially");

		SPDLOG_LOGGER_DEBUG(_logger, "sent {} bytes to {}:{}", sent, target.to_string(), port);
	}

	collect_result collect(std::chrono::milliseconds duration) {

		check_state(session_state::open, "collect"sv);

		collect_result res{{}, collect_status::completed, std::nullopt};

		const auto deadline = std::chrono::steady_clock::now() + duration;

		_logger->debug("collecting for {} ms", duration.count());

		for (;;) {

			if (_cancelled) {
				res._status = collect_status::cancelled;
				break;
			}

			const auto remaining = deadline - std::chrono::steady_clock::now();
			if (remaining <= std::chrono::steady_clock::duration::zero())
				break;

			boost::system::error_code ec;
			std::size_t size{};
			boost::asio::ip::udp::endpoint sender;

			_socket.async_receive_from(boost::asio::buffer(_buffer), sender, [&ec, &size](const boost::system::error_code& new_ec, std::size_t s) {
				ec = new_ec;
				size = s;
			});

			run_context_for(remaining, [this] {
				// cancel the outstanding asynchronous operation
				boost::system::error_code cancel_ec;
				_socket.cancel(cancel_ec);

				// run the io_context again until the operation completes: this will set ec to operation_aborted
				_io_context.run();
			});

			if (!ec || ec == boost::asio::error::message_size) {
				if (is_self(sender)) {
					SPDLOG_LOGGER_TRACE(_logger, "discarded looped back datagram from {}:{}", sender.address().to_string(), sender.port());
					continue;
				}
				if (ec)
					_logger->warn("datagram from {}:{} clipped to {} bytes", sender.address().to_string(), sender.port(), size);
				const auto first = _buffer.cbegin();
				res._responses.push_back({sender, frame::bytes(first, first + std::min(size, _buffer.size()))});
				SPDLOG_LOGGER_DEBUG(_logger, "received {} bytes from {}:{}", size, sender.address().to_string(), sender.port());
				continue;
			}

			if (ec == boost::asio::error::operation_aborted) {
				// either deadline expired or cancel() invoked
				if (_cancelled)
					res._status = collect_status::cancelled;
				break;
			}

			boost::system::error_code local_ec;
			const auto msg = fmt::format("receive on port {} failed: {}", _socket.local_endpoint(local_ec).port(), ec.message());
			_logger->warn(msg);
			res._status = collect_status::aborted;
			res._error.emplace(msg);
			break;
		}

		_logger->info("collected {} responses", res._responses.size());

		return res;
	}

	void cancel() {
		_cancelled = true;
		boost::asio::post(_io_context, [this] {
			boost::system::error_code ec;
			_socket.cancel(ec);
		});
	}

	void close() noexcept {

		if (_state == session_state::closed)
			return;

		if (_socket.is_open()) {
			boost::system::error_code ec;
			_socket.close(ec);
			if (ec)
				_logger->warn("socket close failed: {}", ec.message());
		}

		_state = session_state::closed;

		_logger->info("session closed");
	}

	boost::asio::ip::udp::endpoint local_endpoint() const {
		check_state(session_state::open, "local_endpoint"sv);
		boost::system::error_code ec;
		auto ep = _socket.local_endpoint(ec);
		if (ec)
			throw ex::runtime_error(fmt::format("local_endpoint failed: {}", ec.message()));
		return ep;
	}

	session_state get_state() const noexcept {
		return _state;
	}

	boost::asio::ip::udp::socket::native_handle_type native_handle() {
		check_state(session_state::open, "native_handle"sv);
		return _socket.native_handle();
	}

private:

	template <typename Duration, typename Callable>
	void run_context_for(Duration&& timeout, Callable stopped_callback) {

		_io_context.restart();

		/*
		 * Block until the asynchronous operation has completed, or timed out.
		 * If the operation completed the io_context is stopped due to running
		 * out of work, otherwise run_for has timed out.
		 */
		_io_context.run_for(std::forward<Duration>(timeout));

		if (!_io_context.stopped())
			stopped_callback();

	}

	void fill_local_addresses() {
		try {
			_local_addresses = interfaces::local_addresses();
		}
		catch (const ex::runtime_error& e) {
			_logger->warn("interface enumeration failed, only loopback treated as local: {}", e.what());
			_local_addresses = {boost::asio::ip::address_v4::loopback()};
		}
	}

	// datagram sent by this session
	bool is_self(const boost::asio::ip::udp::endpoint& sender) const {
		if (sender.port() != _local_port || !sender.address().is_v4())
			return false;
		const auto& a = _local_addresses;
		return std::find(a.cbegin(), a.cend(), sender.address().to_v4()) != a.cend();
	}

	void check_state(session_state expected, std::string_view operation) const {
		if (_state != expected)
			throw ex::invalid_state(fmt::format("{} not allowed on {} session", operation, state_name(_state)));
	}

	[[noreturn]] void throw_bind_error(std::string_view step, const boost::asio::ip::udp::endpoint& ep, const boost::system::error_code& ec) {
		const auto msg = fmt::format("{} failed on {}:{}: {}", step, ep.address().to_string(), ep.port(), ec.message());
		_logger->warn(msg);
		throw ex::bind_error(msg);
	}

	std::shared_ptr<spdlog::logger> _logger;
	boost::asio::io_context _io_context;
	boost::asio::ip::udp::socket _socket;
	session_state _state;
	std::atomic<bool> _cancelled;
	std::uint16_t _local_port;
	std::vector<boost::asio::ip::address_v4> _local_addresses;
	std::array<std::uint8_t, max_size::datagram> _buffer;
};

session::session()
: session(std::nullopt) {
}

session::session(const std::optional<spdlog::level::level_enum>& log_level)
: _pimpl{std::make_unique<session_impl>(log_level)} {
}

session::~session() = default;

void session::open(std::uint16_t port, bool icmp_errors) {
	_pimpl->open(port, icmp_errors);
}

void session::broadcast(const frame::bytes& frame, const boost::asio::ip::address_v4& target, std::uint16_t port) {
	_pimpl->broadcast(frame, target, port);
}

collect_result session::collect(std::chrono::milliseconds duration) {
	return _pimpl->collect(duration);
}

void session::cancel() {
	_pimpl->cancel();
}

void session::close() noexcept {
	_pimpl->close();
}

boost::asio::ip::udp::endpoint session::local_endpoint() const {
	return _pimpl->local_endpoint();
}

session_state session::get_state() const noexcept {
	return _pimpl->get_state();
}

boost::asio::ip::udp::socket::native_handle_type session::native_handle() {
	return _pimpl->native_handle();
}

} // namespace lite

} // namespace echonet
