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
*	\file		main.cpp
*	\brief
*
******************************************************************************/

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/fmt/fmt.h>

#include <config.hpp>
#include <cpp-utility/scope_exit.hpp>
#include <discovery.hpp>
#include <session.hpp>

namespace lite = echonet::lite;

int main(int argc, char* argv[]) try {

	if (argc > 2) {
		fmt::print(stderr, "usage: {} [echonet://[address][:port][?duration=MS&bind_port=N&log_level=LEVEL]]\n", argv[0]);
		return EXIT_FAILURE;
	}

	const auto config = lite::parse_url((argc == 2) ? argv[1] : std::string{});

	lite::session s(config._log_level);

	// SIGINT and SIGTERM stop the collection, keeping the responses received so far
	boost::asio::io_context signal_context;
	boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
	signals.async_wait([&s](const boost::system::error_code& ec, int) {
		if (!ec)
			s.cancel();
	});
	std::thread signal_thread([&signal_context] { signal_context.run(); });

	const echonet::scope_exit join_signal_thread([&] {
		signal_context.stop();
		signal_thread.join();
	});

	const auto res = lite::discover(s, config);

	for (const auto& r : res._responses)
		fmt::print("{}:{} {}\n", r._sender.address().to_string(), r._sender.port(), lite::to_hex(r._payload));

	switch (res._status) {
	case lite::collect_status::completed:
		break;
	case lite::collect_status::cancelled:
		fmt::print(stderr, "interrupted\n");
		break;
	case lite::collect_status::aborted:
		fmt::print(stderr, "collection aborted: {}\n", res._error->what());
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
catch (const std::exception& ex) {
	fmt::print(stderr, "error: {}\n", ex.what());
	return EXIT_FAILURE;
}
