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
*	\file		discovery.cpp
*	\brief
*
******************************************************************************/

#include "discovery.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/scope_exit.hpp"
#include "interfaces.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace echonet {

namespace lite {

collect_result discover(const discovery_config& config) {
	session s(config._log_level);
	return discover(s, config);
}

collect_result discover(session& s, const discovery_config& config) {

	const scope_exit closer([&s] { s.close(); });

	const auto logger = library_logger::create_logger("discovery"s, config._log_level);

	const auto target = config._broadcast_address ? *config._broadcast_address : interfaces::default_broadcast_address();
	const auto bind_port = config._bind_port.value_or(config._port);

	logger->info("discovery on {}:{} for {} ms", target.to_string(), config._port, config._collection_duration.count());

	s.open(bind_port, config._icmp_errors);
	s.broadcast(frame::build_instance_list_request(), target, config._port);
	auto res = s.collect(config._collection_duration);

	switch (res._status) {
	case collect_status::completed:
		logger->info("discovery completed: {} responses", res._responses.size());
		break;
	case collect_status::cancelled:
		logger->info("discovery cancelled: {} responses", res._responses.size());
		break;
	case collect_status::aborted:
		logger->warn("discovery aborted: {} responses", res._responses.size());
		break;
	}

	return res;
}

std::string to_hex(const frame::bytes& payload) {
	std::string res;
	res.reserve(payload.size() * 2);
	boost::algorithm::hex_lower(payload.cbegin(), payload.cend(), std::back_inserter(res));
	return res;
}

nlohmann::json to_json(const std::vector<response>& responses) {
	auto res = nlohmann::json::array();
	for (const auto& r : responses) {
		res.push_back({
			{ "address"s, r._sender.address().to_string() },
			{ "port"s, r._sender.port() },
			{ "payload"s, to_hex(r._payload) },
		});
	}
	return res;
}

} // namespace lite

} // namespace echonet
