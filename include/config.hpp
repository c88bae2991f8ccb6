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
*	\file		config.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CONFIG_HPP_
#define ECHONET_INCLUDE_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio/ip/address_v4.hpp>
#include <spdlog/spdlog.h>

#include "lib_definitions.hpp"

namespace echonet {

namespace lite {

struct discovery_config {
	std::optional<boost::asio::ip::address_v4> _broadcast_address;		//!< default: interfaces::default_broadcast_address()
	std::uint16_t _port{defaults::port};
	std::optional<std::uint16_t> _bind_port;							//!< default: _port
	std::chrono::milliseconds _collection_duration{defaults::collection_duration};
	std::optional<spdlog::level::level_enum> _log_level;
	bool _icmp_errors{false};											//!< see session::open()
};

/**
 * @brief Parse a discovery URL.
 *
 * Format is `echonet://[address][:port][?duration=MS&bind_port=N&log_level=LEVEL&icmp_errors]`,
 * the scheme is optional. Unknown query keys are ignored.
 * @param url	the URL
 * @return the configuration
 * @throw ex::invalid_argument on malformed URL or values
 */
discovery_config parse_url(const std::string& url);

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_CONFIG_HPP_ */
