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
*	\file		discovery.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_DISCOVERY_HPP_
#define ECHONET_INCLUDE_DISCOVERY_HPP_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "frame.hpp"
#include "session.hpp"

namespace echonet {

namespace lite {

/**
 * @brief Run a full discovery cycle: open, broadcast the instance list request, collect and close.
 *
 * Receive errors are reported in the result, with the responses received before the error.
 * @param config	the configuration
 * @return the collection result
 * @throw ex::bind_error, ex::send_error
 */
collect_result discover(const discovery_config& config);

/**
 * @brief Same of discover(const discovery_config&) on a caller owned session.
 *
 * The session must be unopened and it is closed on return: other threads can
 * stop the collection with session::cancel().
 */
collect_result discover(session& s, const discovery_config& config);

/**
 * @brief Lowercase hex string, without separators.
 */
std::string to_hex(const frame::bytes& payload);

/**
 * @brief Array of `{ "address", "port", "payload" }` objects, with payload hex encoded.
 */
nlohmann::json to_json(const std::vector<response>& responses);

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_DISCOVERY_HPP_ */
