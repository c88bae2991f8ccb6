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
*	\file		api.cpp
*	\brief
*
******************************************************************************/

#include "api.hpp"

#include <string_view>
#include <utility>

#include <boost/static_assert.hpp>

#include "ECHONETDiscovery.h"
#include "config.hpp"
#include "discovery.hpp"
#include "interfaces.hpp"
#include "lib_definitions.hpp"

using namespace std::literals;

namespace echonet {

namespace lite {

constexpr auto version_string = ECHONET_DISCOVERY_VERSION_STRING ""sv;
BOOST_STATIC_ASSERT(version_string.size() < max_size::str::version); // equal is not fine due to null terminator character

std::string get_lib_version() {
	return std::string(version_string);
}

std::string get_default_broadcast_address() {
	return interfaces::default_broadcast_address().to_string();
}

discovery_report discover(const std::string& url) {
	const auto config = parse_url(url);
	auto res = discover(config);
	return { to_json(res._responses).dump(), std::move(res._error) };
}

} // namespace lite

} // namespace echonet
