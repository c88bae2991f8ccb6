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
*	\file		ECHONETDiscovery.cpp
*	\brief
*
******************************************************************************/

#include "ECHONETDiscovery.h"

#include <boost/config.hpp>

#include "cpp-utility/is_in.hpp"
#include "cpp-utility/string.hpp"
#include "api.hpp"
#include "last_error.hpp"
#include "lib_definitions.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"

namespace lib = echonet::lite;

int ECHONET_DISCOVERY_API ECHONETDiscovery_GetLibVersion(char version[16]) try {
	if (BOOST_UNLIKELY(echonet::is_in(nullptr, version)))
		throw lib::ex::invalid_argument("null");
	const auto res = lib::get_lib_version();
	echonet::string::string_to_pointer_safe(version, res, lib::max_size::str::version);
	return ::ECHONETDiscovery_Success;
}
catch (...) {
	return handle_exception();
}

int ECHONET_DISCOVERY_API ECHONETDiscovery_GetLastError(char description[1024]) try {
	if (BOOST_UNLIKELY(echonet::is_in(nullptr, description)))
		throw lib::ex::invalid_argument("null");
	auto& res = lib::last_error::instance();
	echonet::string::string_to_pointer_safe(description, res, lib::max_size::str::last_error_description);
	res.clear();
	return ::ECHONETDiscovery_Success;
}
catch (...) {
	return handle_exception();
}

int ECHONET_DISCOVERY_API ECHONETDiscovery_GetDefaultBroadcastAddress(char address[16]) try {
	if (BOOST_UNLIKELY(echonet::is_in(nullptr, address)))
		throw lib::ex::invalid_argument("null");
	const auto res = lib::get_default_broadcast_address();
	echonet::string::string_to_pointer_safe(address, res, lib::max_size::str::address);
	return ::ECHONETDiscovery_Success;
}
catch (...) {
	return handle_exception();
}

int ECHONET_DISCOVERY_API ECHONETDiscovery_Discover(const char* url, char* jsonString, size_t size) try {
	if (BOOST_UNLIKELY(echonet::is_in(nullptr, url, jsonString)))
		throw lib::ex::invalid_argument("null");
	const auto url_str = echonet::string::pointer_to_string_safe(url, lib::max_size::str::url);
	if (BOOST_UNLIKELY(url_str.empty() && url[0] != '\0'))
		throw lib::ex::invalid_argument("url not terminated or with non printable characters");
	const auto res = lib::discover(url_str);
	echonet::string::string_to_pointer_safe(jsonString, res._json, size);
	// partial results are returned anyway
	if (res._error)
		throw *res._error;
	return ::ECHONETDiscovery_Success;
}
catch (...) {
	return handle_exception();
}

namespace {
// perform here any library initialization.
void init_library() {
	// important: functions here should not create threads (i.e. async_log not supported)
	lib::library_logger::init();
}
[[gnu::constructor]] void gnu_lib_constructor() {
	init_library();
}
} // unnamed namespace
