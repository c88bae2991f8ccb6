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
*	\file		config.cpp
*	\brief
*
******************************************************************************/

#include "config.hpp"

#include <forward_list>
#include <limits>
#include <regex>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/lexical_cast.hpp>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/hash.hpp"
#include "lib_error.hpp"

namespace echonet {

namespace lite {

using namespace std::literals;

namespace {

template <typename T, typename String>
T to_number(const String& str, T min, T max, const char* name) {
	// parse as long long: lexical_cast to unsigned accepts negative numbers
	long long value;
	if (!boost::conversion::try_lexical_convert(str, value) || value < static_cast<long long>(min) || static_cast<long long>(max) < value)
		throw ex::invalid_argument(fmt::format("invalid {}: {}", name, str));
	return static_cast<T>(value);
}

std::uint16_t to_port(const std::string& str, const char* name) {
	return to_number<std::uint16_t>(str, std::numeric_limits<std::uint16_t>::min(), std::numeric_limits<std::uint16_t>::max(), name);
}

const std::string& query_value(const std::vector<std::string>& split_single_query) {
	if (split_single_query.size() != 2)
		throw ex::invalid_argument(fmt::format("query {} requires a value", split_single_query.at(0)));
	return split_single_query[1];
}

} // unnamed namespace

discovery_config parse_url(const std::string& url) {

	discovery_config data;

	// scheme is optional
	const auto url_complete = (url.find("://"s) == std::string::npos) ? fmt::format("echonet://{}", url) : url;
	const auto url_lowercase = boost::to_lower_copy(url_complete);

	/*
	 * Parsing a URI Reference with a Regular Expression
	 * Copied from RFC 3986 at https://www.rfc-editor.org/rfc/rfc3986#page-50
	 */
	std::regex url_regex(R"(^(([^:\/?#]+):)?(//([^\/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)"s, std::regex::extended);
	std::smatch url_match_result;

	if (!std::regex_match(url_lowercase, url_match_result, url_regex))
		throw ex::invalid_argument(fmt::format("invalid URI: {}", url));

	const std::string scheme = url_match_result[2];
	const std::string authority = url_match_result[4];
	const std::string path = url_match_result[5];
	const std::string query = url_match_result[7];

	if (scheme != "echonet"s)
		throw ex::invalid_argument(fmt::format("unsupported scheme: {}", scheme));

	if (!path.empty() && path != "/"s)
		throw ex::invalid_argument(fmt::format("unexpected path: {}", path));

	// authority is [address][:port]
	const auto colon_pos = authority.rfind(':');
	const auto host = authority.substr(0, colon_pos);
	if (colon_pos != std::string::npos)
		data._port = to_port(authority.substr(colon_pos + 1), "port");

	if (!host.empty()) {
		boost::system::error_code ec;
		const auto address = boost::asio::ip::make_address_v4(host, ec);
		if (ec)
			throw ex::invalid_argument(fmt::format("invalid address {}: {}", host, ec.message()));
		data._broadcast_address = address;
	}

	// parse optional query
	if (query.empty())
		return data;

	std::forward_list<std::string> split_query;
	boost::split(split_query, query, boost::is_any_of("&"));
	for (const auto& str : split_query) {
		if (str.empty())
			continue;
		std::vector<std::string> split_single_query;
		boost::split(split_single_query, str, boost::is_any_of("="));
		switch (echonet::hash::generator{}(split_single_query.at(0))) {
			using namespace echonet::hash::literals;
		case "duration"_h: {
			const auto ms = to_number<std::chrono::milliseconds::rep>(query_value(split_single_query), 0, std::numeric_limits<std::int32_t>::max(), "duration");
			data._collection_duration = std::chrono::milliseconds(ms);
			break;
		}
		case "bind_port"_h:
			data._bind_port = to_port(query_value(split_single_query), "bind_port");
			break;
		case "icmp_errors"_h:
			data._icmp_errors = true;
			break;
		case "log_level"_h:
			data._log_level = spdlog::level::from_str(query_value(split_single_query));
			break;
		default:
			break;
		}
	}

	return data;
}

} // namespace lite

} // namespace echonet
