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
*	\file		library_logger.cpp
*	\brief
*
******************************************************************************/

#include "library_logger.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/config.hpp>
#include <boost/static_assert.hpp>
#include <boost/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>

#include "ECHONETDiscovery.h"

using namespace std::literals;

namespace echonet {

namespace lite {

namespace library_logger {

namespace {

void log_library_versions() {

	auto int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 10000), (v / 100) % 100, v % 100 }; };
	auto boost_int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 100000), (v / 100) % 1000, v % 100 }; };

	static constexpr auto echonet_discovery_version = ECHONET_DISCOVERY_VERSION_STRING ""sv;
	static constexpr auto compiler_version = BOOST_COMPILER ""sv;
	static constexpr auto platform_name = BOOST_PLATFORM ""sv;
	static constexpr auto stdlib_version = BOOST_STDLIB ""sv;
	static constexpr auto json_version = { NLOHMANN_JSON_VERSION_MAJOR, NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH };
	static constexpr auto spdlog_version = { SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH };
	static constexpr auto fmt_version = FMT_VERSION;
	static constexpr auto boost_version = BOOST_VERSION;

	spdlog::info("built on {} {}", __DATE__, __TIME__);
	spdlog::info("compiled with {} on {}", compiler_version, platform_name);
	spdlog::info("stdlib version: {}", stdlib_version);
	spdlog::info("echonet-discovery version: {}", echonet_discovery_version);
	spdlog::info("JSON for Modern C++ version: {}", fmt::join(json_version, "."));
	spdlog::info("spdlog version: {}", fmt::join(spdlog_version, "."));
	spdlog::info("{{fmt}} version: {}", fmt::join(int_to_triplet(fmt_version), "."));
	spdlog::info("Boost version: {}", fmt::join(boost_int_to_triplet(boost_version), "."));

}

// sink singleton
template <typename T, typename... Args>
std::shared_ptr<spdlog::sinks::sink> sink(Args&& ...args) {
	BOOST_STATIC_ASSERT(std::is_base_of<spdlog::sinks::sink, T>::value);
	static auto sink_instance = std::make_shared<T>(std::forward<Args>(args)...);
	return sink_instance;
}

std::shared_ptr<spdlog::sinks::sink> file_sink() {
	using sink_type = spdlog::sinks::basic_file_sink_mt;
	const auto home_env = std::getenv("HOME");
	const auto filename = fmt::format("{}/.echonet/echonet-discovery.log", (home_env != nullptr) ? home_env : ".");
	static constexpr bool truncate{true};
	try {
		return sink<sink_type>(filename, truncate);
	}
	catch (const spdlog::spdlog_ex& ex) {
		// read-only home: logs are discarded, library must stay usable
		spdlog::error("cannot open log file {}: {}", filename, ex.what());
		return sink<spdlog::sinks::null_sink_mt>();
	}
}

} // unnamed namespace

void init() {

	/*
	 * Important notes about logger:
	 * - async loggers are not supported in a dynamic library
	 * - SPDLOG_LOGGER_TRACE and SPDLOG_LOGGER_DEBUG are not even compiled unless macro SPDLOG_ACTIVE_LEVEL is redefined at compile time
	 */

	// registration is required only for name-based global access: every session creates its own logger
	spdlog::set_automatic_registration(false);

	// set a default level to off and then invoke load_env_levels to override the default value using SPDLOG_LEVEL
	spdlog::set_level(spdlog::level::off);
	spdlog::cfg::load_env_levels();

	// flush is always set on active level, since log is for debug only
	spdlog::flush_on(spdlog::get_level());

	// create the default logger with these settings
	spdlog::set_default_logger(create_logger("default"s));

	log_library_versions();
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
	spdlog::sinks_init_list sink_list{
		file_sink(),
	};
	return spdlog::create<spdlog::sinks::dist_sink_mt>(name, std::move(sink_list));
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name, const std::optional<spdlog::level::level_enum>& level) {
	const auto logger = create_logger(name);
	if (level) {
		logger->set_level(*level);
		logger->flush_on(*level);
	}
	return logger;
}

} // namespace library_logger

} // namespace lite

} // namespace echonet
