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
*	\file		config_test.cpp
*	\brief
*
******************************************************************************/

#include <chrono>

#include <gtest/gtest.h>

#include "config.hpp"
#include "lib_definitions.hpp"
#include "lib_error.hpp"

namespace lite = echonet::lite;

using namespace std::literals;

TEST(ConfigTest, EmptyUrlGivesDefaults) {
	const auto config = lite::parse_url(""s);
	EXPECT_FALSE(config._broadcast_address);
	EXPECT_EQ(config._port, 3610);
	EXPECT_FALSE(config._bind_port);
	EXPECT_EQ(config._collection_duration, 5000ms);
	EXPECT_FALSE(config._log_level);
}

TEST(ConfigTest, SchemeOnly) {
	const auto config = lite::parse_url("echonet://"s);
	EXPECT_FALSE(config._broadcast_address);
	EXPECT_EQ(config._port, lite::defaults::port);
}

TEST(ConfigTest, FullUrl) {
	const auto config = lite::parse_url("echonet://192.168.1.255:3611?duration=1500&bind_port=0&log_level=debug"s);
	ASSERT_TRUE(config._broadcast_address);
	EXPECT_EQ(config._broadcast_address->to_string(), "192.168.1.255"s);
	EXPECT_EQ(config._port, 3611);
	ASSERT_TRUE(config._bind_port);
	EXPECT_EQ(*config._bind_port, 0);
	EXPECT_EQ(config._collection_duration, 1500ms);
	ASSERT_TRUE(config._log_level);
	EXPECT_EQ(*config._log_level, spdlog::level::debug);
}

TEST(ConfigTest, IcmpErrorsFlag) {
	EXPECT_FALSE(lite::parse_url("echonet://?duration=10"s)._icmp_errors);
	EXPECT_TRUE(lite::parse_url("echonet://?icmp_errors"s)._icmp_errors);
	EXPECT_TRUE(lite::parse_url("echonet://127.0.0.1:4000?bind_port=0&icmp_errors&duration=10"s)._icmp_errors);
}

TEST(ConfigTest, WithoutScheme) {
	const auto config = lite::parse_url("10.0.0.255?duration=10"s);
	ASSERT_TRUE(config._broadcast_address);
	EXPECT_EQ(config._broadcast_address->to_string(), "10.0.0.255"s);
	EXPECT_EQ(config._port, lite::defaults::port);
	EXPECT_EQ(config._collection_duration, 10ms);
}

TEST(ConfigTest, PortOnly) {
	const auto config = lite::parse_url("echonet://:4000"s);
	EXPECT_FALSE(config._broadcast_address);
	EXPECT_EQ(config._port, 4000);
}

TEST(ConfigTest, UnknownQueryIgnored) {
	const auto config = lite::parse_url("echonet://?foo=bar&duration=20&"s);
	EXPECT_EQ(config._collection_duration, 20ms);
}

TEST(ConfigTest, InvalidValues) {
	EXPECT_THROW(lite::parse_url("echonet://not-an-address"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://::1"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://192.168.1.255:70000"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://192.168.1.255:-1"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://192.168.1.255:abc"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://?duration=-5"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://?duration"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://?bind_port=65536"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("http://192.168.1.255"s), lite::ex::invalid_argument);
	EXPECT_THROW(lite::parse_url("echonet://192.168.1.255/path"s), lite::ex::invalid_argument);
}
