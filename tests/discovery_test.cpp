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
*	\file		discovery_test.cpp
*	\brief
*
******************************************************************************/

#include <chrono>
#include <string>

#include <boost/asio/ip/address_v4.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "discovery.hpp"
#include "frame.hpp"
#include "session.hpp"
#include "loopback_device.hpp"

namespace lite = echonet::lite;

using namespace std::literals;

namespace {

lite::discovery_config loopback_config(std::uint16_t port) {
	lite::discovery_config config;
	config._broadcast_address = boost::asio::ip::address_v4::loopback();
	config._port = port;
	config._bind_port = 0;
	config._collection_duration = 500ms;
	return config;
}

std::uint16_t unused_port() {
	lite::session s;
	s.open(0);
	const auto port = s.local_endpoint().port();
	s.close();
	return port;
}

} // unnamed namespace

TEST(DiscoveryTest, ToHex) {
	EXPECT_EQ(lite::to_hex({}), ""s);
	EXPECT_EQ(lite::to_hex({0x10, 0x81, 0x00, 0xd6, 0xff}), "108100d6ff"s);
}

TEST(DiscoveryTest, ToJson) {
	const std::vector<lite::response> responses{
		{ { boost::asio::ip::make_address_v4("192.168.1.12"), 3610 }, { 0x10, 0x81 } },
		{ { boost::asio::ip::make_address_v4("192.168.1.13"), 3610 }, { } },
	};
	const auto expected = R"([
		{ "address": "192.168.1.12", "port": 3610, "payload": "1081" },
		{ "address": "192.168.1.13", "port": 3610, "payload": "" }
	])"_json;
	EXPECT_EQ(lite::to_json(responses), expected);
	EXPECT_EQ(lite::to_json({}), nlohmann::json::array());
}

TEST(DiscoveryTest, DiscoverLoopbackDevice) {
	const lite::frame::bytes reply{0x10, 0x81, 0x00, 0x00, 0x0e, 0xf0, 0x01, 0x0e, 0xf0, 0x01, 0x72, 0x01, 0xd6, 0x04, 0x01, 0x01, 0x30, 0x01};
	echonet::test::loopback_device device(reply);
	device.start(2s);

	const auto res = lite::discover(loopback_config(device.port()));
	device.join();

	EXPECT_EQ(device.request(), lite::frame::build_instance_list_request());
	EXPECT_EQ(res._status, lite::collect_status::completed);
	ASSERT_EQ(res._responses.size(), 1u);
	EXPECT_EQ(res._responses[0]._sender.address().to_string(), "127.0.0.1"s);
	EXPECT_EQ(res._responses[0]._sender.port(), device.port());
	EXPECT_EQ(res._responses[0]._payload, reply);
}

TEST(DiscoveryTest, DiscoverOnCallerSessionClosesIt) {
	echonet::test::loopback_device device({0x10, 0x81});
	device.start(2s);

	lite::session s;
	const auto res = lite::discover(s, loopback_config(device.port()));
	device.join();

	EXPECT_EQ(s.get_state(), lite::session_state::closed);
	ASSERT_EQ(res._responses.size(), 1u);
}

TEST(DiscoveryTest, DiscoverNoDevice) {
	auto config = loopback_config(unused_port());
	config._collection_duration = 200ms;
	const auto res = lite::discover(config);
	EXPECT_EQ(res._status, lite::collect_status::completed);
	EXPECT_TRUE(res._responses.empty());
}

TEST(DiscoveryTest, DiscoverBindsDestinationPortByDefault) {
	const auto port = unused_port();
	const auto device_address = boost::asio::ip::make_address_v4("127.0.0.2");
	echonet::test::loopback_device device({0x10, 0x81, 0x00, 0x04}, device_address, port);
	device.start(2s);

	lite::discovery_config config;
	config._broadcast_address = device_address;
	config._port = port;
	config._collection_duration = 500ms;
	ASSERT_FALSE(config._bind_port);

	const auto res = lite::discover(config);
	device.join();

	EXPECT_EQ(device.request(), lite::frame::build_instance_list_request());
	EXPECT_EQ(res._status, lite::collect_status::completed);
	ASSERT_EQ(res._responses.size(), 1u);
	EXPECT_EQ(res._responses[0]._sender.address(), device_address);
	EXPECT_EQ(res._responses[0]._sender.port(), port);
	EXPECT_EQ(res._responses[0]._payload, (lite::frame::bytes{0x10, 0x81, 0x00, 0x04}));
}

TEST(DiscoveryTest, DiscoverOwnRequestNotCollected) {
	auto config = loopback_config(unused_port());
	config._bind_port.reset();
	config._collection_duration = 300ms;

	const auto res = lite::discover(config);
	EXPECT_EQ(res._status, lite::collect_status::completed);
	EXPECT_TRUE(res._responses.empty());
	EXPECT_FALSE(res._error);
}

TEST(DiscoveryTest, DiscoverReportsIcmpError) {
	auto config = loopback_config(unused_port());
	config._collection_duration = 2s;
	config._icmp_errors = true;

	const auto res = lite::discover(config);
	EXPECT_EQ(res._status, lite::collect_status::aborted);
	ASSERT_TRUE(res._error);
	EXPECT_TRUE(res._responses.empty());
}
