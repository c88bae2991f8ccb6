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
*	\file		c_api_test.cpp
*	\brief
*
******************************************************************************/

#include <array>
#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <spdlog/fmt/fmt.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "ECHONETDiscovery.h"
#include "loopback_device.hpp"

using namespace std::literals;

namespace {

std::string last_error() {
	std::array<char, 1024> description{};
	EXPECT_EQ(ECHONETDiscovery_GetLastError(description.data()), ECHONETDiscovery_Success);
	return description.data();
}

} // unnamed namespace

TEST(CApiTest, GetLibVersion) {
	std::array<char, 16> version{};
	ASSERT_EQ(ECHONETDiscovery_GetLibVersion(version.data()), ECHONETDiscovery_Success);
	EXPECT_EQ(std::string(version.data()), ECHONET_DISCOVERY_VERSION_STRING ""s);
}

TEST(CApiTest, NullParameters) {
	EXPECT_EQ(ECHONETDiscovery_GetLibVersion(nullptr), ECHONETDiscovery_InvalidParam);
	EXPECT_NE(last_error().find("invalid argument"s), std::string::npos);
	// last error is cleared once read
	EXPECT_EQ(last_error(), ""s);

	std::array<char, 256> json{};
	EXPECT_EQ(ECHONETDiscovery_Discover(nullptr, json.data(), json.size()), ECHONETDiscovery_InvalidParam);
	EXPECT_EQ(ECHONETDiscovery_Discover("", nullptr, 0), ECHONETDiscovery_InvalidParam);
	EXPECT_EQ(ECHONETDiscovery_GetDefaultBroadcastAddress(nullptr), ECHONETDiscovery_InvalidParam);
}

TEST(CApiTest, GetDefaultBroadcastAddress) {
	std::array<char, 16> address{};
	ASSERT_EQ(ECHONETDiscovery_GetDefaultBroadcastAddress(address.data()), ECHONETDiscovery_Success);
	boost::system::error_code ec;
	boost::asio::ip::make_address_v4(address.data(), ec);
	EXPECT_FALSE(ec);
}

TEST(CApiTest, InvalidUrl) {
	std::array<char, 256> json{};
	EXPECT_EQ(ECHONETDiscovery_Discover("echonet://not-an-address", json.data(), json.size()), ECHONETDiscovery_InvalidParam);
	EXPECT_NE(last_error().find("not-an-address"s), std::string::npos);
	EXPECT_EQ(ECHONETDiscovery_Discover("echonet://127.0.0.1:99999", json.data(), json.size()), ECHONETDiscovery_InvalidParam);
}

TEST(CApiTest, DiscoverLoopbackDevice) {
	echonet::test::loopback_device device({0x10, 0x81, 0x00, 0x00});
	device.start(2s);

	const auto url = fmt::format("echonet://127.0.0.1:{}?bind_port=0&duration=500", device.port());
	std::array<char, 1024> json{};
	ASSERT_EQ(ECHONETDiscovery_Discover(url.c_str(), json.data(), json.size()), ECHONETDiscovery_Success);
	device.join();

	const auto res = nlohmann::json::parse(json.data());
	ASSERT_TRUE(res.is_array());
	ASSERT_EQ(res.size(), 1u);
	EXPECT_EQ(res[0].at("address").get<std::string>(), "127.0.0.1"s);
	EXPECT_EQ(res[0].at("port").get<unsigned int>(), device.port());
	EXPECT_EQ(res[0].at("payload").get<std::string>(), "10810000"s);
}

TEST(CApiTest, DiscoverBufferTooSmall) {
	echonet::test::loopback_device device({0x10, 0x81, 0x00, 0x00});
	device.start(2s);

	const auto url = fmt::format("127.0.0.1:{}?bind_port=0&duration=300", device.port());
	std::array<char, 8> json{};
	EXPECT_EQ(ECHONETDiscovery_Discover(url.c_str(), json.data(), json.size()), ECHONETDiscovery_GenericError);
	device.join();
}

TEST(CApiTest, DiscoverReceiveErrorWritesJson) {
	// nothing bound on port: the request is answered by ICMP port unreachable
	const auto port = [] {
		boost::asio::io_context io_context;
		const boost::asio::ip::udp::socket s(io_context, boost::asio::ip::udp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
		return s.local_endpoint().port();
	}();

	const auto url = fmt::format("127.0.0.1:{}?bind_port=0&duration=2000&icmp_errors", port);
	std::array<char, 1024> json{};
	json.fill('x');
	ASSERT_EQ(ECHONETDiscovery_Discover(url.c_str(), json.data(), json.size()), ECHONETDiscovery_ReceiveError);

	const auto res = nlohmann::json::parse(json.data());
	EXPECT_EQ(res, nlohmann::json::array());
	EXPECT_NE(last_error().find("receive"s), std::string::npos);
}
