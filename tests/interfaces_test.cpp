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
*	\file		interfaces_test.cpp
*	\brief
*
******************************************************************************/

#include <algorithm>

#include <boost/asio/ip/address_v4.hpp>
#include <gtest/gtest.h>

#include "interfaces.hpp"

namespace interfaces = echonet::lite::interfaces;

TEST(InterfacesTest, BroadcastAddressesAreConsistent) {
	for (const auto& item : interfaces::enum_interfaces()) {
		EXPECT_FALSE(item._name.empty());
		EXPECT_FALSE(item._address.is_loopback());
		// broadcast address has all host bits set, so it cannot be lower than the interface address
		EXPECT_GE(item._broadcast_address.to_uint(), item._address.to_uint());
	}
}

TEST(InterfacesTest, DefaultBroadcastAddress) {
	const auto list = interfaces::enum_interfaces();
	const auto address = interfaces::default_broadcast_address();
	if (list.empty())
		EXPECT_EQ(address, boost::asio::ip::address_v4::broadcast());
	else
		EXPECT_EQ(address, list.front()._broadcast_address);
}

TEST(InterfacesTest, LocalAddressesIncludeLoopbackAndInterfaces) {
	const auto local = interfaces::local_addresses();
	ASSERT_FALSE(local.empty());
	EXPECT_EQ(local.front(), boost::asio::ip::address_v4::loopback());
	for (const auto& item : interfaces::enum_interfaces())
		EXPECT_NE(std::find(local.cbegin(), local.cend(), item._address), local.cend());
}
