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
*	\file		frame_test.cpp
*	\brief
*
******************************************************************************/

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

#include "frame.hpp"
#include "lib_error.hpp"

namespace frame = echonet::lite::frame;
namespace ex = echonet::lite::ex;

TEST(FrameTest, InstanceListRequestBytes) {
	const frame::bytes expected{
		0x10, 0x81,				// EHD1, EHD2
		0x00, 0x00,				// TID
		0x0e, 0xf0, 0x01,		// SEOJ
		0x0e, 0xf0, 0x01,		// DEOJ
		0x62,					// ESV
		0x01,					// OPC
		0xd6, 0x00,				// EPC, PDC
	};
	const auto res = frame::build_instance_list_request();
	ASSERT_EQ(res.size(), 14u);
	EXPECT_EQ(res, expected);
}

TEST(FrameTest, InstanceListRequestIsDeterministic) {
	EXPECT_EQ(frame::build_instance_list_request(), frame::build_instance_list_request());
}

TEST(FrameTest, SerializeMultipleProperties) {
	const frame::request req{
		0x1234,
		frame::node_profile,
		frame::eoj{0x01, 0x30, 0x02},
		frame::esv::get,
		{
			frame::property{0x80, {}},
			frame::property{0x9f, {0xaa, 0xbb}},
		},
	};
	const frame::bytes expected{
		0x10, 0x81,
		0x12, 0x34,
		0x0e, 0xf0, 0x01,
		0x01, 0x30, 0x02,
		0x62,
		0x02,
		0x80, 0x00,
		0x9f, 0x02, 0xaa, 0xbb,
	};
	EXPECT_EQ(frame::serialize(req), expected);
}

TEST(FrameTest, SerializeTooManyProperties) {
	frame::request req{0, frame::node_profile, frame::node_profile, frame::esv::get, {}};
	req._properties.resize(256, frame::property{0x80, {}});
	EXPECT_THROW(frame::serialize(req), ex::invalid_argument);
	req._properties.resize(255);
	EXPECT_EQ(frame::serialize(req).size(), 12u + 2u * 255u);
}

TEST(FrameTest, SerializeTooLongEdt) {
	const frame::request req{0, frame::node_profile, frame::node_profile, frame::esv::get, {
		frame::property{0x80, frame::bytes(256, 0x00)},
	}};
	EXPECT_THROW(frame::serialize(req), ex::invalid_argument);
}

TEST(FrameTest, EojComparison) {
	EXPECT_EQ(frame::node_profile, (frame::eoj{0x0e, 0xf0, 0x01}));
	EXPECT_NE(frame::node_profile, (frame::eoj{0x0e, 0xf0, 0x02}));
}
