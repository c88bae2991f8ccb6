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
*	\file		frame.cpp
*	\brief
*
******************************************************************************/

#include "frame.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/serdes.hpp"
#include "lib_error.hpp"

namespace echonet {

namespace lite {

namespace frame {

namespace {

constexpr std::size_t header_size{1 + 1 + 2 + eoj::size() + eoj::size() + 1 + 1};		// up to OPC
constexpr std::size_t property_header_size{1 + 1};										// EPC and PDC
constexpr std::size_t max_count{std::numeric_limits<std::uint8_t>::max()};

template <typename It>
void serialize_eoj(It& it, const eoj& obj) noexcept {
	echonet::serialize(it, obj._class_group_code);
	echonet::serialize(it, obj._class_code);
	echonet::serialize(it, obj._instance_code);
}

} // unnamed namespace

bytes serialize(const request& req) {

	if (req._properties.size() > max_count)
		throw ex::invalid_argument(fmt::format("too many properties: {}", req._properties.size()));

	std::size_t size{header_size};
	for (const auto& p : req._properties) {
		if (p._edt.size() > max_count)
			throw ex::invalid_argument(fmt::format("EDT too long for EPC {:#04x}: {} bytes", p._epc, p._edt.size()));
		size += property_header_size + p._edt.size();
	}

	bytes res(size);
	auto it = res.begin();

	echonet::serialize(it, ehd1);
	echonet::serialize(it, ehd2_format1);
	echonet::serialize(it, req._tid);
	serialize_eoj(it, req._seoj);
	serialize_eoj(it, req._deoj);
	echonet::serialize(it, req._esv);
	echonet::serialize(it, static_cast<std::uint8_t>(req._properties.size()));
	for (const auto& p : req._properties) {
		echonet::serialize(it, p._epc);
		echonet::serialize(it, static_cast<std::uint8_t>(p._edt.size()));
		it = std::copy(p._edt.begin(), p._edt.end(), it);
	}

	BOOST_ASSERT_MSG(it == res.end(), "inconsistent frame encoding");

	return res;
}

bytes build_instance_list_request() {
	const request req{
		0x0000,
		node_profile,
		node_profile,
		esv::get,
		{ property{ epc::self_node_instance_list_s, {} } },
	};
	return serialize(req);
}

} // namespace frame

} // namespace lite

} // namespace echonet
