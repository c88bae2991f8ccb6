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
*	\file		frame.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_FRAME_HPP_
#define ECHONET_INCLUDE_FRAME_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace echonet {

namespace lite {

namespace frame {

using bytes = std::vector<std::uint8_t>;

static constexpr std::uint8_t ehd1{0x10};				// ECHONET Lite
static constexpr std::uint8_t ehd2_format1{0x81};		// specified message format

/**
 * @brief ECHONET object code (class group code, class code, instance code).
 */
struct eoj {
	std::uint8_t _class_group_code;
	std::uint8_t _class_code;
	std::uint8_t _instance_code;

	static constexpr std::size_t size() noexcept { return 3; }
};

constexpr bool operator==(const eoj& lhs, const eoj& rhs) noexcept {
	return lhs._class_group_code == rhs._class_group_code
		&& lhs._class_code == rhs._class_code
		&& lhs._instance_code == rhs._instance_code;
}

constexpr bool operator!=(const eoj& lhs, const eoj& rhs) noexcept {
	return !(lhs == rhs);
}

static constexpr eoj node_profile{0x0e, 0xf0, 0x01};

enum struct esv : std::uint8_t {
	get = 0x62,
};

namespace epc {

static constexpr std::uint8_t self_node_instance_list_s{0xd6};

} // namespace epc

struct property {
	std::uint8_t _epc;
	bytes _edt;
};

/**
 * @brief A request in ECHONET Lite format 1.
 */
struct request {
	std::uint16_t _tid;
	eoj _seoj;
	eoj _deoj;
	esv _esv;
	std::vector<property> _properties;
};

/**
 * @brief Encode a format 1 request.
 *
 * Layout: EHD1, EHD2, TID, SEOJ, DEOJ, ESV, OPC, then EPC, PDC, EDT for each property.
 * @param req	the request
 * @return the frame bytes
 * @throw ex::invalid_argument if there are more than 255 properties or an EDT longer than 255 bytes
 */
bytes serialize(const request& req);

/**
 * @brief Node profile Get request for the self-node instance list.
 *
 * Always the same 14 bytes, with TID 0: `10 81 0000 0ef001 0ef001 62 01 d6 00`.
 * @return the frame bytes
 */
bytes build_instance_list_request();

} // namespace frame

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_FRAME_HPP_ */
