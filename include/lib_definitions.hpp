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
*	\file		lib_definitions.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_LIB_DEFINITIONS_HPP_
#define ECHONET_INCLUDE_LIB_DEFINITIONS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace echonet {

namespace lite {

namespace defaults {

static constexpr std::uint16_t port{3610};						// well-known ECHONET Lite port
static constexpr std::chrono::milliseconds collection_duration{5000};

} // namespace defaults

namespace max_size {

static constexpr std::size_t datagram{1500};					// typical Ethernet MTU

namespace str {

static constexpr std::size_t version{16};
static constexpr std::size_t last_error_description{1024};
static constexpr std::size_t url{1024};
static constexpr std::size_t address{16};						// INET_ADDRSTRLEN

} // namespace str

} // namespace max_size

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_LIB_DEFINITIONS_HPP_ */
