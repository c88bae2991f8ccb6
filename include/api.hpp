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
*	\file		api.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_API_HPP_
#define ECHONET_INCLUDE_API_HPP_

#include <optional>
#include <string>

#include "lib_error.hpp"

namespace echonet {

namespace lite {

struct discovery_report {
	std::string _json;
	std::optional<ex::receive_error> _error;	//!< collection aborted, _json contains partial results
};

std::string get_lib_version();

std::string get_default_broadcast_address();

discovery_report discover(const std::string& url);

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_API_HPP_ */
