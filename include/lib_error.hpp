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
*	\file		lib_error.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_LIB_ERROR_HPP_
#define ECHONET_INCLUDE_LIB_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace echonet {

namespace lite {

namespace ex {

using namespace std::string_literals;

struct runtime_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct invalid_argument : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

/**
 * @brief Operation invoked on a session that is not open.
 */
struct invalid_state : public std::logic_error {
	using std::logic_error::logic_error;
};

/**
 * @brief Socket setup failed (open, socket options or bind).
 */
struct bind_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

/**
 * @brief Datagram transmission failed.
 */
struct send_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

/**
 * @brief Transport failure during collection, distinct from the expected timeout.
 */
struct receive_error : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

} // namespace ex

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_LIB_ERROR_HPP_ */
