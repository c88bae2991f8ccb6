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
*	\file		interfaces.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_INTERFACES_HPP_
#define ECHONET_INCLUDE_INTERFACES_HPP_

#include <string>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>

namespace echonet {

namespace lite {

namespace interfaces {

struct interface_item {
	std::string _name;
	boost::asio::ip::address_v4 _address;
	boost::asio::ip::address_v4 _broadcast_address;
};

/**
 * @brief List of the running, broadcast capable, non loopback IPv4 interfaces.
 * @throw ex::runtime_error if the system enumeration fails
 */
std::vector<interface_item> enum_interfaces();

/**
 * @brief Addresses assigned to this host: every IPv4 address of the interfaces that are up, plus 127.0.0.1.
 * @throw ex::runtime_error if the system enumeration fails
 */
std::vector<boost::asio::ip::address_v4> local_addresses();

/**
 * @brief Directed broadcast address of the first interface returned by enum_interfaces().
 * @return the broadcast address, or 255.255.255.255 if no interface is available
 */
boost::asio::ip::address_v4 default_broadcast_address();

} // namespace interfaces

} // namespace lite

} // namespace echonet

#endif /* ECHONET_INCLUDE_INTERFACES_HPP_ */
