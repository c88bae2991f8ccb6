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
*	\file		socket_option.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_
#define ECHONET_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_

#include <boost/asio/socket_base.hpp>
#include <boost/predef/os.h>

#if BOOST_OS_LINUX
#include <netinet/in.h>
#else
#error unsupported operating system
#endif

namespace echonet {

namespace socket_option {

// report ICMP errors (port or host unreachable) on unconnected UDP sockets
using recv_error = boost::asio::detail::socket_option::boolean<BOOST_ASIO_OS_DEF(IPPROTO_IP), IP_RECVERR>;

} // namespace socket_option

} // namespace echonet

#endif /* ECHONET_INCLUDE_CPP_UTILITY_SOCKET_OPTION_HPP_ */
