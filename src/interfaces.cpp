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
*	\file		interfaces.cpp
*	\brief
*
******************************************************************************/

#include "interfaces.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

#include <boost/predef/os.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#if BOOST_OS_WINDOWS
#error Windows not supported: interfaces are enumerated with getifaddrs
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

#include "lib_error.hpp"

namespace echonet {

namespace lite {

namespace interfaces {

namespace {

boost::asio::ip::address_v4 to_address_v4(const sockaddr& sa) noexcept {
	// sockaddr and sockaddr_in have the same size on AF_INET
	sockaddr_in sin;
	std::memcpy(&sin, &sa, sizeof(sin));
	return boost::asio::ip::address_v4(ntohl(sin.sin_addr.s_addr));
}

template <typename Callable>
void for_each_ipv4(Callable&& f) {
	ifaddrs* ifa = nullptr;
	if (::getifaddrs(&ifa) != 0)
		throw ex::runtime_error(fmt::format("getifaddrs failed: {}", std::strerror(errno)));
	// store ifa in a unique_ptr for RAII delete
	std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> deleter(ifa, &::freeifaddrs);
	for (; ifa != nullptr; ifa = ifa->ifa_next) {
		if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
			continue;
		f(*ifa);
	}
}

} // unnamed namespace

std::vector<interface_item> enum_interfaces() {
	std::vector<interface_item> res;
	for_each_ipv4([&res](const ifaddrs& ifa) {
		const auto flags = ifa.ifa_flags;
		if (ifa.ifa_netmask == nullptr)
			return;
		if ((flags & IFF_RUNNING) == 0 || (flags & IFF_BROADCAST) == 0 || (flags & IFF_LOOPBACK) != 0)
			return;
		const auto address = to_address_v4(*ifa.ifa_addr);
		const auto netmask = to_address_v4(*ifa.ifa_netmask);
		const boost::asio::ip::address_v4 broadcast_address(address.to_uint() | ~netmask.to_uint());
		spdlog::debug("interface {}: address {} broadcast {}", ifa.ifa_name, address.to_string(), broadcast_address.to_string());
		res.push_back({ifa.ifa_name, address, broadcast_address});
	});
	return res;
}

std::vector<boost::asio::ip::address_v4> local_addresses() {
	std::vector<boost::asio::ip::address_v4> res{boost::asio::ip::address_v4::loopback()};
	for_each_ipv4([&res](const ifaddrs& ifa) {
		if ((ifa.ifa_flags & IFF_UP) == 0)
			return;
		const auto address = to_address_v4(*ifa.ifa_addr);
		if (std::find(res.begin(), res.end(), address) == res.end())
			res.push_back(address);
	});
	return res;
}

boost::asio::ip::address_v4 default_broadcast_address() {
	const auto list = enum_interfaces();
	if (list.empty()) {
		spdlog::warn("no broadcast capable interface found, using limited broadcast");
		return boost::asio::ip::address_v4::broadcast();
	}
	return list.front()._broadcast_address;
}

} // namespace interfaces

} // namespace lite

} // namespace echonet
