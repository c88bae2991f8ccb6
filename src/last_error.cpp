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
*	\file		last_error.cpp
*	\brief
*
******************************************************************************/

#include "last_error.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "ECHONETDiscovery.h"
#include "lib_error.hpp"

using namespace std::literals;

namespace echonet {

namespace lite {

namespace last_error {

std::string& instance() noexcept(noexcept(std::string())) {
	// std::string default constructor is noexcept(std::allocator()), and std::allocator() noexcept
	thread_local std::string s;
	return s;
}

namespace {

template <typename StringT>
void store(StringT&& formatted_error) {
	instance() = std::string(std::forward<StringT>(formatted_error));
}

template <typename FuncT, typename StringT>
void store_and_log(FuncT&& func, StringT&& detail) noexcept {
	try {
		store(detail);
	} catch (...) {
		// do nothing
	}
	try {
		spdlog::error("[{}] {}", std::forward<FuncT>(func), std::forward<StringT>(detail));
	} catch (...) {
		// do nothing
	}
}

template <typename FuncT, typename TypeT>
void store_and_log(FuncT&& func, TypeT&& type, const std::exception& ex) noexcept try {
	auto detail = fmt::format("{}: {}", std::forward<TypeT>(type), ex.what());
	store_and_log(std::forward<FuncT>(func), std::move(detail));
} catch (...) {
	return;
}

} // unnamed namespace

int _handle_exception(std::string_view func) noexcept try {
	// this throw usage is allowed when an exception is presently being handled, it calls std::terminate if used otherwise
	throw;
}
catch (const ex::invalid_argument& ex) {
	store_and_log(func, "invalid argument"sv, ex);
	return ::ECHONETDiscovery_InvalidParam;
}
catch (const ex::invalid_state& ex) {
	store_and_log(func, "invalid state"sv, ex);
	return ::ECHONETDiscovery_InvalidState;
}
catch (const ex::bind_error& ex) {
	store_and_log(func, "bind error"sv, ex);
	return ::ECHONETDiscovery_BindError;
}
catch (const ex::send_error& ex) {
	store_and_log(func, "send error"sv, ex);
	return ::ECHONETDiscovery_SendError;
}
catch (const ex::receive_error& ex) {
	store_and_log(func, "receive error"sv, ex);
	return ::ECHONETDiscovery_ReceiveError;
}
catch (const ex::runtime_error& ex) {
	store_and_log(func, "generic runtime error"sv, ex);
	return ::ECHONETDiscovery_InternalError;
}
catch (const std::exception& ex) {
	store_and_log(func, "generic error"sv, ex);
	return ::ECHONETDiscovery_GenericError;
}
catch (...) {
	store_and_log(func, "unknown exception type"sv);
	return ::ECHONETDiscovery_GenericError;
}

} // namespace last_error

} // namespace lite

} // namespace echonet
