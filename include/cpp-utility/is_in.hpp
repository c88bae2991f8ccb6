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
*	\file		is_in.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CPP_UTILITY_IS_IN_HPP_
#define ECHONET_INCLUDE_CPP_UTILITY_IS_IN_HPP_

#include <boost/static_assert.hpp>

namespace echonet {

/**
 * @brief Check if a variable is equal to any variables in a given set.
 *
 * @tparam T		value type
 * @tparam Args		parameter pack
 * @param value		the value
 * @param args		values to be compared with value
 * @return			true if value is equal to any in args
 */
template <typename T, typename... Args>
constexpr bool is_in(const T& value, const Args&... args) noexcept {
	static_assert(sizeof...(args) > 0, "at least one value is needed");
	return ((value == args) || ...);
}

namespace sanity_checks {

constexpr bool test_is_in() noexcept {
	bool ret{true};
	ret &= is_in(1, 1);
	ret &= !is_in(0, 1);
	ret &= is_in(1, 1, 2, 3, 4);
	ret &= !is_in(1, 10);
	return ret;
}

BOOST_STATIC_ASSERT(test_is_in());

} // namespace sanity_checks

} // namespace echonet

#endif /* ECHONET_INCLUDE_CPP_UTILITY_IS_IN_HPP_ */
