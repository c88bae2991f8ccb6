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
*	\file		serdes.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CPP_UTILITY_SERDES_HPP_
#define ECHONET_INCLUDE_CPP_UTILITY_SERDES_HPP_

#include <cstring>
#include <iterator>
#include <type_traits>

#include <boost/endian/conversion.hpp>
#include <boost/static_assert.hpp>

namespace echonet {

namespace serdes {

namespace detail {

/*
 * Iterators must be random access and must point to a character type, so that
 * the value can be copied with `std::memcpy` without breaking the strict aliasing rule.
 * Containers like `std::deque` provide random access iterators without contiguous
 * storage: it is up to the users of these functions to avoid them.
 */
template <typename It>
using iterator_value_type_t = std::remove_cv_t<typename std::iterator_traits<It>::value_type>;

template <typename It>
struct is_valid_iterator : std::integral_constant<bool,
	std::is_convertible<typename std::iterator_traits<It>::iterator_category, std::random_access_iterator_tag>::value &&
	(std::is_same<iterator_value_type_t<It>, char>::value || std::is_same<iterator_value_type_t<It>, unsigned char>::value)
> {};

namespace sanity_checks {

constexpr bool test_is_valid_iterator() noexcept {
	bool ret{true};
	ret &= (is_valid_iterator<char*>::value);
	ret &= (is_valid_iterator<unsigned char*>::value);
	ret &= (is_valid_iterator<const unsigned char*>::value);
	ret &= (!is_valid_iterator<signed char*>::value);
	ret &= (!is_valid_iterator<int*>::value);
	return ret;
}

BOOST_STATIC_ASSERT(test_is_valid_iterator());

} // namespace sanity_checks

template <typename It>
auto to_address(It it) noexcept {
	return &*it;
}

template <boost::endian::order Endian, typename T, typename It, std::enable_if_t<(std::is_integral<T>::value), int> = 0>
void serialize(It& it, T v) noexcept {
	boost::endian::conditional_reverse_inplace<boost::endian::order::native, Endian>(v);
	std::memcpy(to_address(it), &v, sizeof(T));
	it += sizeof(T);
}

template <boost::endian::order Endian, typename T, typename It, std::enable_if_t<(std::is_enum<T>::value), int> = 0>
void serialize(It& it, T v) noexcept {
	serialize<Endian>(it, static_cast<std::underlying_type_t<T>>(v));
}

} // namespace detail

/**
 * @brief Encode a value of a given type into a big-endian raw buffer, increasing the input iterator.
 *
 * Network byte order is big endian, as required by ECHONET Lite.
 * @tparam TIn		the input type (integer or enumeration)
 * @tparam It		a pointer or an iterator type to a raw buffer (value type must be char or unsigned char)
 * @param it		the iterator that will be increased by sizeof(TIn)
 * @param v			the value
 */
template <typename TIn, typename It>
void serialize(It& it, TIn v) noexcept {
	static_assert(detail::is_valid_iterator<It>::value, "invalid iterator value type");
	detail::serialize<boost::endian::order::big, TIn, It>(it, v);
}

} // namespace serdes

// import also into echonet namespace
using serdes::serialize;

} // namespace echonet

#endif /* ECHONET_INCLUDE_CPP_UTILITY_SERDES_HPP_ */
