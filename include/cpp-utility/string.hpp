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
*	\file		string.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CPP_UTILITY_STRING_HPP_
#define ECHONET_INCLUDE_CPP_UTILITY_STRING_HPP_

#include <cctype>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/assert.hpp>
#include <boost/static_assert.hpp>

namespace echonet {

namespace string {

namespace detail {

template <typename Char>
struct null_terminator : std::integral_constant<Char, Char{}> {};

inline bool is_printable(char c) {
	// unsigned char cast needed, provided by to_int_type (https://en.cppreference.com/w/cpp/string/byte/isprint)
	return std::isprint(std::char_traits<char>::to_int_type(c)) != 0;
}

namespace sanity_checks {

constexpr bool test_null_terminator() noexcept {
	bool ret{true};
	ret &= (null_terminator<char>::value == *"");
	ret &= (null_terminator<wchar_t>::value == *L"");
	return ret;
}

BOOST_STATIC_ASSERT(test_null_terminator());

} // namespace sanity_checks

} // namespace detail

/**
 * @brief Copy a null terminated string from C API, returning empty string on invalid input.
 *
 * @param[in] src		null terminated input, can be null
 * @param[in] max_size	maximum size, including the null terminator
 * @return a copy of the input, or an empty string if null, not terminated within @p max_size or with non printable characters
 */
template <typename Char, typename String = std::basic_string<Char>>
String pointer_to_string_safe(const Char* src, typename String::size_type max_size) {
	BOOST_STATIC_ASSERT(std::is_same<Char, typename String::value_type>::value);
	BOOST_ASSERT_MSG(!detail::is_printable(detail::null_terminator<Char>::value), "invalid implementation");
	if (src == nullptr)
		return String{};
	typename String::size_type i{};
	while (i < max_size && detail::is_printable(src[i]))
		++i;
	if (i == max_size || src[i] != detail::null_terminator<Char>::value)
		return String{};
	return String(src, i);
}

/**
 * @brief Copy a string to a C API buffer, including the null terminator.
 *
 * @param[out] dst		output buffer, nothing is done if null
 * @param[in] src		input string
 * @param[in] max_size	size of @p dst
 * @throw std::runtime_error if @p src does not fit into @p dst
 */
template <typename Char, typename String>
void string_to_pointer_safe(Char* dst, const String& src, typename String::size_type max_size) {
	BOOST_STATIC_ASSERT(std::is_same<Char, typename String::value_type>::value);
	if (dst == nullptr)
		return;
	if (src.size() >= max_size)
		throw std::runtime_error("string too long to be copied");
	const auto n = src.copy(dst, max_size - 1);
	dst[n] = detail::null_terminator<Char>::value;
}

} // namespace string

} // namespace echonet

#endif /* ECHONET_INCLUDE_CPP_UTILITY_STRING_HPP_ */
