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
*	\file		hash.hpp
*	\brief
*
******************************************************************************/

#ifndef ECHONET_INCLUDE_CPP_UTILITY_HASH_HPP_
#define ECHONET_INCLUDE_CPP_UTILITY_HASH_HPP_

#include <cstdint>
#include <cstddef>
#include <iterator>
#include <type_traits>

namespace echonet {

namespace hash {

namespace detail {

/**
 * @brief 64-bit FNV-1a, usable in constant expressions.
 *
 * Implemented using `prime * (value ^ data)`.
 */
struct fnv1a_64 {
	static constexpr std::uint64_t offset_basis{0xcbf29ce484222325};
	static constexpr std::uint64_t prime{0x100000001b3};

	// no dereferences if size == 0 (null terminators processed if found)
	template <typename CharT>
	constexpr std::uint64_t operator()(const CharT* data, std::size_t size) const noexcept {
		auto value = offset_basis;
		for (; size != 0; --size)
			value = char_hash(value, *data++);
		return value;
	}

	// stops just before the first null terminator
	template <typename CharT>
	constexpr std::uint64_t operator()(const CharT* data) const noexcept {
		auto value = offset_basis;
		while (*data != '\0')
			value = char_hash(value, *data++);
		return value;
	}

	// strings and string views (null terminators processed if found)
	template <typename T, std::enable_if_t<!(std::is_pointer<T>::value || std::is_array<T>::value), int> = 0>
	constexpr std::uint64_t operator()(const T& c) const {
		auto value = offset_basis;
		for (auto it = std::begin(c); it != std::end(c); ++it)
			value = char_hash(value, *it);
		return value;
	}

private:
	template <typename CharT>
	static constexpr std::uint64_t char_hash(std::uint64_t value, CharT data) noexcept {
		return prime * (value ^ static_cast<std::make_unsigned_t<CharT>>(data));
	}
};

namespace sanity_checks {

// see http://www.isthe.com/chongo/tech/comp/fnv/index.html
static_assert(fnv1a_64{}("hello world") == std::uint64_t{0x779a65e7023cd2e7}, "inconsistent hash implementation");
static_assert(fnv1a_64{}("") == fnv1a_64::offset_basis, "inconsistent hash implementation");
static_assert(fnv1a_64{}("!0IC=VloaY") == 0, "inconsistent hash implementation");

} // namespace sanity_checks

} // namespace detail

using generator = detail::fnv1a_64;

namespace literals {

/**
 * @brief UDL to convert string literal to hash using @ref echonet::hash::generator, to be used in switch statements.
 *
 * @return hash of input string
 */
constexpr auto operator""_h(const char* data, std::size_t size) noexcept {
	return generator{}(data, size);
}

} // namespace literals

} // namespace hash

} // namespace echonet

#endif /* ECHONET_INCLUDE_CPP_UTILITY_HASH_HPP_ */
