/*
 * File: size.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <cstddef>

#include "fixpack/core/bytes.hpp"
#include "fixpack/codec/serializer.hpp"

namespace fixpack::codec {

	/*
	 * Size oracle. Every bound is a constant expression derived from the bounds
	 * of the parts only:
	 *   scalar        -> its width
	 *   array<T, N>   -> N * max(T)
	 *   record/tuple  -> sum of the fields
	 *   optional<T>   -> 1 + max(T)
	 *   variant<Ts..> -> 1 + largest alternative (an empty payload counts as 0)
	 *   fieldless enum-> 1
	 * There is no serializer for pointers or dynamically sized containers, so
	 * a type whose bound would not be finite is not Encodable at all.
	 */
	template <Encodable T>
	inline constexpr std::size_t max_size_v = serializer<T>::max_size;

	constexpr inline std::size_t const_max(std::size_t a, std::size_t b) noexcept {
		return a > b ? a : b;
	}

	template <typename... Ts>
	inline constexpr std::size_t sum_max_size_v = (std::size_t{ 0 } + ... + serializer<Ts>::max_size);

	namespace detail {
		template <std::size_t... Sizes>
		constexpr std::size_t largest_of() noexcept {
			std::size_t result = 0;
			((result = const_max(result, Sizes)), ...);
			return result;
		}
	}

	template <typename... Ts>
	inline constexpr std::size_t largest_max_size_v = detail::largest_of<serializer<Ts>::max_size...>();

	// Exact size of this particular value; never exceeds max_size_v<T>.
	template <Encodable T>
	constexpr std::size_t encoded_size(const T& value) {
		return serializer<T>::size(value);
	}

	// The one fixed buffer a caller needs for any value of T.
	template <Encodable T>
	using buffer_for = std::array<core::byte, max_size_v<T>>;

} // namespace fixpack::codec
