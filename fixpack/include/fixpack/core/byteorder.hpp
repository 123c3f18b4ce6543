/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#include "fixpack/core/bytes.hpp"

namespace fixpack::core {

#if defined(__SIZEOF_INT128__)
#	define FIXPACK_HAS_INT128 1
	__extension__ typedef __int128 int128;
	__extension__ typedef unsigned __int128 uint128;
#endif

} // namespace fixpack::core

namespace fixpack::core::byteorder {

	template <typename SignedT, typename UnsignedT>
	struct word_pair {
		static constexpr bool is_word = true;
		using signed_type = SignedT;
		using unsigned_type = UnsignedT;
	};

	// Words are the fixed-width integer aliases only; `bool` and `char` are not words.
	template <typename T>
	struct word_traits {
		static constexpr bool is_word = false;
	};

	template <> struct word_traits<std::int8_t> : word_pair<std::int8_t, std::uint8_t> {};
	template <> struct word_traits<std::int16_t> : word_pair<std::int16_t, std::uint16_t> {};
	template <> struct word_traits<std::int32_t> : word_pair<std::int32_t, std::uint32_t> {};
	template <> struct word_traits<std::int64_t> : word_pair<std::int64_t, std::uint64_t> {};
	template <> struct word_traits<std::uint8_t> : word_pair<std::int8_t, std::uint8_t> {};
	template <> struct word_traits<std::uint16_t> : word_pair<std::int16_t, std::uint16_t> {};
	template <> struct word_traits<std::uint32_t> : word_pair<std::int32_t, std::uint32_t> {};
	template <> struct word_traits<std::uint64_t> : word_pair<std::int64_t, std::uint64_t> {};
#if defined(FIXPACK_HAS_INT128)
	template <> struct word_traits<core::int128> : word_pair<core::int128, core::uint128> {};
	template <> struct word_traits<core::uint128> : word_pair<core::int128, core::uint128> {};
#endif

	template <typename T>
	concept Word = word_traits<T>::is_word;

	template <typename T>
	concept UnsignedWord = Word<T> && std::is_same_v<T, typename word_traits<T>::unsigned_type>;

	template <typename T>
	concept SignedWord = Word<T> && !UnsignedWord<T>;

	template <Word WordT>
	using unsigned_word_t = typename word_traits<WordT>::unsigned_type;

	template <UnsignedWord WordT>
	constexpr inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				const auto octet = static_cast<WordT>(std::to_integer<std::uint8_t>(mem[i]));
				result = static_cast<WordT>(result | static_cast<WordT>(octet << (8 * i)));
			}
			return result;
		}
		else {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
			}
		}
		else {
			std::memcpy(mem, &val, sizeof(WordT));
		}
	}

	template <SignedWord WordT>
	constexpr inline WordT le_to_native_signed(const core::byte* mem) {
		using unsigned_type = unsigned_word_t<WordT>;
		const unsigned_type uns = le_to_native_unsigned<unsigned_type>(mem);
		return std::bit_cast<WordT>(uns);
	}

	template <SignedWord WordT>
	constexpr inline void native_to_le_signed(WordT val, core::byte* mem) {
		using unsigned_type = unsigned_word_t<WordT>;
		const unsigned_type uns = std::bit_cast<unsigned_type>(val);
		native_to_le_unsigned<unsigned_type>(uns, mem);
	}

	template <Word WordT>
	constexpr inline WordT le_to_native(const core::byte* mem) {
		if constexpr (UnsignedWord<WordT>) {
			return le_to_native_unsigned<WordT>(mem);
		}
		else {
			return le_to_native_signed<WordT>(mem);
		}
	}

	template <Word WordT>
	constexpr inline void native_to_le(WordT val, core::byte* mem) {
		if constexpr (UnsignedWord<WordT>) {
			native_to_le_unsigned<WordT>(val, mem);
		}
		else {
			native_to_le_signed<WordT>(val, mem);
		}
	}

} // namespace fixpack::core::byteorder
