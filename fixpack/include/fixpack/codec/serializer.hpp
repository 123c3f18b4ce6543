/*
 * File: serializer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "fixpack/core/bytes.hpp"
#include "fixpack/core/byteorder.hpp"
#include "fixpack/codec/cursor.hpp"
#include "fixpack/codec/errors.hpp"

namespace fixpack::codec {

	/*
	 * One specialization per encodable shape. Each provides
	 *   max_size            - upper bound of the encoding, independent of any value
	 *   store(value, w)     - append the encoding of value to the writer
	 *   load(out, r)        - consume one encoding from the reader into out
	 *   size(value)         - exact number of bytes store() will write for value
	 */
	template <typename T>
	struct serializer;

	template <typename T>
	concept Encodable = std::default_initializable<T>
		&& requires(const T& val, T& out, writer& w, reader& r) {
			{ serializer<T>::max_size } -> std::convertible_to<std::size_t>;
			{ serializer<T>::store(val, w) } -> std::same_as<errc>;
			{ serializer<T>::load(out, r) } -> std::same_as<errc>;
			{ serializer<T>::size(val) } -> std::convertible_to<std::size_t>;
		};

	template <byteorder::Word WordT>
	struct integer_serializer {

		using value_type = WordT;
		constexpr static std::size_t max_size = sizeof(value_type);

		static errc store(value_type val, writer& w) noexcept {
			return w.put_le<value_type>(val);
		}

		static errc load(value_type& out, reader& r) noexcept {
			return r.take_le<value_type>(out);
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return max_size;
		}
	};

	template <std::floating_point FloatT>
	struct float_serializer {

		static_assert(std::numeric_limits<FloatT>::is_iec559, "Only IEEE-754 floating point is supported");
		static_assert(sizeof(FloatT) == sizeof(std::uint32_t) || sizeof(FloatT) == sizeof(std::uint64_t), "Unsupported float size");

		using value_type = FloatT;
		using bits_type = std::conditional_t<sizeof(FloatT) == sizeof(std::uint32_t), std::uint32_t, std::uint64_t>;
		constexpr static std::size_t max_size = sizeof(bits_type);

		static errc store(value_type val, writer& w) noexcept {
			return w.put_le<bits_type>(std::bit_cast<bits_type>(val));
		}

		static errc load(value_type& out, reader& r) noexcept {
			bits_type bits = 0;
			const auto res = r.take_le<bits_type>(bits);
			if (res == errc::success) {
				out = std::bit_cast<value_type>(bits);
			}
			return res;
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return max_size;
		}
	};

	template <>
	struct serializer<std::int8_t> : public integer_serializer<std::int8_t> {};
	template <>
	struct serializer<std::int16_t> : public integer_serializer<std::int16_t> {};
	template <>
	struct serializer<std::int32_t> : public integer_serializer<std::int32_t> {};
	template <>
	struct serializer<std::int64_t> : public integer_serializer<std::int64_t> {};

	template <>
	struct serializer<std::uint8_t> : public integer_serializer<std::uint8_t> {};
	template <>
	struct serializer<std::uint16_t> : public integer_serializer<std::uint16_t> {};
	template <>
	struct serializer<std::uint32_t> : public integer_serializer<std::uint32_t> {};
	template <>
	struct serializer<std::uint64_t> : public integer_serializer<std::uint64_t> {};

#if defined(FIXPACK_HAS_INT128)
	template <>
	struct serializer<core::int128> : public integer_serializer<core::int128> {};
	template <>
	struct serializer<core::uint128> : public integer_serializer<core::uint128> {};
#endif

	template <>
	struct serializer<float> : public float_serializer<float> {};
	template <>
	struct serializer<double> : public float_serializer<double> {};

	template <>
	struct serializer<bool> {

		using value_type = bool;
		constexpr static std::size_t max_size = 1;

		static errc store(value_type val, writer& w) noexcept {
			return w.put_le<std::uint8_t>(static_cast<std::uint8_t>(val ? 1 : 0));
		}

		static errc load(value_type& out, reader& r) noexcept {
			std::uint8_t octet = 0;
			const auto res = r.take_le<std::uint8_t>(octet);
			if (res != errc::success) {
				return res;
			}
			if (octet > 1) {
				return errc::invalid;
			}
			out = (octet == 1);
			return errc::success;
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return max_size;
		}
	};

	template <>
	struct serializer<core::byte> {

		using value_type = core::byte;
		constexpr static std::size_t max_size = 1;

		static errc store(value_type val, writer& w) noexcept {
			return w.put(val);
		}

		static errc load(value_type& out, reader& r) noexcept {
			return r.take(out);
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return max_size;
		}
	};

} // namespace fixpack::codec
