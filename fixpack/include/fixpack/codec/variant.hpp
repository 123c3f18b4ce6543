/*
 * File: variant.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

#include "fixpack/codec/serializer.hpp"
#include "fixpack/codec/size.hpp"

namespace fixpack::codec {

	// The discriminant is a single byte.
	constexpr inline std::size_t max_discriminants = 256;

	namespace detail {

		template <typename Variant>
		struct variant_alternative_ops {

			template <std::size_t I>
			static errc store(const Variant& val, writer& w) {
				using alternative = std::variant_alternative_t<I, Variant>;
				return serializer<alternative>::store(*std::get_if<I>(&val), w);
			}

			template <std::size_t I>
			static errc load(Variant& out, reader& r) {
				using alternative = std::variant_alternative_t<I, Variant>;
				return serializer<alternative>::load(out.template emplace<I>(), r);
			}

			template <std::size_t I>
			static std::size_t size(const Variant& val) {
				using alternative = std::variant_alternative_t<I, Variant>;
				return serializer<alternative>::size(*std::get_if<I>(&val));
			}
		};

		// Dispatch by index rather than by type so that repeated alternative
		// types keep their own discriminants.
		template <typename Variant, typename Indices>
		struct variant_dispatch;

		template <typename Variant, std::size_t... I>
		struct variant_dispatch<Variant, std::index_sequence<I...>> {

			using ops = variant_alternative_ops<Variant>;
			using store_fn = errc(*)(const Variant&, writer&);
			using load_fn = errc(*)(Variant&, reader&);
			using size_fn = std::size_t(*)(const Variant&);

			static constexpr std::array<store_fn, sizeof...(I)> store = { &ops::template store<I>... };
			static constexpr std::array<load_fn, sizeof...(I)> load = { &ops::template load<I>... };
			static constexpr std::array<size_fn, sizeof...(I)> size = { &ops::template size<I>... };
		};
	}

	/*
	 * Tagged union: discriminant byte (alternative index) then the payload of
	 * the active alternative only. Decoding an index with no alternative fails
	 * with errc::invalid right after the discriminant byte.
	 */
	template <Encodable... Ts>
	struct serializer<std::variant<Ts...>> {

		static_assert(sizeof...(Ts) <= max_discriminants, "tagged unions are limited to 256 alternatives");

		using value_type = std::variant<Ts...>;
		using dispatch = detail::variant_dispatch<value_type, std::index_sequence_for<Ts...>>;
		constexpr static std::size_t max_size = 1 + largest_max_size_v<Ts...>;

		static errc store(const value_type& val, writer& w) {
			if (val.valueless_by_exception()) {
				return errc::invalid;
			}
			const auto index = val.index();
			const auto res = w.put_le<std::uint8_t>(static_cast<std::uint8_t>(index));
			if (res != errc::success) {
				return res;
			}
			return dispatch::store[index](val, w);
		}

		static errc load(value_type& out, reader& r) {
			std::uint8_t index = 0;
			const auto res = r.take_le<std::uint8_t>(index);
			if (res != errc::success) {
				return res;
			}
			if (index >= sizeof...(Ts)) {
				return errc::invalid;
			}
			return dispatch::load[index](out, r);
		}

		static std::size_t size(const value_type& val) {
			if (val.valueless_by_exception()) {
				return 0;
			}
			return 1 + dispatch::size[val.index()](val);
		}
	};

	/*
	 * Fieldless enumerations opt in by declaring how many ordinals they use:
	 *
	 *   template <> struct fixpack::codec::enum_traits<color> {
	 *       static constexpr std::size_t count = 3;
	 *   };
	 *
	 * Enumerators must be exactly 0 .. count-1.
	 */
	template <typename E>
	struct enum_traits {};

	template <typename E>
	concept Enumeration = std::is_enum_v<E> && requires {
		{ enum_traits<E>::count } -> std::convertible_to<std::size_t>;
	};

	template <Enumeration E>
	struct serializer<E> {

		static_assert(enum_traits<E>::count >= 1 && enum_traits<E>::count <= max_discriminants,
			"enumerations need between 1 and 256 variants");

		using value_type = E;
		using underlying_type = std::underlying_type_t<E>;
		constexpr static std::size_t count = enum_traits<E>::count;
		constexpr static std::size_t max_size = 1;

		static errc store(value_type val, writer& w) noexcept {
			const auto ordinal = static_cast<underlying_type>(val);
			if constexpr (std::is_signed_v<underlying_type>) {
				if (ordinal < 0) {
					return errc::invalid;
				}
			}
			if (static_cast<std::uint64_t>(ordinal) >= count) {
				return errc::invalid;
			}
			return w.put_le<std::uint8_t>(static_cast<std::uint8_t>(ordinal));
		}

		static errc load(value_type& out, reader& r) noexcept {
			std::uint8_t ordinal = 0;
			const auto res = r.take_le<std::uint8_t>(ordinal);
			if (res != errc::success) {
				return res;
			}
			if (ordinal >= count) {
				return errc::invalid;
			}
			out = static_cast<value_type>(ordinal);
			return errc::success;
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return max_size;
		}
	};

} // namespace fixpack::codec
