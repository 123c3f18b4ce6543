/*
 * File: composite.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>

#include "fixpack/codec/serializer.hpp"
#include "fixpack/codec/size.hpp"

namespace fixpack::codec {

	namespace detail {

		// Left to right; stops at the first field that fails.
		template <typename... Ts>
		errc store_each(writer& w, const Ts&... values) {
			errc result = errc::success;
			static_cast<void>((((result = serializer<Ts>::store(values, w)) == errc::success) && ...));
			return result;
		}

		template <typename... Ts>
		errc load_each(reader& r, Ts&... values) {
			errc result = errc::success;
			static_cast<void>((((result = serializer<Ts>::load(values, r)) == errc::success) && ...));
			return result;
		}

		template <typename... Ts>
		constexpr std::size_t size_each(const Ts&... values) {
			return (std::size_t{ 0 } + ... + serializer<Ts>::size(values));
		}
	}

	// Unit: no bytes at all.
	template <>
	struct serializer<std::monostate> {

		using value_type = std::monostate;
		constexpr static std::size_t max_size = 0;

		static errc store(const value_type&, writer&) noexcept {
			return errc::success;
		}

		static errc load(value_type&, reader&) noexcept {
			return errc::success;
		}

		constexpr static std::size_t size(const value_type&) noexcept {
			return 0;
		}
	};

	template <Encodable T, std::size_t N>
	struct serializer<std::array<T, N>> {

		using value_type = std::array<T, N>;
		using element_serializer = serializer<T>;
		constexpr static std::size_t max_size = N * element_serializer::max_size;

		static errc store(const value_type& val, writer& w) {
			for (const auto& element : val) {
				const auto res = element_serializer::store(element, w);
				if (res != errc::success) {
					return res;
				}
			}
			return errc::success;
		}

		static errc load(value_type& out, reader& r) {
			for (auto& element : out) {
				const auto res = element_serializer::load(element, r);
				if (res != errc::success) {
					return res;
				}
			}
			return errc::success;
		}

		constexpr static std::size_t size(const value_type& val) {
			std::size_t total = 0;
			for (const auto& element : val) {
				total += element_serializer::size(element);
			}
			return total;
		}
	};

	template <Encodable... Ts>
	struct serializer<std::tuple<Ts...>> {

		using value_type = std::tuple<Ts...>;
		constexpr static std::size_t max_size = sum_max_size_v<Ts...>;

		static errc store(const value_type& val, writer& w) {
			return std::apply([&w](const Ts&... fields) {
				return detail::store_each(w, fields...);
			}, val);
		}

		static errc load(value_type& out, reader& r) {
			return std::apply([&r](Ts&... fields) {
				return detail::load_each(r, fields...);
			}, out);
		}

		constexpr static std::size_t size(const value_type& val) {
			return std::apply([](const Ts&... fields) {
				return detail::size_each(fields...);
			}, val);
		}
	};

	template <Encodable A, Encodable B>
	struct serializer<std::pair<A, B>> {

		using value_type = std::pair<A, B>;
		constexpr static std::size_t max_size = sum_max_size_v<A, B>;

		static errc store(const value_type& val, writer& w) {
			return detail::store_each(w, val.first, val.second);
		}

		static errc load(value_type& out, reader& r) {
			return detail::load_each(r, out.first, out.second);
		}

		constexpr static std::size_t size(const value_type& val) {
			return detail::size_each(val.first, val.second);
		}
	};

	/*
	 * Presence byte (0 = absent, 1 = present) followed by the payload when
	 * present. Any other presence byte is rejected like an invalid bool.
	 */
	template <Encodable T>
	struct serializer<std::optional<T>> {

		using value_type = std::optional<T>;
		using inner_serializer = serializer<T>;
		constexpr static std::size_t max_size = serializer<bool>::max_size + inner_serializer::max_size;

		static errc store(const value_type& val, writer& w) {
			const auto res = serializer<bool>::store(val.has_value(), w);
			if (res != errc::success || !val.has_value()) {
				return res;
			}
			return inner_serializer::store(*val, w);
		}

		static errc load(value_type& out, reader& r) {
			bool present = false;
			const auto res = serializer<bool>::load(present, r);
			if (res != errc::success) {
				return res;
			}
			if (!present) {
				out.reset();
				return errc::success;
			}
			return inner_serializer::load(out.emplace(), r);
		}

		constexpr static std::size_t size(const value_type& val) {
			return serializer<bool>::max_size + (val.has_value() ? inner_serializer::size(*val) : 0);
		}
	};

} // namespace fixpack::codec
