/*
 * File: record.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <tuple>
#include <type_traits>

#include "fixpack/codec/serializer.hpp"
#include "fixpack/codec/composite.hpp"

namespace fixpack::codec {

	/*
	 * Field list of a record: a tuple of pointers to data members in
	 * declaration order. Either specialize this template
	 *
	 *   template <> struct fixpack::codec::record_fields<point> {
	 *       static constexpr auto value = std::make_tuple(&point::x, &point::y);
	 *   };
	 *
	 * or give the struct a static member function
	 *
	 *   static constexpr auto fixpack_fields() { return std::make_tuple(&point::x, &point::y); }
	 *
	 * Generated code is expected to emit one of the two.
	 */
	template <typename T>
	struct record_fields {};

	template <typename T>
		requires requires { T::fixpack_fields(); }
	struct record_fields<T> {
		static constexpr auto value = T::fixpack_fields();
	};

	namespace detail {

		template <typename M>
		struct member_pointer_traits;

		template <typename C, typename M>
		struct member_pointer_traits<M C::*> {
			using class_type = C;
			using member_type = M;
		};

		template <typename Record, typename Fields>
		struct record_shape;

		template <typename Record, typename... Ms>
		struct record_shape<Record, std::tuple<Ms...>> {
			static_assert((std::is_same_v<typename member_pointer_traits<Ms>::class_type, Record> && ...),
				"record fields must be data members of the record itself");
			using type = std::tuple<std::remove_cv_t<typename member_pointer_traits<Ms>::member_type>...>;
		};
	}

	template <typename T>
	concept Record = std::is_class_v<T> && requires {
		record_fields<T>::value;
	};

	// Same bytes as the tuple of its field types: no padding, no field tags.
	template <Record T>
	struct serializer<T> {

		using value_type = T;
		using fields_type = std::remove_cvref_t<decltype(record_fields<T>::value)>;
		using shape_type = typename detail::record_shape<T, fields_type>::type;

		static_assert(Encodable<shape_type>, "every record field must be encodable");

		constexpr static std::size_t max_size = serializer<shape_type>::max_size;

		static errc store(const value_type& val, writer& w) {
			return std::apply([&](auto... members) {
				return detail::store_each(w, (val.*members)...);
			}, record_fields<T>::value);
		}

		static errc load(value_type& out, reader& r) {
			return std::apply([&](auto... members) {
				return detail::load_each(r, (out.*members)...);
			}, record_fields<T>::value);
		}

		constexpr static std::size_t size(const value_type& val) {
			return std::apply([&](auto... members) {
				return detail::size_each((val.*members)...);
			}, record_fields<T>::value);
		}
	};

} // namespace fixpack::codec
