/*
 * File: serialize.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <system_error>
#include <tuple>
#include <utility>

#include "fixpack/core/bytes.hpp"
#include "fixpack/codec/cursor.hpp"
#include "fixpack/codec/errors.hpp"
#include "fixpack/codec/serializer.hpp"
#include "fixpack/codec/size.hpp"

namespace fixpack::codec {

	/*
	 * Encodes value at the front of out and returns the number of bytes
	 * written, which is at most max_size_v<T>. The caller slices out with it
	 * before appending any raw trailing data. On failure returns 0 and sets ec;
	 * the contents of out are then unspecified.
	 */
	template <Encodable T>
	std::size_t serialize(const T& value, byte_span out, std::error_code& ec) noexcept {
		writer w(out);
		const auto res = serializer<T>::store(value, w);
		if (res != errc::success) {
			ec = make_error_code(res);
			return 0;
		}
		ec.clear();
		return w.written();
	}

	template <Encodable T>
	std::size_t serialize(const T& value, byte_span out) {
		std::error_code ec;
		const auto written = codec::serialize(value, out, ec);
		if (ec) {
			throw codec_error(ec);
		}
		return written;
	}

	/*
	 * Decodes one T from the front of in. Returns the value together with the
	 * unconsumed tail of in, so a trailing payload or a second encoding can be
	 * located without extra bookkeeping. On failure sets ec and returns a
	 * value-initialized T with the whole input as the tail; a partially decoded
	 * value is never handed out.
	 */
	template <Encodable T>
	std::tuple<T, byte_view> deserialize(byte_view in, std::error_code& ec) {
		reader r(in);
		T value{};
		const auto res = serializer<T>::load(value, r);
		if (res != errc::success) {
			ec = make_error_code(res);
			return { T{}, in };
		}
		ec.clear();
		return { std::move(value), r.rest() };
	}

	template <Encodable T>
	std::tuple<T, byte_view> deserialize(byte_view in) {
		std::error_code ec;
		auto result = codec::deserialize<T>(in, ec);
		if (ec) {
			throw codec_error(ec);
		}
		return result;
	}

} // namespace fixpack::codec
