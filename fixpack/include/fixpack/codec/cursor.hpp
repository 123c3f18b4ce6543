/*
 * File: cursor.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>

#include "fixpack/core/assert.hpp"
#include "fixpack/core/bytes.hpp"
#include "fixpack/core/byteorder.hpp"
#include "fixpack/codec/errors.hpp"

namespace fixpack::codec {

	namespace byteorder = core::byteorder;

	using core::byte;
	using core::byte_span;
	using core::byte_view;

	/*
	 * Write cursor over a caller-owned buffer. Every put checks the remaining
	 * space first; on failure nothing is written and the position is kept.
	 */
	class writer {
	public:
		explicit writer(byte_span out) noexcept : out_(out) {}

		std::size_t written() const noexcept { return pos_; }
		std::size_t remaining() const noexcept { return out_.size() - pos_; }

		errc put(byte value) noexcept {
			if (remaining() < 1) {
				return errc::buffer_too_small;
			}
			out_[pos_++] = value;
			return errc::success;
		}

		template <byteorder::Word WordT>
		errc put_le(WordT value) noexcept {
			if (remaining() < sizeof(WordT)) {
				return errc::buffer_too_small;
			}
			byteorder::native_to_le<WordT>(value, out_.data() + pos_);
			advance(sizeof(WordT));
			return errc::success;
		}

	private:
		void advance(std::size_t n) noexcept {
			pos_ += n;
			FIXPACK_ASSERT(pos_ <= out_.size(), "writer ran past its buffer");
		}

		byte_span out_;
		std::size_t pos_ = 0;
	};

	/*
	 * Read cursor over a caller-owned buffer. rest() is the unconsumed tail.
	 */
	class reader {
	public:
		explicit reader(byte_view in) noexcept : in_(in) {}

		std::size_t consumed() const noexcept { return pos_; }
		std::size_t remaining() const noexcept { return in_.size() - pos_; }
		byte_view rest() const noexcept { return in_.subspan(pos_); }

		errc take(byte& out) noexcept {
			if (remaining() < 1) {
				return errc::buffer_too_small;
			}
			out = in_[pos_++];
			return errc::success;
		}

		template <byteorder::Word WordT>
		errc take_le(WordT& out) noexcept {
			if (remaining() < sizeof(WordT)) {
				return errc::buffer_too_small;
			}
			out = byteorder::le_to_native<WordT>(in_.data() + pos_);
			advance(sizeof(WordT));
			return errc::success;
		}

	private:
		void advance(std::size_t n) noexcept {
			pos_ += n;
			FIXPACK_ASSERT(pos_ <= in_.size(), "reader ran past its buffer");
		}

		byte_view in_;
		std::size_t pos_ = 0;
	};

} // namespace fixpack::codec
