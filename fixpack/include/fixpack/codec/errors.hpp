/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace fixpack::codec {

	enum class errc : std::uint8_t {
		success = 0,
		// Fewer bytes remain in the destination (encode) or source (decode)
		// than the next field needs.
		buffer_too_small = 1,
		// Enough bytes, but not a value of the target type: unknown variant
		// discriminant, bool byte other than 0/1, enum ordinal out of range.
		invalid = 2,
	};

	constexpr inline std::string_view to_string(errc e) noexcept {
		switch (e) {
		case errc::success:
			return "success";
		case errc::buffer_too_small:
			return "buffer too small";
		case errc::invalid:
			return "invalid encoding";
		}
		return "unknown error";
	}

	class codec_error_category final : public std::error_category {
	public:
		const char* name() const noexcept override {
			return "fixpack";
		}

		std::string message(int ev) const override {
			return std::string(to_string(static_cast<errc>(ev)));
		}
	};

	inline const std::error_category& codec_category() noexcept {
		static const codec_error_category instance;
		return instance;
	}

	inline std::error_code make_error_code(errc e) noexcept {
		return { static_cast<int>(e), codec_category() };
	}

	class codec_error : public std::system_error {
	public:
		using std::system_error::system_error;

		explicit codec_error(errc e)
			: std::system_error(make_error_code(e)) {}
	};

} // namespace fixpack::codec

namespace std {
	template <>
	struct is_error_code_enum<fixpack::codec::errc> : true_type {};
} // namespace std
