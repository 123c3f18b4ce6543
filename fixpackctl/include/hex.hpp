/*
 * File: hex.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "fixpack/core/bytes.hpp"

namespace fixpackctl::hex {

	using fixpack::core::byte;
	using fixpack::core::byte_buffer;
	using fixpack::core::byte_view;

	// "01 2c 01"
	inline std::string format(byte_view data) {
		static constexpr char digits[] = "0123456789abcdef";
		std::string result;
		result.reserve(data.size() * 3);
		for (std::size_t i = 0; i < data.size(); ++i) {
			const auto value = std::to_integer<unsigned>(data[i]);
			if (i != 0) {
				result.push_back(' ');
			}
			result.push_back(digits[value >> 4]);
			result.push_back(digits[value & 0x0F]);
		}
		return result;
	}

	namespace detail {
		inline int digit_value(char ch) {
			if (ch >= '0' && ch <= '9') {
				return ch - '0';
			}
			if (ch >= 'a' && ch <= 'f') {
				return ch - 'a' + 10;
			}
			if (ch >= 'A' && ch <= 'F') {
				return ch - 'A' + 10;
			}
			return -1;
		}
	}

	// Whitespace between digits is ignored, so "012c01" and "01 2c 01" are
	// the same input. Odd digit counts and foreign characters give nullopt.
	inline std::optional<byte_buffer> parse(std::string_view text) {
		byte_buffer result;
		int high = -1;
		for (char ch : text) {
			if (std::isspace(static_cast<unsigned char>(ch))) {
				continue;
			}
			const int value = detail::digit_value(ch);
			if (value < 0) {
				return std::nullopt;
			}
			if (high < 0) {
				high = value;
			}
			else {
				result.push_back(static_cast<byte>((high << 4) | value));
				high = -1;
			}
		}
		if (high >= 0) {
			return std::nullopt;
		}
		return result;
	}

} // namespace fixpackctl::hex
