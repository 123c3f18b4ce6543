/*
 * File: messages.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "device_protocol.hpp"

namespace fixpackctl {

	class parse_error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	namespace detail {

		template <typename NumberT>
		NumberT parse_number(std::string_view text, std::string_view field) {
			NumberT value{};
			const char* first = text.data();
			const char* last = text.data() + text.size();
			const auto [ptr, ec] = std::from_chars(first, last, value);
			if (ec != std::errc{} || ptr != last) {
				throw parse_error(std::format("bad value for {}: '{}'", field, text));
			}
			return value;
		}

		inline bool parse_flag(std::string_view text, std::string_view field) {
			if (text == "on" || text == "true" || text == "1") {
				return true;
			}
			if (text == "off" || text == "false" || text == "0") {
				return false;
			}
			throw parse_error(std::format("bad value for {}: '{}' (expected on/off)", field, text));
		}

		inline protocol::fault_code parse_fault_code(std::string_view text) {
			for (std::size_t i = 0; i < protocol::fault_code_names.size(); ++i) {
				if (protocol::fault_code_names[i] == text) {
					return static_cast<protocol::fault_code>(i);
				}
			}
			throw parse_error(std::format("unknown fault code '{}'", text));
		}

		// args[0] is the variant name, the rest are its fields.
		inline void expect_fields(const std::vector<std::string>& args, std::size_t min, std::size_t max, std::string_view usage) {
			const auto fields = args.size() - 1;
			if (fields < min || fields > max) {
				throw parse_error(std::format("usage: {}", usage));
			}
		}
	}

	inline protocol::request parse_request(const std::vector<std::string>& args) {
		if (args.empty()) {
			throw parse_error("missing request variant");
		}
		const auto& name = args[0];
		if (name == "ping") {
			detail::expect_fields(args, 0, 0, "ping");
			return protocol::ping{};
		}
		if (name == "set_led") {
			detail::expect_fields(args, 2, 2, "set_led <index> <on|off>");
			return protocol::set_led{
				detail::parse_number<std::uint8_t>(args[1], "index"),
				detail::parse_flag(args[2], "on"),
			};
		}
		if (name == "read_sensor") {
			detail::expect_fields(args, 1, 1, "read_sensor <channel>");
			return protocol::read_sensor{ detail::parse_number<std::uint8_t>(args[1], "channel") };
		}
		if (name == "reset") {
			detail::expect_fields(args, 0, 1, "reset [delay_ms]");
			protocol::reset msg;
			if (args.size() > 1) {
				msg.delay_ms = detail::parse_number<std::uint16_t>(args[1], "delay_ms");
			}
			return msg;
		}
		throw parse_error(std::format("unknown request '{}'", name));
	}

	inline protocol::response parse_response(const std::vector<std::string>& args) {
		if (args.empty()) {
			throw parse_error("missing response variant");
		}
		const auto& name = args[0];
		if (name == "pong") {
			detail::expect_fields(args, 1, 1, "pong <uptime_s>");
			return protocol::pong{ detail::parse_number<std::uint32_t>(args[1], "uptime_s") };
		}
		if (name == "ack") {
			detail::expect_fields(args, 0, 0, "ack");
			return protocol::ack{};
		}
		if (name == "sensor_reading") {
			detail::expect_fields(args, 3, 3, "sensor_reading <channel> <value> <timestamp>");
			return protocol::sensor_reading{
				detail::parse_number<std::uint8_t>(args[1], "channel"),
				detail::parse_number<float>(args[2], "value"),
				detail::parse_number<std::uint64_t>(args[3], "timestamp"),
			};
		}
		if (name == "fault") {
			detail::expect_fields(args, 1, 5, "fault <code> [detail bytes, up to 4]");
			protocol::fault msg;
			msg.code = detail::parse_fault_code(args[1]);
			for (std::size_t i = 2; i < args.size(); ++i) {
				msg.detail[i - 2] = detail::parse_number<std::uint8_t>(args[i], "detail");
			}
			return msg;
		}
		throw parse_error(std::format("unknown response '{}'", name));
	}

	inline std::string describe(const protocol::request& msg) {
		return std::visit([](const auto& m) -> std::string {
			using message_type = std::decay_t<decltype(m)>;
			if constexpr (std::is_same_v<message_type, protocol::ping>) {
				return "ping";
			}
			else if constexpr (std::is_same_v<message_type, protocol::set_led>) {
				return std::format("set_led index={} on={}", m.index, m.on);
			}
			else if constexpr (std::is_same_v<message_type, protocol::read_sensor>) {
				return std::format("read_sensor channel={}", m.channel);
			}
			else {
				return m.delay_ms ? std::format("reset delay_ms={}", *m.delay_ms) : std::string("reset");
			}
		}, msg);
	}

	inline std::string describe(const protocol::response& msg) {
		return std::visit([](const auto& m) -> std::string {
			using message_type = std::decay_t<decltype(m)>;
			if constexpr (std::is_same_v<message_type, protocol::pong>) {
				return std::format("pong uptime_s={}", m.uptime_s);
			}
			else if constexpr (std::is_same_v<message_type, protocol::ack>) {
				return "ack";
			}
			else if constexpr (std::is_same_v<message_type, protocol::sensor_reading>) {
				return std::format("sensor_reading channel={} value={} timestamp={}", m.channel, m.value, m.timestamp);
			}
			else {
				const auto code = protocol::fault_code_names[static_cast<std::size_t>(m.code)];
				return std::format("fault code={} detail=[{} {} {} {}]", code,
					m.detail[0], m.detail[1], m.detail[2], m.detail[3]);
			}
		}, msg);
	}

} // namespace fixpackctl
