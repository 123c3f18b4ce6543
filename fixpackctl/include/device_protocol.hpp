/*
 * File: device_protocol.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <variant>

#include "fixpack/fixpack.hpp"

// Request/response messages of a small sensor board, used by the inspector.
namespace fixpackctl::protocol {

	struct ping {
		static constexpr auto fixpack_fields() { return std::make_tuple(); }
		friend bool operator == (const ping&, const ping&) = default;
	};

	struct set_led {
		std::uint8_t index = 0;
		bool on = false;

		static constexpr auto fixpack_fields() { return std::make_tuple(&set_led::index, &set_led::on); }
		friend bool operator == (const set_led&, const set_led&) = default;
	};

	struct read_sensor {
		std::uint8_t channel = 0;

		static constexpr auto fixpack_fields() { return std::make_tuple(&read_sensor::channel); }
		friend bool operator == (const read_sensor&, const read_sensor&) = default;
	};

	struct reset {
		std::optional<std::uint16_t> delay_ms{};

		static constexpr auto fixpack_fields() { return std::make_tuple(&reset::delay_ms); }
		friend bool operator == (const reset&, const reset&) = default;
	};

	using request = std::variant<ping, set_led, read_sensor, reset>;

	constexpr inline std::array<std::string_view, std::variant_size_v<request>> request_names = {
		"ping", "set_led", "read_sensor", "reset",
	};

	struct pong {
		std::uint32_t uptime_s = 0;

		static constexpr auto fixpack_fields() { return std::make_tuple(&pong::uptime_s); }
		friend bool operator == (const pong&, const pong&) = default;
	};

	struct ack {
		static constexpr auto fixpack_fields() { return std::make_tuple(); }
		friend bool operator == (const ack&, const ack&) = default;
	};

	struct sensor_reading {
		std::uint8_t channel = 0;
		float value = 0.0f;
		std::uint64_t timestamp = 0;

		static constexpr auto fixpack_fields() {
			return std::make_tuple(&sensor_reading::channel, &sensor_reading::value, &sensor_reading::timestamp);
		}
		friend bool operator == (const sensor_reading&, const sensor_reading&) = default;
	};

	enum class fault_code : std::uint8_t {
		none = 0,
		overheat = 1,
		undervoltage = 2,
		bad_request = 3,
	};

	constexpr inline std::array<std::string_view, 4> fault_code_names = {
		"none", "overheat", "undervoltage", "bad_request",
	};

	struct fault {
		fault_code code = fault_code::none;
		std::array<std::uint8_t, 4> detail{};

		static constexpr auto fixpack_fields() { return std::make_tuple(&fault::code, &fault::detail); }
		friend bool operator == (const fault&, const fault&) = default;
	};

	using response = std::variant<pong, ack, sensor_reading, fault>;

	constexpr inline std::array<std::string_view, std::variant_size_v<response>> response_names = {
		"pong", "ack", "sensor_reading", "fault",
	};

} // namespace fixpackctl::protocol

namespace fixpack::codec {
	template <>
	struct enum_traits<fixpackctl::protocol::fault_code> {
		static constexpr std::size_t count = fixpackctl::protocol::fault_code_names.size();
	};
} // namespace fixpack::codec
