#include "tests.hpp"
#include "device_protocol.hpp"
#include "messages.hpp"
#include "hex.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace {
	using namespace fixpackctl;
	using fixpack_tests::make_bytes;

	template <typename MessageT>
	std::string encode_hex(const MessageT& msg) {
		fixpack::buffer_for<MessageT> buf{};
		const auto used = fixpack::serialize(msg, buf);
		return hex::format(fixpack::byte_view(buf).first(used));
	}

	template <typename MessageT>
	MessageT decode_hex(std::string_view text, std::size_t expected_rest = 0) {
		const auto bytes = hex::parse(text);
		REQUIRE(bytes.has_value());
		auto [msg, rest] = fixpack::deserialize<MessageT>(*bytes);
		CHECK(rest.size() == expected_rest);
		return msg;
	}
}

TEST_SUITE("fixpackctl/device_protocol") {

	TEST_CASE("size bounds") {
		static_assert(fixpack::max_size_v<protocol::ping> == 0);
		static_assert(fixpack::max_size_v<protocol::set_led> == 2);
		static_assert(fixpack::max_size_v<protocol::read_sensor> == 1);
		static_assert(fixpack::max_size_v<protocol::reset> == 3);
		static_assert(fixpack::max_size_v<protocol::request> == 4);

		static_assert(fixpack::max_size_v<protocol::pong> == 4);
		static_assert(fixpack::max_size_v<protocol::ack> == 0);
		static_assert(fixpack::max_size_v<protocol::sensor_reading> == 13);
		static_assert(fixpack::max_size_v<protocol::fault> == 5);
		static_assert(fixpack::max_size_v<protocol::response> == 14);
		CHECK(true);
	}

	TEST_CASE("request wire format") {
		CHECK(encode_hex(protocol::request{ protocol::ping{} }) == "00");
		CHECK(encode_hex(protocol::request{ protocol::set_led{ 3, true } }) == "01 03 01");
		CHECK(encode_hex(protocol::request{ protocol::read_sensor{ 9 } }) == "02 09");
		CHECK(encode_hex(protocol::request{ protocol::reset{} }) == "03 00");
		CHECK(encode_hex(protocol::request{ protocol::reset{ std::uint16_t{ 300 } } }) == "03 01 2c 01");
	}

	TEST_CASE("response wire format") {
		CHECK(encode_hex(protocol::response{ protocol::pong{ 1 } }) == "00 01 00 00 00");
		CHECK(encode_hex(protocol::response{ protocol::ack{} }) == "01");
		CHECK(encode_hex(protocol::response{ protocol::sensor_reading{ 2, 1.0f, 5 } })
			== "02 02 00 00 80 3f 05 00 00 00 00 00 00 00");
		CHECK(encode_hex(protocol::response{ protocol::fault{ protocol::fault_code::undervoltage, { 0xDE, 0xAD, 0, 1 } } })
			== "03 02 de ad 00 01");
	}

	TEST_CASE("decode what the shell prints") {
		CHECK(describe(decode_hex<protocol::request>("01 03 01")) == "set_led index=3 on=true");
		CHECK(describe(decode_hex<protocol::request>("03 01 fa 00")) == "reset delay_ms=250");
		CHECK(describe(decode_hex<protocol::response>("03 01 01 02 00 00 ff", 1)) == "fault code=overheat detail=[1 2 0 0]");
	}

	TEST_CASE("malformed frames are rejected") {
		std::error_code ec;

		fixpack::deserialize<protocol::request>(make_bytes({ 0x04 }), ec);
		CHECK(ec == fixpack::errc::invalid);

		fixpack::deserialize<protocol::request>(make_bytes({ 0x01, 0x03, 0x02 }), ec);
		CHECK(ec == fixpack::errc::invalid);

		fixpack::deserialize<protocol::response>(make_bytes({ 0x03, 0x04, 0, 0, 0, 0 }), ec);
		CHECK(ec == fixpack::errc::invalid);

		fixpack::deserialize<protocol::response>(make_bytes({ 0x02, 0x01, 0x00 }), ec);
		CHECK(ec == fixpack::errc::buffer_too_small);
	}

	TEST_CASE("parsed requests round trip") {
		const std::vector<std::vector<std::string>> lines = {
			{ "ping" },
			{ "set_led", "1", "off" },
			{ "read_sensor", "255" },
			{ "reset", "65535" },
		};
		for (const auto& line : lines) {
			const auto msg = parse_request(line);
			fixpack::buffer_for<protocol::request> buf{};
			const auto used = fixpack::serialize(msg, buf);
			auto [back, rest] = fixpack::deserialize<protocol::request>(fixpack::byte_view(buf).first(used));
			CHECK(back == msg);
			CHECK(rest.empty());
			CHECK(protocol::request_names[back.index()] == line.front());
		}
	}

	TEST_CASE("name tables cover every alternative") {
		CHECK(protocol::request_names.size() == std::variant_size_v<protocol::request>);
		CHECK(protocol::response_names.size() == std::variant_size_v<protocol::response>);
		CHECK(protocol::fault_code_names[static_cast<std::size_t>(protocol::fault_code::bad_request)] == "bad_request");
	}
}
