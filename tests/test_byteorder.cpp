// tests/test_byteorder.cpp
#include "tests.hpp"
#include <array>
#include <random>
#include <limits>
#include <type_traits>

#include "fixpack/core/byteorder.hpp"

using namespace fixpack::core::byteorder;
using fixpack_tests::make_bytes;
using fixpack_tests::same_bytes;

TEST_SUITE("byteorder (little-endian words)") {

	template <typename T>
	void check_layout(T value, std::initializer_list<unsigned> expected) {
		std::array<fixpack::core::byte, sizeof(T)> buf{};
		native_to_le<T>(value, buf.data());
		CHECK(same_bytes(buf, make_bytes(expected)));
		CHECK(le_to_native<T>(buf.data()) == value);
	}

	TEST_CASE("least significant byte first, unsigned") {
		SUBCASE("uint8") { check_layout<std::uint8_t>(0xA5u, { 0xA5 }); }
		SUBCASE("uint16") { check_layout<std::uint16_t>(0x1122u, { 0x22, 0x11 }); }
		SUBCASE("uint32") { check_layout<std::uint32_t>(0x11223344u, { 0x44, 0x33, 0x22, 0x11 }); }
		SUBCASE("uint64") {
			check_layout<std::uint64_t>(0x1122334455667788ull,
				{ 0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11 });
		}
	}

	TEST_CASE("two's complement, signed") {
		SUBCASE("int8") { check_layout<std::int8_t>(-1, { 0xFF }); }
		SUBCASE("int16") { check_layout<std::int16_t>(-2, { 0xFE, 0xFF }); }
		SUBCASE("int32") { check_layout<std::int32_t>(-0x1020304, { 0xFC, 0xFC, 0xFD, 0xFE }); }
		SUBCASE("int64") {
			check_layout<std::int64_t>(std::numeric_limits<std::int64_t>::min(),
				{ 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80 });
		}
	}

#if defined(FIXPACK_HAS_INT128)
	TEST_CASE("128-bit words") {
		using fixpack::core::uint128;
		using fixpack::core::int128;

		SUBCASE("uint128") {
			const uint128 value = (static_cast<uint128>(0x0102030405060708ull) << 64) | 0x090A0B0C0D0E0F10ull;
			check_layout<uint128>(value, {
				0x10, 0x0F, 0x0E, 0x0D, 0x0C, 0x0B, 0x0A, 0x09,
				0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01 });
		}
		SUBCASE("int128") {
			check_layout<int128>(-1, {
				0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
				0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF });
		}
	}
#endif

	TEST_CASE("word concepts") {
		static_assert(Word<std::uint8_t>);
		static_assert(Word<std::int64_t>);
		static_assert(UnsignedWord<std::uint32_t>);
		static_assert(SignedWord<std::int16_t>);
		static_assert(!Word<bool>);
		static_assert(!Word<float>);
		static_assert(!Word<char>);
		CHECK(true);
	}

	TEST_CASE("fuzz roundtrip all integer types") {
		std::mt19937_64 rng{ 987654321ULL };

		auto fuzz = [&](auto tag) {
			using T = decltype(tag);
			std::array<fixpack::core::byte, sizeof(T)> buf{};

			if constexpr (std::is_signed_v<T>) {
				std::uniform_int_distribution<long long> dist(
					(long long)std::numeric_limits<T>::lowest(),
					(long long)std::numeric_limits<T>::max());

				for (int i = 0; i < 3000; ++i) {
					T val = static_cast<T>(dist(rng));
					native_to_le<T>(val, buf.data());
					CHECK(le_to_native<T>(buf.data()) == val);
				}
			}
			else {
				std::uniform_int_distribution<unsigned long long> dist(
					0ULL, static_cast<unsigned long long>(std::numeric_limits<T>::max()));

				for (int i = 0; i < 3000; ++i) {
					T val = static_cast<T>(dist(rng));
					native_to_le<T>(val, buf.data());
					CHECK(le_to_native<T>(buf.data()) == val);
				}
			}
			};

		SUBCASE("unsigned") {
			fuzz(std::uint8_t{});
			fuzz(std::uint16_t{});
			fuzz(std::uint32_t{});
			fuzz(std::uint64_t{});
		}
		SUBCASE("signed") {
			fuzz(std::int8_t{});
			fuzz(std::int16_t{});
			fuzz(std::int32_t{});
			fuzz(std::int64_t{});
		}
	}
}
