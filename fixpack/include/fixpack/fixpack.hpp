/*
 * File: fixpack.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include "fixpack/core/bytes.hpp"
#include "fixpack/core/byteorder.hpp"
#include "fixpack/codec/errors.hpp"
#include "fixpack/codec/cursor.hpp"
#include "fixpack/codec/serializer.hpp"
#include "fixpack/codec/size.hpp"
#include "fixpack/codec/composite.hpp"
#include "fixpack/codec/record.hpp"
#include "fixpack/codec/variant.hpp"
#include "fixpack/codec/serialize.hpp"

namespace fixpack {

	using core::byte;
	using core::byte_view;
	using core::byte_span;

	using codec::errc;
	using codec::codec_error;
	using codec::Encodable;
	using codec::max_size_v;
	using codec::buffer_for;
	using codec::encoded_size;
	using codec::serialize;
	using codec::deserialize;

} // namespace fixpack
