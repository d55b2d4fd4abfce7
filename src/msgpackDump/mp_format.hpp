#pragma once

#include "mp_common.h"

//
// The msgpack leading byte table.
//
// Each value starts with one byte that says both what kind of value follows and exactly how it is
// laid out on the wire. We keep the exact encoding name around (FixStr vs Str8 etc) because the whole
// point of the printer is to show how something was encoded, not just what it decodes to.
//

namespace mpdump {

	enum class Category : uint8_t {
		Integer, Nil, Boolean, Float, String, Binary, Array, Map, Extension, Unsupported
	};

	namespace Code {
		constexpr byte MinPositiveFixInt = 0x00;
		constexpr byte MaxPositiveFixInt = 0x7f;
		constexpr byte MinFixMap         = 0x80;
		constexpr byte MaxFixMap         = 0x8f;
		constexpr byte MinFixArray       = 0x90;
		constexpr byte MaxFixArray       = 0x9f;
		constexpr byte MinFixStr         = 0xa0;
		constexpr byte MaxFixStr         = 0xbf;
		constexpr byte Nil               = 0xc0;
		constexpr byte NeverUsed         = 0xc1;
		constexpr byte False             = 0xc2;
		constexpr byte True              = 0xc3;
		constexpr byte Bin8              = 0xc4;
		constexpr byte Bin16             = 0xc5;
		constexpr byte Bin32             = 0xc6;
		constexpr byte Ext8              = 0xc7;
		constexpr byte Ext16             = 0xc8;
		constexpr byte Ext32             = 0xc9;
		constexpr byte Float32           = 0xca;
		constexpr byte Float64           = 0xcb;
		constexpr byte UInt8             = 0xcc;
		constexpr byte UInt16            = 0xcd;
		constexpr byte UInt32            = 0xce;
		constexpr byte UInt64            = 0xcf;
		constexpr byte Int8              = 0xd0;
		constexpr byte Int16             = 0xd1;
		constexpr byte Int32             = 0xd2;
		constexpr byte Int64             = 0xd3;
		constexpr byte FixExt1           = 0xd4;
		constexpr byte FixExt2           = 0xd5;
		constexpr byte FixExt4           = 0xd6;
		constexpr byte FixExt8           = 0xd7;
		constexpr byte FixExt16          = 0xd8;
		constexpr byte Str8              = 0xd9;
		constexpr byte Str16             = 0xda;
		constexpr byte Str32             = 0xdb;
		constexpr byte Array16           = 0xdc;
		constexpr byte Array32           = 0xdd;
		constexpr byte Map16             = 0xde;
		constexpr byte Map32             = 0xdf;
		constexpr byte MinNegativeFixInt = 0xe0;
		constexpr byte MaxNegativeFixInt = 0xff;
	}

	inline Category classify(byte code) {
		if (code <= Code::MaxPositiveFixInt) return Category::Integer;
		if (code <= Code::MaxFixMap) return Category::Map;
		if (code <= Code::MaxFixArray) return Category::Array;
		if (code <= Code::MaxFixStr) return Category::String;
		if (code >= Code::MinNegativeFixInt) return Category::Integer;

		switch (code) {
			case Code::Nil: return Category::Nil;
			case Code::False:
			case Code::True: return Category::Boolean;
			case Code::Bin8:
			case Code::Bin16:
			case Code::Bin32: return Category::Binary;
			case Code::Ext8:
			case Code::Ext16:
			case Code::Ext32:
			case Code::FixExt1:
			case Code::FixExt2:
			case Code::FixExt4:
			case Code::FixExt8:
			case Code::FixExt16: return Category::Extension;
			case Code::Float32:
			case Code::Float64: return Category::Float;
			case Code::UInt8:
			case Code::UInt16:
			case Code::UInt32:
			case Code::UInt64:
			case Code::Int8:
			case Code::Int16:
			case Code::Int32:
			case Code::Int64: return Category::Integer;
			case Code::Str8:
			case Code::Str16:
			case Code::Str32: return Category::String;
			case Code::Array16:
			case Code::Array32: return Category::Array;
			case Code::Map16:
			case Code::Map32: return Category::Map;
			default: return Category::Unsupported;
		}
	}

	inline const char* formatName(byte code) {
		if (code <= Code::MaxPositiveFixInt) return "PositiveFixInt";
		if (code <= Code::MaxFixMap) return "FixMap";
		if (code <= Code::MaxFixArray) return "FixArray";
		if (code <= Code::MaxFixStr) return "FixStr";
		if (code >= Code::MinNegativeFixInt) return "NegativeFixInt";

		// 0xc0 .. 0xdf, in order.
		static const char* const kNames[] = {
			"Nil", "NeverUsed", "False", "True",
			"Bin8", "Bin16", "Bin32",
			"Ext8", "Ext16", "Ext32",
			"Float32", "Float64",
			"UInt8", "UInt16", "UInt32", "UInt64",
			"Int8", "Int16", "Int32", "Int64",
			"FixExt1", "FixExt2", "FixExt4", "FixExt8", "FixExt16",
			"Str8", "Str16", "Str32",
			"Array16", "Array32",
			"Map16", "Map32",
		};
		static_assert(sizeof(kNames) / sizeof(kNames[0]) == Code::Map32 - Code::Nil + 1);
		return kNames[code - Code::Nil];
	}

	inline bool isSignedInteger(byte code) {
		switch (code) {
			case Code::Int8:
			case Code::Int16:
			case Code::Int32:
			case Code::Int64:
				return true;
			default:
				return code >= Code::MinNegativeFixInt;
		}
	}

	inline const char* categoryName(Category c) {
		switch (c) {
			case Category::Integer: return "integer";
			case Category::Nil: return "nil";
			case Category::Boolean: return "boolean";
			case Category::Float: return "float";
			case Category::String: return "string";
			case Category::Binary: return "binary";
			case Category::Array: return "array";
			case Category::Map: return "map";
			case Category::Extension: return "extension";
			case Category::Unsupported: return "unsupported";
		}
		return "unknown";
	}

}
