#include <gtest/gtest.h>

#include <string>

#include "msgpackDump/mp_format.hpp"

using namespace mpdump;

namespace {
	struct Range {
		int lo, hi;
		const char* name;
		Category category;
	};

	// The full leading byte partition, in byte order.
	const Range kTable[] = {
		{0x00, 0x7f, "PositiveFixInt", Category::Integer},
		{0x80, 0x8f, "FixMap", Category::Map},
		{0x90, 0x9f, "FixArray", Category::Array},
		{0xa0, 0xbf, "FixStr", Category::String},
		{0xc0, 0xc0, "Nil", Category::Nil},
		{0xc1, 0xc1, "NeverUsed", Category::Unsupported},
		{0xc2, 0xc2, "False", Category::Boolean},
		{0xc3, 0xc3, "True", Category::Boolean},
		{0xc4, 0xc4, "Bin8", Category::Binary},
		{0xc5, 0xc5, "Bin16", Category::Binary},
		{0xc6, 0xc6, "Bin32", Category::Binary},
		{0xc7, 0xc7, "Ext8", Category::Extension},
		{0xc8, 0xc8, "Ext16", Category::Extension},
		{0xc9, 0xc9, "Ext32", Category::Extension},
		{0xca, 0xca, "Float32", Category::Float},
		{0xcb, 0xcb, "Float64", Category::Float},
		{0xcc, 0xcc, "UInt8", Category::Integer},
		{0xcd, 0xcd, "UInt16", Category::Integer},
		{0xce, 0xce, "UInt32", Category::Integer},
		{0xcf, 0xcf, "UInt64", Category::Integer},
		{0xd0, 0xd0, "Int8", Category::Integer},
		{0xd1, 0xd1, "Int16", Category::Integer},
		{0xd2, 0xd2, "Int32", Category::Integer},
		{0xd3, 0xd3, "Int64", Category::Integer},
		{0xd4, 0xd4, "FixExt1", Category::Extension},
		{0xd5, 0xd5, "FixExt2", Category::Extension},
		{0xd6, 0xd6, "FixExt4", Category::Extension},
		{0xd7, 0xd7, "FixExt8", Category::Extension},
		{0xd8, 0xd8, "FixExt16", Category::Extension},
		{0xd9, 0xd9, "Str8", Category::String},
		{0xda, 0xda, "Str16", Category::String},
		{0xdb, 0xdb, "Str32", Category::String},
		{0xdc, 0xdc, "Array16", Category::Array},
		{0xdd, 0xdd, "Array32", Category::Array},
		{0xde, 0xde, "Map16", Category::Map},
		{0xdf, 0xdf, "Map32", Category::Map},
		{0xe0, 0xff, "NegativeFixInt", Category::Integer},
	};
}

TEST(Format, EveryLeadingByteMatchesTheTable) {
	int covered = 0;
	for (const auto& r : kTable) {
		for (int b = r.lo; b <= r.hi; b++) {
			EXPECT_EQ(std::string{formatName(static_cast<byte>(b))}, r.name) << "byte " << b;
			EXPECT_EQ(classify(static_cast<byte>(b)), r.category) << "byte " << b;
			covered++;
		}
	}
	EXPECT_EQ(covered, 256);
}

TEST(Format, SignedIntegers) {
	EXPECT_TRUE(isSignedInteger(Code::Int8));
	EXPECT_TRUE(isSignedInteger(Code::Int16));
	EXPECT_TRUE(isSignedInteger(Code::Int32));
	EXPECT_TRUE(isSignedInteger(Code::Int64));
	EXPECT_TRUE(isSignedInteger(0xe0));
	EXPECT_TRUE(isSignedInteger(0xff));

	EXPECT_FALSE(isSignedInteger(0x00));
	EXPECT_FALSE(isSignedInteger(0x7f));
	EXPECT_FALSE(isSignedInteger(Code::UInt8));
	EXPECT_FALSE(isSignedInteger(Code::UInt64));
	EXPECT_FALSE(isSignedInteger(Code::Map32));
}

TEST(Format, CategoryNames) {
	EXPECT_STREQ(categoryName(Category::Extension), "extension");
	EXPECT_STREQ(categoryName(classify(Code::NeverUsed)), "unsupported");
}
