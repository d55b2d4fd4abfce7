#pragma once

#include <charconv>
#include <cstring>
#include <istream>
#include <string>

#include "mp_common.h"
#include "mp_format.hpp"
#include "mp_sink.hpp"
#include "mp_stream.hpp"

//
// Turns a msgpack byte stream into one line of text per value:
//
//     [<offset> ]<indent>[<FormatName>] <decoded>
//
// The printer decodes and prints in the same pass. An array or map prints its header line, then
// recurses into its children one level deeper, so lines come out in pre-order. No tree is ever
// built: memory is the input buffer plus one stack frame per nesting level.
//

namespace mpdump {

	struct PrinterOptions {
		bool includePositions = false;
		int maxDepth = kDefaultMaxDepth; // never more than kMaxDepthLimit
	};

	//
	// One decoded value, right before it is rendered.
	// For arrays and maps [begin,end) only covers the header, since the line is written before
	// the children are decoded.
	//
	struct Token {
		byte code;
		Category category;
		size_t begin;
		size_t end;
		int level;
		std::string text;
	};

	inline std::string toHex(const byte* data, size_t len) {
		static const char kDigits[] = "0123456789ABCDEF";
		std::string out(len * 2, '0');
		for (size_t i = 0; i < len; i++) {
			out[2 * i]     = kDigits[data[i] >> 4];
			out[2 * i + 1] = kDigits[data[i] & 0x0f];
		}
		return out;
	}

	// Shortest text that parses back to the same value of type F.
	template <class F> inline std::string formatFloat(F v) {
		char buf[64];
		auto res = std::to_chars(buf, buf + sizeof(buf), v);
		return std::string(buf, res.ptr);
	}

	inline std::string renderLine(const Token& t, const PrinterOptions& opts) {
		std::string line;
		if (opts.includePositions) {
			std::string pos = std::to_string(t.begin);
			if (pos.size() < static_cast<size_t>(kPositionWidth)) line.append(kPositionWidth - pos.size(), ' ');
			line += pos;
			line += ' ';
		}
		line.append(static_cast<size_t>(t.level) * 2, ' ');
		line += '[';
		line += formatName(t.code);
		line += "] ";
		line += t.text;
		return line;
	}

	struct TextPrinter {
		BinStreamBuffer strm;
		LineSink& sink;
		PrinterOptions opts;
		size_t linesEmitted = 0;

		inline TextPrinter(BinStreamBuffer strm, LineSink& sink, PrinterOptions opts = {})
			: strm(strm)
			, sink(sink)
			, opts(opts) {
		}

		// Prints every top level value. Returns the number of lines written.
		size_t printAll();

		// Decodes exactly one value (and, for arrays and maps, everything inside it).
		void printOne(int level);

		private:

		void emit(byte code, Category category, size_t begin, int level, std::string&& text);

		uint64_t readLength(byte code, const char* name);
		uint64_t readUnsigned(byte code, const char* name);
		int64_t readSigned(byte code, const char* name);
	};

	inline size_t TextPrinter::printAll() {
		while (strm.hasMore()) {
			printOne(0);
		}
		return linesEmitted;
	}

	inline void TextPrinter::printOne(int level) {
		const int maxDepth = opts.maxDepth < kMaxDepthLimit ? opts.maxDepth : kMaxDepthLimit;
		if (level > maxDepth) {
			throw FormatError("values nest deeper than " + std::to_string(maxDepth) + " levels", strm.cursor());
		}

		const size_t begin = strm.cursor();
		const byte code = strm.nextByte();
		const char* name = formatName(code);
		const Category category = classify(code);
		mpdumpPrintf(" - printOne() [level %d] [offset %zu] [code 0x%02x %s, %s]\n", level, begin, code, name, categoryName(category));

		switch (category) {

			case Category::Integer: {
				if (isSignedInteger(code))
					emit(code, category, begin, level, std::to_string(readSigned(code, name)));
				else
					emit(code, category, begin, level, std::to_string(readUnsigned(code, name)));
				break;
			}

			case Category::Nil:
				emit(code, category, begin, level, "nil");
				break;

			case Category::Boolean:
				emit(code, category, begin, level, code == Code::True ? "true" : "false");
				break;

			case Category::Float: {
				if (code == Code::Float32) {
					uint32_t bits = strm.nextValue<uint32_t>(name);
					float v;
					memcpy(&v, &bits, sizeof(v));
					emit(code, category, begin, level, formatFloat(v));
				} else {
					uint64_t bits = strm.nextValue<uint64_t>(name);
					double v;
					memcpy(&v, &bits, sizeof(v));
					emit(code, category, begin, level, formatFloat(v));
				}
				break;
			}

			case Category::String: {
				uint64_t len = code <= Code::MaxFixStr ? (code & 0b1'1111) : readLength(code, name);
				const byte* p = strm.nextBytes(len, name);
				// Printed as is: embedded quotes and control characters are not escaped.
				std::string text;
				text.reserve(len + 2);
				text += '"';
				text.append(reinterpret_cast<const char*>(p), len);
				text += '"';
				emit(code, category, begin, level, std::move(text));
				break;
			}

			case Category::Binary: {
				uint64_t len = readLength(code, name);
				const byte* p = strm.nextBytes(len, name);
				emit(code, category, begin, level, toHex(p, len));
				break;
			}

			case Category::Array: {
				uint64_t n = code <= Code::MaxFixArray ? (code & 0b1111) : readLength(code, name);
				emit(code, category, begin, level, "array(" + std::to_string(n) + ")");
				for (uint64_t i = 0; i < n; i++) {
					printOne(level + 1);
				}
				break;
			}

			case Category::Map: {
				uint64_t n = code <= Code::MaxFixMap ? (code & 0b1111) : readLength(code, name);
				emit(code, category, begin, level, "map(" + std::to_string(n) + ")");
				for (uint64_t i = 0; i < n; i++) {
					printOne(level + 1); // key
					printOne(level + 1); // value
				}
				break;
			}

			case Category::Extension: {
				uint64_t len;
				switch (code) {
					case Code::FixExt1: len = 1; break;
					case Code::FixExt2: len = 2; break;
					case Code::FixExt4: len = 4; break;
					case Code::FixExt8: len = 8; break;
					case Code::FixExt16: len = 16; break;
					default: len = readLength(code, name); break;
				}
				int typeCode = static_cast<int8_t>(strm.nextByte(name));
				const byte* p = strm.nextBytes(len, name);
				emit(code, category, begin, level,
					 "typecode=" + std::to_string(typeCode) + ", length=" + std::to_string(len) + ", " + toHex(p, len));
				break;
			}

			case Category::Unsupported:
				// Nothing says how long a reserved value is, so there is no way to skip it.
				throw FormatError(std::string{"reserved leading byte 0xC1 ("} + name + ", " + categoryName(category) + ")", begin);
		}
	}

	inline void TextPrinter::emit(byte code, Category category, size_t begin, int level, std::string&& text) {
		Token t { code, category, begin, strm.cursor(), level, std::move(text) };
		sink.writeLine(renderLine(t, opts));
		linesEmitted++;
	}

	// The explicit length or count field of Str8/16/32, Bin8/16/32, Ext8/16/32, Array16/32 and Map16/32.
	inline uint64_t TextPrinter::readLength(byte code, const char* name) {
		switch (code) {
			case Code::Str8:
			case Code::Bin8:
			case Code::Ext8:
				return strm.nextValue<uint8_t>(name);
			case Code::Str16:
			case Code::Bin16:
			case Code::Ext16:
			case Code::Array16:
			case Code::Map16:
				return strm.nextValue<uint16_t>(name);
			case Code::Str32:
			case Code::Bin32:
			case Code::Ext32:
			case Code::Array32:
			case Code::Map32:
				return strm.nextValue<uint32_t>(name);
		}
		throw std::logic_error(std::string{"no length field for "} + name);
	}

	inline uint64_t TextPrinter::readUnsigned(byte code, const char* name) {
		switch (code) {
			case Code::UInt8: return strm.nextValue<uint8_t>(name);
			case Code::UInt16: return strm.nextValue<uint16_t>(name);
			case Code::UInt32: return strm.nextValue<uint32_t>(name);
			case Code::UInt64: return strm.nextValue<uint64_t>(name);
		}
		return code; // PositiveFixInt
	}

	inline int64_t TextPrinter::readSigned(byte code, const char* name) {
		switch (code) {
			case Code::Int8: return static_cast<int8_t>(strm.nextValue<uint8_t>(name));
			case Code::Int16: return static_cast<int16_t>(strm.nextValue<uint16_t>(name));
			case Code::Int32: return static_cast<int32_t>(strm.nextValue<uint32_t>(name));
			case Code::Int64: return static_cast<int64_t>(strm.nextValue<uint64_t>(name));
		}
		return static_cast<int8_t>(code); // NegativeFixInt
	}

	//
	// Reads `in` to the end, then prints it.
	// Lines already written stay in `out` if a FormatError is thrown part way through.
	//
	inline size_t convert(std::istream& in, LineSink& out, const PrinterOptions& opts = {}) {
		ByteBuffer input = readAll(in);
		mpdumpPrintf(" - convert(): %zu bytes of input\n", input.size());
		TextPrinter printer(BinStreamBuffer{input}, out, opts);
		return printer.printAll();
	}

}
