#pragma once

#include <cstring>
#include <istream>
#include <string>
#include <type_traits>
#include <vector>

#include "mp_common.h"

namespace mpdump {

	// The whole input, owned by one conversion run.
	using ByteBuffer = std::vector<byte>;

	//
	// Pull everything out of `is` before any decoding happens.
	// Reads `chunkSize` bytes at a time until a read comes back empty.
	//
	inline ByteBuffer readAll(std::istream& is, size_t chunkSize = kReadChunkSize) {
		ByteBuffer out;
		std::vector<char> chunk(chunkSize == 0 ? kReadChunkSize : chunkSize);

		std::streamsize n = 0;
		do {
			is.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
			if (is.bad()) throw IoError("failed reading input after " + std::to_string(out.size()) + " bytes");
			n = is.gcount();
			out.insert(out.end(), chunk.data(), chunk.data() + n);
			mpdumpPrintf(" - readAll: chunk of %ld bytes (total %zu)\n", (long)n, out.size());
		} while (n > 0);

		return out;
	}

	//
	// A view into the input with a cursor that only moves forward.
	// Every read checks that enough bytes are left and throws FormatError otherwise, so a
	// truncated input can never read past the end.
	//
	struct BinStreamBuffer {
		inline BinStreamBuffer(const byte* data, size_t len)
			: data(data)
			, len(len) {
		}
		inline explicit BinStreamBuffer(const ByteBuffer& buf) : data(buf.data()), len(buf.size()) {}
		inline BinStreamBuffer() : data(0), len(0) {}

		const byte* data = 0;
		size_t len = 0;
		size_t cursor_ = 0;

		inline size_t cursor() const { return cursor_; }
		inline size_t size() const { return len; }
		inline size_t remaining() const { return len - cursor_; }

		inline bool hasMore(size_t n = 1) const {
			return n <= remaining();
		}

		inline void require(size_t n, const char* what) const {
			if (!hasMore(n)) {
				throw FormatError(std::string{"truncated "} + what + ": need " + std::to_string(n) +
								  " bytes, " + std::to_string(remaining()) + " remain",
								  cursor_);
			}
		}

		inline byte nextByte(const char* what = "value") {
			require(1, what);
			return data[cursor_++];
		}

		// Reads a big-endian unsigned integer of the width of V.
		template <class V> inline V nextValue(const char* what = "value") {
			static_assert(std::is_unsigned<V>::value, "nextValue reads unsigned integers; reinterpret afterwards.");
			require(sizeof(V), what);
			V v;
			memcpy(&v, data + cursor_, sizeof(V));
			cursor_ += sizeof(V);
			return ntoh(v);
		}

		// Returns a pointer into the input; valid as long as the input is.
		inline const byte* nextBytes(size_t n, const char* what = "value") {
			require(n, what);
			auto ptr = data + cursor_;
			cursor_ += n;
			return ptr;
		}
	};

}
