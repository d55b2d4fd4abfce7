#pragma once

#include <cstdint>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

#include <arpa/inet.h>

// Define MPDUMP_TRACE (cmake -DMSGPACKDUMP_TRACE=ON) to trace every decode step on stderr.
#ifdef MPDUMP_TRACE
#define mpdumpPrintf(...) fprintf(stderr, __VA_ARGS__);
#else
#define mpdumpPrintf(...) {}
#endif

namespace mpdump {

    using byte                         = uint8_t;

    constexpr int    kPositionWidth    = 6;
    constexpr int    kDefaultMaxDepth  = 512;
    constexpr int    kMaxDepthLimit    = 2000;  // one stack frame per level; higher settings are clamped
    constexpr size_t kReadChunkSize    = 1024;

	//
	// Thrown when the input is not valid msgpack: a header or payload is cut short, the
	// reserved 0xC1 byte shows up, or values nest deeper than the printer allows.
	//
	// `offset` is the absolute position in the input where decoding gave up.
	//
	struct FormatError : public std::runtime_error {
		size_t offset;

		inline FormatError(const std::string& msg, size_t offset)
			: std::runtime_error(msg + " (at offset " + std::to_string(offset) + ")")
			, offset(offset) {
		}
	};

	// Reading the input or writing a line failed.
	struct IoError : public std::runtime_error {
		using std::runtime_error::runtime_error;
	};

    inline uint64_t ntohll(uint64_t v) {
        if (ntohl(1u) == 1u) return v; // big-endian host
        uint64_t hi = ntohl(static_cast<uint32_t>(v & 0xffff'ffffu));
        uint64_t lo = ntohl(static_cast<uint32_t>(v >> 32));
        return (hi << 32) | lo;
    }

    inline uint8_t ntoh(const uint8_t& v) {
        return v;
    }
    inline uint16_t ntoh(const uint16_t& v) {
        return ntohs(v);
    }
    inline uint32_t ntoh(const uint32_t& v) {
        return ntohl(v);
    }
    inline uint64_t ntoh(const uint64_t& v) {
        return ntohll(v);
    }

}
