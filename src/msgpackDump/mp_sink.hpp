#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "mp_common.h"

namespace mpdump {

	//
	// Where rendered lines go. One call per line, in order, nothing is ever read back.
	//
	struct LineSink {
		virtual ~LineSink() = default;
		virtual void writeLine(std::string_view line) = 0;
	};

	// Writes to a std::ostream and flushes after every line, so nothing is held back if we die mid-way.
	struct OstreamLineSink : public LineSink {
		std::ostream& os;

		inline explicit OstreamLineSink(std::ostream& os) : os(os) {}

		inline void writeLine(std::string_view line) override {
			os.write(line.data(), static_cast<std::streamsize>(line.size()));
			os.put('\n');
			os.flush();
			if (!os) throw IoError("failed writing output");
		}
	};

	struct StringLineSink : public LineSink {
		std::vector<std::string> lines;

		inline void writeLine(std::string_view line) override {
			lines.emplace_back(line);
		}
	};

}
