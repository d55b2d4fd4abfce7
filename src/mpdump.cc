#include <getopt.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "msgpackDump/mp_text_printer.hpp"

using namespace mpdump;

static void print_help(void) {
	std::cout << R"(Converts msgpack to a precise textual rendering.
Usage: mpdump [OPTIONS]

Every value is printed on its own line as

    [<offset> ]<indent>[<FormatName>] <decoded>

where FormatName is the exact msgpack encoding of the value (FixStr, UInt32,
Map16, ...). Arrays and maps print a header line followed by their elements,
indented two spaces deeper.

OPTIONS:
    -i, --input=<PATH>
                      The msgpack file to read.  Reads stdin if omitted.
    -o, --output=<PATH>
                      The file to write text to.  Writes stdout if omitted.
    --include-positions
                      Prefix each line with the byte offset of the value.
    -d, --max-depth=<N>
                      Fail once arrays and maps nest deeper than N levels.
                      Default: 512, at most 2000
    -h, --help        Display this help and exit.)"
			  << std::endl;
}

constexpr static int kIncludePositions = 256;

constexpr static struct option long_options[] = {
	{"input", required_argument, nullptr, 'i'},
	{"output", required_argument, nullptr, 'o'},
	{"include-positions", no_argument, nullptr, kIncludePositions},
	{"max-depth", required_argument, nullptr, 'd'},
	{"help", no_argument, nullptr, 'h'},
	{nullptr, 0, nullptr, 0}};

static bool parse_depth(const char* s, int& out) {
	char* end = nullptr;
	errno = 0;
	long v = strtol(s, &end, 10);
	if (errno != 0 or end == s or *end != '\0' or v < 0 or v > kMaxDepthLimit) return false;
	out = static_cast<int>(v);
	return true;
}

static int run(const std::string& inputPath, const std::string& outputPath, const PrinterOptions& opts) {
	std::ifstream ifs;
	std::istream* in = &std::cin;
	if (!inputPath.empty()) {
		ifs.open(inputPath, std::ios_base::in | std::ios_base::binary);
		if (!ifs) throw IoError("cannot open input file '" + inputPath + "'");
		in = &ifs;
	}

	std::ofstream ofs;
	std::ostream* out = &std::cout;
	if (!outputPath.empty()) {
		ofs.open(outputPath, std::ios_base::out | std::ios_base::trunc | std::ios_base::binary);
		if (!ofs) throw IoError("cannot open output file '" + outputPath + "'");
		out = &ofs;
	}

	OstreamLineSink sink(*out);
	convert(*in, sink, opts);
	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
	std::string inputPath;
	std::string outputPath;
	PrinterOptions opts;

	while (1) {
		int option_index = 0;
		int c = getopt_long(argc, argv, "d:hi:o:", long_options, &option_index);
		if (c == -1) {
			break;
		}
		switch (c) {
		case 'h':
			print_help();
			exit(EXIT_SUCCESS);
		case 'i':
			inputPath = optarg;
			break;
		case 'o':
			outputPath = optarg;
			break;
		case kIncludePositions:
			opts.includePositions = true;
			break;
		case 'd':
			if (!parse_depth(optarg, opts.maxDepth)) {
				fprintf(stderr, "mpdump: -d: Bad option value '%s'\n", optarg);
				exit(EXIT_FAILURE);
			}
			break;
		case '?':
			exit(EXIT_FAILURE);
		default:
			break;
		}
	}
	if (optind < argc) {
		fprintf(stderr, "mpdump: unexpected argument '%s'\n", argv[optind]);
		exit(EXIT_FAILURE);
	}

	try {
		return run(inputPath, outputPath, opts);
	} catch (const FormatError& e) {
		fprintf(stderr, "mpdump: format error: %s\n", e.what());
	} catch (const IoError& e) {
		fprintf(stderr, "mpdump: I/O error: %s\n", e.what());
	}
	return EXIT_FAILURE;
}
