#pragma once

#include "options.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace lz4framed::cli {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInputOpen = 2;
constexpr int kExitOutputOpen = 4;
constexpr int kExitFraming = 8;
constexpr int kExitIo = 16;

struct Options {
    bool compress = true;
    std::string input;  // "-" => stdin
    std::string output; // empty => stdout
    FrameOptions frame;
};

void print_usage(std::ostream& err);

// args excludes the program name. Throws std::runtime_error or lz4framed::Error on bad arguments.
Options parse_args(const std::vector<std::string>& args);

void do_compress(std::istream& in, std::ostream& out, const FrameOptions& frame);
void do_decompress(std::istream& in, std::ostream& out);

// Runs one command and returns its exit code. in/out stand in for "-" and a missing OUTFILE.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace lz4framed::cli
