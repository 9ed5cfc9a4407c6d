#include "lz4framed/cli.hpp"

#include "lz4framed/block_size.hpp"
#include "lz4framed/errors.hpp"
#include "lz4framed/stream.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace lz4framed::cli {

void print_usage(std::ostream& err) {
    err << "USAGE: lz4framed (compress|decompress) (INFILE|-) [OUTFILE] [--level N]\n"
           "                 [--block-size 4..7] [--independent] [--checksum] [--block-checksum]\n"
           "\n"
           "(De)compresses an lz4 frame. Input is read from INFILE unless set to '-', in\n"
           "which case stdin is used. If OUTFILE is not specified, output goes to stdout;\n"
           "otherwise it is appended to OUTFILE.\n";
}

Options parse_args(const std::vector<std::string>& args) {
    if (args.size() < 2) throw std::runtime_error("Missing arguments");
    Options opt;
    const std::string_view action(args[0]);
    if (action == "compress") {
        opt.compress = true;
    } else if (action == "decompress") {
        opt.compress = false;
    } else {
        throw std::runtime_error("Unknown action: " + std::string(action));
    }
    opt.input = args[1];

    for (size_t i = 2; i < args.size(); ++i) {
        std::string_view arg(args[i]);
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Missing value for argument: " + std::string(arg));
            }
            return args[++i];
        };
        if (arg == "--level") {
            opt.frame.level = std::stoi(next());
        } else if (arg == "--block-size") {
            opt.frame.block_size_id = static_cast<BlockSizeId>(std::stoi(next()));
        } else if (arg == "--independent") {
            opt.frame.block_mode_linked = false;
        } else if (arg == "--checksum") {
            opt.frame.content_checksum = true;
        } else if (arg == "--block-checksum") {
            opt.frame.block_checksum = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw std::runtime_error("Unknown argument: " + std::string(arg));
        } else if (opt.output.empty()) {
            opt.output = std::string(arg);
        } else {
            throw std::runtime_error("Unexpected argument: " + std::string(arg));
        }
    }
    opt.frame.validate();
    return opt;
}

void do_compress(std::istream& in, std::ostream& out, const FrameOptions& frame) {
    std::vector<uint8_t> buf(get_block_size(frame.block_size_id));
    ByteSource read = source_from(in);
    Compressor::with_sink(sink_to(out), frame, [&](Compressor& compressor) {
        while (true) {
            const size_t n = read(buf.data(), buf.size());
            if (is_end_of_input(compressor.update(buf.data(), n))) break;
        }
    });
}

void do_decompress(std::istream& in, std::ostream& out) {
    Decompressor decompressor(source_from(in));
    for (const auto& chunk : decompressor) {
        out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!out) throw std::runtime_error("Failed to write decompressed output");
    }
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    Options opt;
    try {
        opt = parse_args(args);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        print_usage(err);
        return kExitUsage;
    }

    std::ifstream in_file;
    std::ofstream out_file;
    std::istream* src = &in;
    std::ostream* dst = &out;

    if (opt.input != "-") {
        in_file.open(opt.input, std::ios::binary);
        if (!in_file) {
            err << "Failed to open input file for reading: " << opt.input << "\n";
            return kExitInputOpen;
        }
        src = &in_file;
    }
    if (!opt.output.empty()) {
        out_file.open(opt.output, std::ios::binary | std::ios::app);
        if (!out_file) {
            err << "Failed to open output file for appending: " << opt.output << "\n";
            return kExitOutputOpen;
        }
        dst = &out_file;
    }

    try {
        if (opt.compress) {
            do_compress(*src, *dst, opt.frame);
        } else {
            do_decompress(*src, *dst);
        }
        dst->flush();
        if (!*dst) throw std::runtime_error("Failed to flush output");
    } catch (const Error& e) {
        err << (opt.compress ? "Compression" : "Decompression") << " error (" << error_kind_name(e.kind())
            << "): " << e.what() << "\n";
        return kExitFraming;
    } catch (const std::exception& e) {
        err << "Fatal: " << e.what() << "\n";
        return kExitIo;
    }
    return kExitOk;
}

} // namespace lz4framed::cli
