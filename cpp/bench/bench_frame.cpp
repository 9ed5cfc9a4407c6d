// Throughput harness for the frame codec against the raw lz4 block API and a few reference codecs.
// Setup (buffer allocation, one verification decode) stays outside the timed loop.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <numeric>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <lz4.h>

#include "lz4framed/block_size.hpp"
#include "lz4framed/frame.hpp"
#include "lz4framed/levels.hpp"
#include "lz4framed/stream.hpp"

#ifdef LZ4FRAMED_BENCH_HAVE_ZSTD
#include <zstd.h>
#endif

#ifdef LZ4FRAMED_BENCH_HAVE_ZLIB
#include <zlib.h>
#endif

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using lz4framed::Bytes;

struct Options {
    fs::path dataset_dir;
    std::vector<std::string> codecs{"frame", "frame_hc", "frame_stream", "lz4", "zstd", "zlib", "memcpy"};
    lz4framed::FrameOptions frame;
    int hc_level = 9;
    size_t stream_chunk = 16 * 1024;
    double min_time_ms = 200.0;
    int warmup_iters = 1;
};

struct BenchMetrics {
    std::string name;
    size_t original_bytes = 0;
    size_t compressed_bytes = 0;
    double ratio = 0.0;
    double encode_ms_median = 0.0;
    double decode_ms_median = 0.0;
    double encode_mb_s = 0.0;
    double decode_mb_s = 0.0;
};

struct TimeStats {
    double median_ms = 0.0;
    double std_ms = 0.0;
};

template <typename Fn>
TimeStats time_stats(Fn&& fn, int warmup_iters, double min_time_ms) {
    for (int i = 0; i < warmup_iters; ++i) fn();
    std::vector<double> samples;
    double total_ms = 0.0;
    do {
        auto t0 = Clock::now();
        fn();
        const double ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
        total_ms += ms;
        samples.push_back(ms);
    } while (total_ms < min_time_ms);

    TimeStats stats;
    const double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
    std::sort(samples.begin(), samples.end());
    stats.median_ms = samples[samples.size() / 2];
    double sq = 0.0;
    for (double v : samples) sq += (v - mean) * (v - mean);
    stats.std_ms = std::sqrt(sq / samples.size());
    return stats;
}

BenchMetrics make_metrics(std::string name, size_t original, size_t compressed, const TimeStats& enc,
                          const TimeStats& dec) {
    BenchMetrics m;
    m.name = std::move(name);
    m.original_bytes = original;
    m.compressed_bytes = compressed;
    m.ratio = compressed > 0 ? static_cast<double>(original) / compressed : 0.0;
    m.encode_ms_median = enc.median_ms;
    m.decode_ms_median = dec.median_ms;
    const double size_mb = static_cast<double>(original) / 1'000'000.0;
    m.encode_mb_s = enc.median_ms > 0.0 ? size_mb / (enc.median_ms / 1000.0) : 0.0;
    m.decode_mb_s = dec.median_ms > 0.0 ? size_mb / (dec.median_ms / 1000.0) : 0.0;
    return m;
}

void check_same(const Bytes& decoded, const Bytes& original, std::string_view name) {
    if (decoded != original) throw std::runtime_error(std::string(name) + " decode mismatch");
}

Bytes read_file_bytes(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw std::runtime_error("Failed to open file: " + path.string());
    return Bytes(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

BenchMetrics bench_frame(const Bytes& data, const lz4framed::FrameOptions& fo, std::string name,
                         const Options& opt) {
    auto compress_once = [&]() {
        auto r = lz4framed::compress(data, fo);
        return lz4framed::is_end_of_input(r) ? Bytes{} : std::get<Bytes>(std::move(r));
    };
    Bytes compressed = compress_once();
    check_same(std::get<Bytes>(lz4framed::decompress(compressed)), data, name);

    const TimeStats enc = time_stats([&]() { compressed = compress_once(); }, opt.warmup_iters, opt.min_time_ms);
    const TimeStats dec = time_stats(
        [&]() {
            auto r = lz4framed::decompress(compressed);
            if (std::get<Bytes>(r).size() != data.size()) throw std::runtime_error("frame decode size mismatch");
        },
        opt.warmup_iters, opt.min_time_ms);
    return make_metrics(std::move(name), data.size(), compressed.size(), enc, dec);
}

// Feeds the compressor in fixed-size slices and drains the decompressor block by block.
BenchMetrics bench_frame_stream(const Bytes& data, const Options& opt) {
    auto compress_once = [&]() {
        Bytes out;
        lz4framed::Compressor::with_sink(lz4framed::sink_to(out), opt.frame, [&](lz4framed::Compressor& c) {
            for (size_t off = 0; off < data.size(); off += opt.stream_chunk) {
                (void)c.update(data.data() + off, std::min(opt.stream_chunk, data.size() - off));
            }
        });
        return out;
    };
    auto decompress_once = [&](const Bytes& frame) {
        Bytes out;
        out.reserve(data.size());
        lz4framed::Decompressor d(lz4framed::source_from(frame, opt.stream_chunk));
        for (const auto& chunk : d) out.insert(out.end(), chunk.begin(), chunk.end());
        return out;
    };

    Bytes compressed = compress_once();
    check_same(decompress_once(compressed), data, "frame_stream");

    const TimeStats enc = time_stats([&]() { compressed = compress_once(); }, opt.warmup_iters, opt.min_time_ms);
    const TimeStats dec = time_stats(
        [&]() {
            if (decompress_once(compressed).size() != data.size()) {
                throw std::runtime_error("frame_stream decode size mismatch");
            }
        },
        opt.warmup_iters, opt.min_time_ms);
    return make_metrics("frame_stream", data.size(), compressed.size(), enc, dec);
}

BenchMetrics bench_lz4_block(const Bytes& data, const Options& opt) {
    const int bound = LZ4_compressBound(static_cast<int>(data.size()));
    Bytes compressed(static_cast<size_t>(bound));
    int comp_size = 0;
    auto encode_fn = [&]() {
        comp_size = LZ4_compress_default(reinterpret_cast<const char*>(data.data()),
                                         reinterpret_cast<char*>(compressed.data()), static_cast<int>(data.size()),
                                         bound);
        if (comp_size <= 0) throw std::runtime_error("lz4 compress failed");
    };
    encode_fn();

    Bytes decompressed(data.size());
    auto decode_fn = [&]() {
        const int out = LZ4_decompress_safe(reinterpret_cast<const char*>(compressed.data()),
                                            reinterpret_cast<char*>(decompressed.data()), comp_size,
                                            static_cast<int>(decompressed.size()));
        if (out != static_cast<int>(decompressed.size())) throw std::runtime_error("lz4 decompress failed");
    };
    decode_fn();
    check_same(decompressed, data, "lz4");

    const TimeStats enc = time_stats(encode_fn, opt.warmup_iters, opt.min_time_ms);
    const TimeStats dec = time_stats(decode_fn, opt.warmup_iters, opt.min_time_ms);
    return make_metrics("lz4", data.size(), static_cast<size_t>(comp_size), enc, dec);
}

#ifdef LZ4FRAMED_BENCH_HAVE_ZSTD
struct ZstdCodec {
    ZSTD_CCtx* cctx = ZSTD_createCCtx();
    ZSTD_DCtx* dctx = ZSTD_createDCtx();
    ~ZstdCodec() {
        ZSTD_freeCCtx(cctx);
        ZSTD_freeDCtx(dctx);
    }
};

BenchMetrics bench_zstd(const Bytes& data, int level, const Options& opt) {
    ZstdCodec codec;
    Bytes compressed(ZSTD_compressBound(data.size()));
    size_t comp_size = 0;
    auto encode_fn = [&]() {
        comp_size = ZSTD_compressCCtx(codec.cctx, compressed.data(), compressed.size(), data.data(), data.size(),
                                      level);
        if (ZSTD_isError(comp_size)) {
            throw std::runtime_error("zstd compress failed: " + std::string(ZSTD_getErrorName(comp_size)));
        }
    };
    encode_fn();

    Bytes decompressed(data.size());
    auto decode_fn = [&]() {
        const size_t out = ZSTD_decompressDCtx(codec.dctx, decompressed.data(), decompressed.size(),
                                               compressed.data(), comp_size);
        if (ZSTD_isError(out) || out != decompressed.size()) throw std::runtime_error("zstd decompress failed");
    };
    decode_fn();
    check_same(decompressed, data, "zstd");

    const TimeStats enc = time_stats(encode_fn, opt.warmup_iters, opt.min_time_ms);
    const TimeStats dec = time_stats(decode_fn, opt.warmup_iters, opt.min_time_ms);
    return make_metrics("zstd", data.size(), comp_size, enc, dec);
}
#endif

#ifdef LZ4FRAMED_BENCH_HAVE_ZLIB
BenchMetrics bench_zlib(const Bytes& data, int level, const Options& opt) {
    const uLongf bound = compressBound(static_cast<uLong>(data.size()));
    Bytes compressed(bound);
    uLongf comp_size = bound;
    auto encode_fn = [&]() {
        comp_size = bound;
        if (compress2(compressed.data(), &comp_size, data.data(), data.size(), level) != Z_OK) {
            throw std::runtime_error("zlib compress failed");
        }
    };
    encode_fn();

    Bytes decompressed(data.size());
    auto decode_fn = [&]() {
        uLongf out = static_cast<uLongf>(decompressed.size());
        if (uncompress(decompressed.data(), &out, compressed.data(), comp_size) != Z_OK || out != decompressed.size()) {
            throw std::runtime_error("zlib decompress failed");
        }
    };
    decode_fn();
    check_same(decompressed, data, "zlib");

    const TimeStats enc = time_stats(encode_fn, opt.warmup_iters, opt.min_time_ms);
    const TimeStats dec = time_stats(decode_fn, opt.warmup_iters, opt.min_time_ms);
    return make_metrics("zlib", data.size(), comp_size, enc, dec);
}
#endif

BenchMetrics bench_memcpy(const Bytes& data, const Options& opt) {
    Bytes scratch(data.size());
    auto copy_fn = [&]() { std::memcpy(scratch.data(), data.data(), data.size()); };
    const TimeStats t = time_stats(copy_fn, opt.warmup_iters, opt.min_time_ms);
    return make_metrics("memcpy", data.size(), data.size(), t, t);
}

void print_metrics(const fs::path& file, const std::vector<BenchMetrics>& metrics) {
    std::cout << "\n" << std::string(88, '=') << "\n";
    std::cout << "File: " << file.filename().string() << " (" << metrics.front().original_bytes << " bytes)\n";
    std::cout << std::string(88, '-') << "\n";
    std::cout << std::left << std::setw(14) << "Codec" << std::setw(14) << "Compressed" << std::setw(10) << "Ratio"
              << std::setw(12) << "Enc(ms)" << std::setw(12) << "Dec(ms)" << std::setw(13) << "Enc(MB/s)"
              << std::setw(13) << "Dec(MB/s)" << "\n";
    for (const auto& m : metrics) {
        std::cout << std::left << std::setw(14) << m.name << std::setw(14) << m.compressed_bytes << std::fixed
                  << std::setprecision(3) << std::setw(10) << m.ratio << std::setw(12) << m.encode_ms_median
                  << std::setw(12) << m.decode_ms_median << std::setprecision(1) << std::setw(13) << m.encode_mb_s
                  << std::setw(13) << m.decode_mb_s << "\n";
    }
    std::cout << std::string(88, '=') << "\n";
}

Options parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        auto next = [&]() -> std::string_view {
            if (i + 1 >= argc) throw std::runtime_error("Missing value for argument: " + std::string(arg));
            return std::string_view(argv[++i]);
        };
        if (arg == "--dataset") {
            opt.dataset_dir = fs::path(next());
        } else if (arg == "--codecs") {
            opt.codecs.clear();
            std::stringstream ss{std::string(next())};
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) opt.codecs.push_back(item);
            }
        } else if (arg == "--level") {
            opt.frame.level = std::stoi(std::string(next()));
        } else if (arg == "--hc-level") {
            opt.hc_level = std::stoi(std::string(next()));
        } else if (arg == "--block-size") {
            opt.frame.block_size_id = static_cast<lz4framed::BlockSizeId>(std::stoi(std::string(next())));
        } else if (arg == "--independent") {
            opt.frame.block_mode_linked = false;
        } else if (arg == "--checksum") {
            opt.frame.content_checksum = true;
            opt.frame.block_checksum = true;
        } else if (arg == "--stream-chunk") {
            opt.stream_chunk = std::stoul(std::string(next()));
            if (opt.stream_chunk == 0) throw std::runtime_error("--stream-chunk must be positive");
        } else if (arg == "--min-time-ms") {
            opt.min_time_ms = std::stod(std::string(next()));
        } else if (arg == "--warmup") {
            opt.warmup_iters = std::stoi(std::string(next()));
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: bench_frame --dataset <dir> [--codecs frame,frame_hc,frame_stream,lz4,zstd,zlib,memcpy]\n"
                         "                   [--level N] [--hc-level N] [--block-size 4..7] [--independent]\n"
                         "                   [--checksum] [--stream-chunk bytes] [--min-time-ms ms] [--warmup N]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(arg));
        }
    }
    if (opt.dataset_dir.empty()) throw std::runtime_error("--dataset is required");
    opt.frame.validate();
    return opt;
}

int main(int argc, char** argv) {
    try {
        Options opt = parse_args(argc, argv);
        if (!fs::is_directory(opt.dataset_dir)) {
            throw std::runtime_error("Dataset path is not a directory: " + opt.dataset_dir.string());
        }

        std::vector<fs::directory_entry> files;
        for (const auto& entry : fs::directory_iterator(opt.dataset_dir)) {
            if (entry.is_regular_file() && entry.file_size() > 0) files.push_back(entry);
        }
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.file_size() < b.file_size(); });
        if (files.empty()) {
            std::cerr << "No files found in dataset directory\n";
            return 1;
        }

        lz4framed::FrameOptions hc = opt.frame;
        hc.level = opt.hc_level;
        hc.validate();

        for (const auto& entry : files) {
            const Bytes data = read_file_bytes(entry.path());
            std::vector<BenchMetrics> metrics;
            for (const auto& name : opt.codecs) {
                try {
                    if (name == "frame") {
                        metrics.push_back(bench_frame(data, opt.frame, "frame", opt));
                    } else if (name == "frame_hc") {
                        metrics.push_back(bench_frame(data, hc, "frame_hc", opt));
                    } else if (name == "frame_stream") {
                        metrics.push_back(bench_frame_stream(data, opt));
                    } else if (name == "lz4") {
                        metrics.push_back(bench_lz4_block(data, opt));
#ifdef LZ4FRAMED_BENCH_HAVE_ZSTD
                    } else if (name == "zstd") {
                        metrics.push_back(bench_zstd(data, 3, opt));
#endif
#ifdef LZ4FRAMED_BENCH_HAVE_ZLIB
                    } else if (name == "zlib") {
                        metrics.push_back(bench_zlib(data, Z_DEFAULT_COMPRESSION, opt));
#endif
                    } else if (name == "memcpy") {
                        metrics.push_back(bench_memcpy(data, opt));
                    } else {
                        std::cerr << "Unknown or unavailable codec: " << name << "\n";
                    }
                } catch (const std::exception& e) {
                    std::cerr << "ERROR [" << name << "]: " << e.what() << "\n";
                }
            }
            if (!metrics.empty()) print_metrics(entry.path(), metrics);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
