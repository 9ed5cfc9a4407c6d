#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <lz4.h>
#include <lz4frame.h>

#include <exception>
#include <string>
#include <variant>

#include "lz4framed/block_size.hpp"
#include "lz4framed/errors.hpp"
#include "lz4framed/frame.hpp"
#include "lz4framed/levels.hpp"

#ifndef LZ4FRAMED_VERSION
#error "LZ4FRAMED_VERSION must be defined by the build"
#endif

namespace py = pybind11;
using namespace lz4framed;

namespace {

// Raised in place of EndOfInput so Python loops can stop on it.
struct NoData {};

template <typename T>
T unwrap(OrEndOfInput<T>&& r) {
    if (is_end_of_input(r)) throw NoData{};
    return std::get<T>(std::move(r));
}

std::string as_string(py::bytes b) {
    return static_cast<std::string>(b);
}

const uint8_t* as_ptr(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

py::bytes to_py(const Bytes& b) {
    return py::bytes(reinterpret_cast<const char*>(b.data()), b.size());
}

FrameOptions make_options(int block_size_id, bool block_mode_linked, bool content_checksum, bool block_checksum,
                          bool autoflush, int level) {
    FrameOptions fo;
    fo.block_size_id = static_cast<BlockSizeId>(block_size_id);
    fo.block_mode_linked = block_mode_linked;
    fo.content_checksum = content_checksum;
    fo.block_checksum = block_checksum;
    fo.autoflush = autoflush;
    fo.level = level;
    return fo;
}

} // namespace

PYBIND11_MODULE(_lz4framed, m) {
    m.doc() = "LZ4 frame compression with incremental contexts";

    static py::exception<Error> error(m, "Lz4FramedError");
    static py::exception<NoData> no_data(m, "Lz4FramedNoDataError");
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const NoData&) {
            no_data("no data supplied");
        } catch (const Error& e) {
            // args are (message, code) so callers can compare args[1] with the LZ4F_ERROR_* values.
            py::object exc = py::handle(error.ptr())(e.what(), static_cast<int>(e.code()));
            exc.attr("name") = error_name(e.code());
            exc.attr("kind") = error_kind_name(e.kind());
            PyErr_SetObject(error.ptr(), exc.ptr());
        }
    });

    m.attr("__version__") = LZ4FRAMED_VERSION;
    m.attr("LZ4_VERSION") = LZ4_VERSION_STRING;
    m.attr("LZ4F_VERSION") = LZ4F_VERSION;

    for (ErrorCode code : {ErrorCode::Generic, ErrorCode::MaxBlockSizeInvalid, ErrorCode::BlockModeInvalid,
                           ErrorCode::ContentChecksumFlagInvalid, ErrorCode::CompressionLevelInvalid,
                           ErrorCode::HeaderVersionWrong, ErrorCode::BlockChecksumInvalid, ErrorCode::ReservedFlagSet,
                           ErrorCode::AllocationFailed, ErrorCode::SrcSizeTooLarge, ErrorCode::DstMaxSizeTooSmall,
                           ErrorCode::FrameHeaderIncomplete, ErrorCode::FrameTypeUnknown, ErrorCode::FrameSizeWrong,
                           ErrorCode::SrcPtrWrong, ErrorCode::DecompressionFailed, ErrorCode::HeaderChecksumInvalid,
                           ErrorCode::ContentChecksumInvalid, ErrorCode::FrameDecodingAlreadyStarted,
                           ErrorCode::FrameIncomplete}) {
        // error_name() reads "ERROR_<name>"; the module constant adds the LZ4F_ prefix.
        m.attr(("LZ4F_" + std::string(error_name(code))).c_str()) = static_cast<int>(code);
    }

    m.attr("LZ4F_BLOCKSIZE_DEFAULT") = static_cast<int>(BlockSizeId::Default);
    m.attr("LZ4F_BLOCKSIZE_MAX64KB") = static_cast<int>(BlockSizeId::Max64KB);
    m.attr("LZ4F_BLOCKSIZE_MAX256KB") = static_cast<int>(BlockSizeId::Max256KB);
    m.attr("LZ4F_BLOCKSIZE_MAX1MB") = static_cast<int>(BlockSizeId::Max1MB);
    m.attr("LZ4F_BLOCKSIZE_MAX4MB") = static_cast<int>(BlockSizeId::Max4MB);
    m.attr("LZ4F_COMPRESSION_MIN") = kCompressionMin;
    m.attr("LZ4F_COMPRESSION_MIN_HC") = kCompressionMinHC;
    m.attr("LZ4F_COMPRESSION_MAX") = kCompressionMax;

    py::enum_<FrameType>(m, "FrameType")
        .value("LZ4_FRAME", FrameType::Lz4Frame)
        .value("SKIPPABLE", FrameType::Skippable);

    py::class_<FrameInfo>(m, "FrameInfo")
        .def_property_readonly("frame_type", [](const FrameInfo& fi) { return fi.frame_type; })
        .def_property_readonly("block_size_id", [](const FrameInfo& fi) { return static_cast<int>(fi.block_size_id); })
        .def_property_readonly("block_size", [](const FrameInfo& fi) { return get_block_size(fi.block_size_id); })
        .def_readonly("block_mode_linked", &FrameInfo::block_mode_linked)
        .def_readonly("checksum", &FrameInfo::content_checksum)
        .def_readonly("block_checksum", &FrameInfo::block_checksum)
        .def_property_readonly("length", [](const FrameInfo& fi) { return fi.content_size; })
        .def_readonly("input_hint", &FrameInfo::input_hint);

    py::class_<Context>(m, "Context");
    py::class_<CompressionContext, Context>(m, "CompressionContext");
    py::class_<DecompressionContext, Context>(m, "DecompressionContext");

    m.def("get_block_size", [](int id) { return get_block_size(id); }, py::arg("block_size_id") = 0);

    m.def("create_compression_context", &create_compression_context);
    m.def("create_decompression_context", &create_decompression_context);

    m.def("compress_begin",
          [](Context& ctx, int block_size_id, bool block_mode_linked, bool checksum, bool block_checksum,
             bool autoflush, int level) {
              return to_py(compress_begin(
                  ctx, make_options(block_size_id, block_mode_linked, checksum, block_checksum, autoflush, level)));
          },
          py::arg("ctx"), py::arg("block_size_id") = 0, py::arg("block_mode_linked") = true,
          py::arg("checksum") = false, py::arg("block_checksum") = false, py::arg("autoflush") = false,
          py::arg("level") = kCompressionMin);

    m.def("compress_update",
          [](Context& ctx, py::bytes data) {
              const std::string buf = as_string(data);
              return to_py(unwrap(compress_update(ctx, as_ptr(buf), buf.size())));
          },
          py::arg("ctx"), py::arg("b"));

    m.def("compress_end", [](Context& ctx) { return to_py(compress_end(ctx)); }, py::arg("ctx"));

    m.def("get_frame_info", &get_frame_info, py::arg("ctx"));

    m.def("decompress_update",
          [](Context& ctx, py::bytes data, size_t chunk_len) {
              const std::string buf = as_string(data);
              DecompressResult res = unwrap(decompress_update(ctx, as_ptr(buf), buf.size(), chunk_len));
              py::list chunks;
              for (const auto& c : res.chunks) chunks.append(to_py(c));
              chunks.append(py::int_(res.input_hint));
              return chunks;
          },
          py::arg("ctx"), py::arg("b"), py::arg("chunk_len") = DecompressionContext::kDefaultChunkLength);

    m.def("compress",
          [](py::bytes data, int block_size_id, bool block_mode_linked, bool checksum, bool block_checksum,
             int level) {
              const std::string buf = as_string(data);
              FrameOptions fo = make_options(block_size_id, block_mode_linked, checksum, block_checksum, false, level);
              return to_py(unwrap(compress(as_ptr(buf), buf.size(), fo)));
          },
          py::arg("b"), py::arg("block_size_id") = 0, py::arg("block_mode_linked") = true,
          py::arg("checksum") = false, py::arg("block_checksum") = false, py::arg("level") = kCompressionMin);

    m.def("decompress",
          [](py::bytes data, int buffer_size) {
              if (buffer_size <= 0) {
                  throw py::value_error("buffer_size (" + std::to_string(buffer_size) + ") invalid");
              }
              const std::string buf = as_string(data);
              return to_py(unwrap(decompress(as_ptr(buf), buf.size(), static_cast<size_t>(buffer_size))));
          },
          py::arg("b"), py::arg("buffer_size") = 1024);
}
