#pragma once

namespace lz4framed {

enum class ContextType {
    Compression,
    Decompression
};

// Common base so the low-level free functions can reject a context of the wrong kind at run
// time, as the opaque handles of the C surface do.
class Context {
public:
    virtual ~Context() = default;
    virtual ContextType type() const = 0;
};

} // namespace lz4framed
