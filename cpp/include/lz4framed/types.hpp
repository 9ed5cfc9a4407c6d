#pragma once

#include <cstdint>
#include <variant>
#include <vector>

namespace lz4framed {

using Bytes = std::vector<uint8_t>;

// Returned instead of a result when the caller supplied zero bytes. Read loops use it as their
// end-of-stream condition.
struct EndOfInput {};

template <typename T>
using OrEndOfInput = std::variant<T, EndOfInput>;

template <typename T>
bool is_end_of_input(const OrEndOfInput<T>& r) {
    return std::holds_alternative<EndOfInput>(r);
}

} // namespace lz4framed
