#pragma once

#include <cstdint>
#include <string>

#include "harbor/core/result.h"

namespace harbor::storage {

/// @brief Read window requested against a resident object.
///
/// Offsets are zero based. `kInclusiveRange` includes both `start` and `end`.
struct ByteRange {
    enum class Kind {
        kFull,
        kStartOffset,
        kInclusiveRange,
        kSuffixLength,
    };

    Kind kind{Kind::kFull};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t suffix_length{0};

    static ByteRange Full();
    static ByteRange StartOffset(std::uint64_t start);
    static ByteRange InclusiveRange(std::uint64_t start, std::uint64_t end);
    static ByteRange SuffixLength(std::uint64_t length);

    bool IsFull() const { return kind == Kind::kFull; }
};

/// @brief Parse an HTTP Range header value such as "bytes=0-499".
///
/// An empty value yields a full range. Only the first of several
/// comma-separated ranges is honored. Malformed values, units other than
/// bytes, `start > end` and zero-length suffixes fail with kInvalidArgument.
core::Result<ByteRange> ParseRangeHeader(const std::string& value);

}  // namespace harbor::storage
