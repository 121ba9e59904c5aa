#include "harbor/storage/byte_range.h"

#include <cctype>
#include <limits>
#include <optional>

namespace harbor::storage {

namespace {

std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::optional<std::uint64_t> ParseOffset(const std::string& digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

core::Error Malformed(const std::string& reason) {
    return core::Error{core::ErrorCode::kInvalidArgument, "invalid range: " + reason};
}

}  // namespace

ByteRange ByteRange::Full() { return ByteRange{}; }

ByteRange ByteRange::StartOffset(std::uint64_t start) {
    ByteRange range;
    range.kind = Kind::kStartOffset;
    range.start = start;
    return range;
}

ByteRange ByteRange::InclusiveRange(std::uint64_t start, std::uint64_t end) {
    ByteRange range;
    range.kind = Kind::kInclusiveRange;
    range.start = start;
    range.end = end;
    return range;
}

ByteRange ByteRange::SuffixLength(std::uint64_t length) {
    ByteRange range;
    range.kind = Kind::kSuffixLength;
    range.suffix_length = length;
    return range;
}

core::Result<ByteRange> ParseRangeHeader(const std::string& value) {
    const auto header = Trim(value);
    if (header.empty()) {
        return ByteRange::Full();
    }

    const auto eq = header.find('=');
    if (eq == std::string::npos) {
        return Malformed("missing unit");
    }
    if (Trim(header.substr(0, eq)) != "bytes") {
        return Malformed("unsupported unit");
    }

    // Multiple ranges are not served; everything after the first comma is ignored.
    auto window = header.substr(eq + 1);
    window = Trim(window.substr(0, window.find(',')));

    const auto dash = window.find('-');
    if (dash == std::string::npos) {
        return Malformed("missing '-'");
    }
    const auto start_text = Trim(window.substr(0, dash));
    const auto end_text = Trim(window.substr(dash + 1));

    if (start_text.empty()) {
        auto suffix = ParseOffset(end_text);
        if (!suffix) {
            return Malformed("bad suffix length");
        }
        if (*suffix == 0) {
            return Malformed("empty suffix");
        }
        return ByteRange::SuffixLength(*suffix);
    }

    auto start = ParseOffset(start_text);
    if (!start) {
        return Malformed("bad start");
    }
    if (end_text.empty()) {
        return ByteRange::StartOffset(*start);
    }

    auto end = ParseOffset(end_text);
    if (!end) {
        return Malformed("bad end");
    }
    if (*start > *end) {
        return Malformed("start after end");
    }
    return ByteRange::InclusiveRange(*start, *end);
}

}  // namespace harbor::storage
