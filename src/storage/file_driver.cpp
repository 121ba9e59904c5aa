#include "harbor/storage/file_driver.h"

#include <algorithm>
#include <array>

namespace harbor::storage {

core::Error WriteError::ToError() const {
    switch (kind) {
        case Kind::kFileTooLarge:
            return core::Error{core::ErrorCode::kOutOfRange,
                               "the file size " + std::to_string(file_size) +
                                   " exceeds the maximum file size " + std::to_string(limit)};
        case Kind::kOffsetExceedsFileSize:
            return core::Error{core::ErrorCode::kOutOfRange,
                               "the offset " + std::to_string(offset) +
                                   " exceeds the file size " + std::to_string(file_size)};
        case Kind::kOffsetTooLarge:
            return core::Error{core::ErrorCode::kOutOfRange,
                               "the offset " + std::to_string(offset) +
                                   " exceeds the maximum offset " + std::to_string(limit)};
        case Kind::kWrite:
            break;
    }
    return core::Error{core::ErrorCode::kIoError, message};
}

core::Error ReadError::ToError() const {
    switch (kind) {
        case Kind::kNotFound:
            return core::Error{core::ErrorCode::kNotFound, "file not found"};
        case Kind::kRangeStartExceedsFileSize:
            return core::Error{core::ErrorCode::kOutOfRange,
                               "range start " + std::to_string(start) +
                                   " exceeds the file size " + std::to_string(file_size)};
        case Kind::kRangeEndExceedsFileSize:
            return core::Error{core::ErrorCode::kOutOfRange,
                               "range end " + std::to_string(end) + " exceeds the file size " +
                                   std::to_string(file_size)};
        case Kind::kInvalidRange:
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "range start " + std::to_string(start) + " is after range end " +
                                   std::to_string(end)};
        case Kind::kIo:
            break;
    }
    return core::Error{core::ErrorCode::kIoError, message};
}

core::Result<std::uint64_t, WriteError> FileDriver::WriteStaging(const std::string& id,
                                                                 std::uint64_t offset,
                                                                 std::istream& data) {
    auto opened = OpenStaging(id, offset);
    if (!opened.ok()) {
        return opened.error();
    }
    auto& writer = *opened.value();

    std::array<char, 8192> buffer{};
    while (data) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        auto appended = writer.Append(buffer.data(), static_cast<std::size_t>(bytes));
        if (!appended.ok()) {
            return appended.error();
        }
    }

    auto finished = writer.Finish();
    if (!finished.ok() || !data.bad()) {
        return finished;
    }
    WriteError error;
    error.kind = WriteError::Kind::kWrite;
    error.observed_size = finished.value();
    error.message = "failed to read upload stream";
    return error;
}

ObjectReader::ObjectReader(std::ifstream file, std::uint64_t offset, std::uint64_t length,
                           std::uint64_t file_size)
    : file_(std::move(file)),
      offset_(offset),
      length_(length),
      file_size_(file_size),
      remaining_(length) {}

core::Result<std::size_t> ObjectReader::Read(char* buffer, std::size_t size) {
    if (remaining_ == 0 || size == 0) {
        return std::size_t{0};
    }
    const auto wanted = static_cast<std::size_t>(
        std::min<std::uint64_t>(remaining_, static_cast<std::uint64_t>(size)));
    file_.read(buffer, static_cast<std::streamsize>(wanted));
    const auto got = file_.gcount();
    if (got <= 0) {
        // The window was validated against the size at open; a short read means the file shrank.
        return core::Error{core::ErrorCode::kIoError, "unexpected end of file"};
    }
    remaining_ -= static_cast<std::uint64_t>(got);
    return static_cast<std::size_t>(got);
}

core::Result<std::string> ObjectReader::ReadAll() {
    std::string out;
    out.reserve(static_cast<std::size_t>(remaining_));
    char buffer[8192];
    while (remaining_ > 0) {
        auto read = Read(buffer, sizeof(buffer));
        if (!read.ok()) {
            return read.error();
        }
        out.append(buffer, read.value());
    }
    return out;
}

}  // namespace harbor::storage
