#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>

#include "harbor/core/error.h"
#include "harbor/core/result.h"
#include "harbor/storage/byte_range.h"

namespace harbor::storage {

/// @brief Failure of a staging write (FileDriver::OpenStaging, StagingWriter, WriteStaging).
///
/// `observed_size` is the length of the staging object after the attempt and
/// is meaningful for every kind; for validation failures it equals the
/// untouched pre-write length.
struct WriteError {
    enum class Kind {
        kFileTooLarge,
        kOffsetExceedsFileSize,
        kOffsetTooLarge,
        kWrite,
    };

    Kind kind{Kind::kWrite};
    std::uint64_t offset{0};
    std::uint64_t file_size{0};
    std::uint64_t limit{0};
    std::uint64_t observed_size{0};
    std::string message;

    /// @brief Map to a canonical error (client errors become kOutOfRange).
    core::Error ToError() const;
};

/// @brief Failure of FileDriver::Read.
struct ReadError {
    enum class Kind {
        kNotFound,
        kRangeStartExceedsFileSize,
        kRangeEndExceedsFileSize,
        kInvalidRange,
        kIo,
    };

    Kind kind{Kind::kIo};
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t file_size{0};
    std::string message;

    core::Error ToError() const;
};

/// @brief Move-only reader over a window of an opened resident object.
class ObjectReader {
public:
    ObjectReader() = default;
    ObjectReader(std::ifstream file, std::uint64_t offset, std::uint64_t length,
                 std::uint64_t file_size);

    ObjectReader(ObjectReader&&) = default;
    ObjectReader& operator=(ObjectReader&&) = default;
    ObjectReader(const ObjectReader&) = delete;
    ObjectReader& operator=(const ObjectReader&) = delete;

    /// First byte of the window, relative to the start of the object.
    std::uint64_t offset() const { return offset_; }
    /// Number of bytes in the window.
    std::uint64_t length() const { return length_; }
    std::uint64_t file_size() const { return file_size_; }
    std::uint64_t remaining() const { return remaining_; }

    /// @brief Read up to `size` bytes of the window; returns 0 once exhausted.
    core::Result<std::size_t> Read(char* buffer, std::size_t size);
    /// @brief Read the remainder of the window into a string.
    core::Result<std::string> ReadAll();

private:
    std::ifstream file_;
    std::uint64_t offset_{0};
    std::uint64_t length_{0};
    std::uint64_t file_size_{0};
    std::uint64_t remaining_{0};
};

/// @brief Sequential writer into one staging object, positioned at the chunk offset.
///
/// After a failed Append the writer is spent; the error's `observed_size` is
/// the object length re-read from disk. Finish must be called exactly once.
class StagingWriter {
public:
    virtual ~StagingWriter() = default;

    virtual core::Result<void, WriteError> Append(const char* data, std::size_t size) = 0;
    /// @brief Flush to stable storage and return the object length.
    ///
    /// On failure the error still carries the length observed on disk.
    virtual core::Result<std::uint64_t, WriteError> Finish() = 0;
};

/// @brief Where staged and resident bytes live.
///
/// Objects are addressed by id; a staging object and the resident object it
/// is promoted to share the same id. Implementations must be safe to call
/// from multiple threads for different ids. Callers serialize writers of one
/// staging id.
class FileDriver {
public:
    virtual ~FileDriver() = default;

    /// @brief Open the staging object for writing at `offset` without truncating.
    ///
    /// Creates the object when it does not exist yet. Offsets past the current
    /// length are rejected (no holes). Bytes already at `offset` are
    /// overwritten, which makes retrying the last chunk safe.
    virtual core::Result<std::unique_ptr<StagingWriter>, WriteError> OpenStaging(
        const std::string& id, std::uint64_t offset) = 0;

    /// @brief Copy all of `data` into the staging object at `offset`.
    ///
    /// Returns the object length after the write. A stream that fails midway
    /// yields kWrite with the length that reached disk.
    core::Result<std::uint64_t, WriteError> WriteStaging(const std::string& id,
                                                         std::uint64_t offset,
                                                         std::istream& data);
    virtual core::Result<void> RemoveStaging(const std::string& id) = 0;
    /// @brief Local path of the staging bytes, or kNotFound if none were written.
    virtual core::Result<std::string> ReadStaging(const std::string& id) = 0;
    /// @brief Move a staging object into the resident namespace under the same id.
    virtual core::Result<void> CommitStaging(const std::string& id) = 0;

    virtual core::Result<void> Remove(const std::string& id) = 0;
    virtual core::Result<ObjectReader, ReadError> Read(const std::string& id,
                                                       const ByteRange& range) = 0;
};

}  // namespace harbor::storage
