#include "harbor/storage/local_file_system.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <system_error>
#include <utility>

#include "harbor/core/logger.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace harbor::storage {

namespace {

// Sizes and offsets are persisted as signed 64-bit integers.
constexpr std::uint64_t kMaxObjectSize =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

WriteError MakeWriteIoError(const std::string& message, std::uint64_t observed_size) {
    WriteError error;
    error.kind = WriteError::Kind::kWrite;
    error.observed_size = observed_size;
    error.message = message;
    return error;
}

ReadError MakeReadError(ReadError::Kind kind, std::uint64_t file_size) {
    ReadError error;
    error.kind = kind;
    error.file_size = file_size;
    return error;
}

#ifndef _WIN32
std::string ErrnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

bool CurrentSize(int fd, std::uint64_t* size) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return false;
    }
    *size = static_cast<std::uint64_t>(st.st_size);
    return true;
}

bool WriteFully(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}
#endif

// Writes one chunk. `known_size` is the length at open and stands in whenever
// the file cannot be re-measured.
class LocalStagingWriter : public StagingWriter {
public:
#ifdef _WIN32
    LocalStagingWriter(std::string path, std::fstream out, std::uint64_t known_size)
        : path_(std::move(path)), out_(std::move(out)), known_size_(known_size) {}
#else
    LocalStagingWriter(int fd, std::uint64_t known_size) : fd_(fd), known_size_(known_size) {}
#endif

    core::Result<void, WriteError> Append(const char* data, std::size_t size) override {
        if (failed_) {
            return MakeWriteIoError("staging write already failed", Observed());
        }
#ifdef _WIN32
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_) {
            failed_ = true;
            out_.clear();
            out_.flush();
            return MakeWriteIoError("failed to write staging file", Observed());
        }
#else
        if (!WriteFully(fd_.get(), data, size)) {
            const auto message = ErrnoMessage("failed to write staging file");
            failed_ = true;
            return MakeWriteIoError(message, Observed());
        }
#endif
        return core::Result<void, WriteError>();
    }

    core::Result<std::uint64_t, WriteError> Finish() override {
        std::string failure;
#ifdef _WIN32
        out_.flush();
        if (!out_) {
            failure = "failed to flush staging file";
        }
        out_.close();
#else
        if (::fsync(fd_.get()) != 0) {
            failure = ErrnoMessage("failed to flush staging file");
        }
#endif
        // Re-measure even after a failure so the caller can reconcile with what actually landed.
        const auto observed = Observed();
        if (!failure.empty()) {
            return MakeWriteIoError(failure, observed);
        }
        return observed;
    }

private:
    std::uint64_t Observed() const {
#ifdef _WIN32
        std::error_code ec;
        const auto size = std::filesystem::file_size(path_, ec);
        return ec ? known_size_ : static_cast<std::uint64_t>(size);
#else
        std::uint64_t size = 0;
        return CurrentSize(fd_.get(), &size) ? size : known_size_;
#endif
    }

#ifdef _WIN32
    std::string path_;
    std::fstream out_;
#else
    FdGuard fd_;
#endif
    std::uint64_t known_size_;
    bool failed_{false};
};

// Device ids decide whether rename(2) can move bytes between the two roots.
bool SameDevice(const std::string& a, const std::string& b) {
#ifdef _WIN32
    (void)a;
    (void)b;
    return false;
#else
    struct stat st_a {};
    struct stat st_b {};
    if (::stat(a.c_str(), &st_a) != 0 || ::stat(b.c_str(), &st_b) != 0) {
        return false;
    }
    return st_a.st_dev == st_b.st_dev;
#endif
}

}  // namespace

LocalFileSystem::LocalFileSystem(std::string resident_path, std::string staging_path,
                                 CommitMode mode)
    : resident_path_(std::move(resident_path)), staging_path_(std::move(staging_path)) {
    std::filesystem::create_directories(resident_path_);
    std::filesystem::create_directories(staging_path_);

    switch (mode) {
        case CommitMode::kRename:
            copy_on_commit_ = false;
            break;
        case CommitMode::kCopy:
            copy_on_commit_ = true;
            break;
        case CommitMode::kAuto:
            copy_on_commit_ = !SameDevice(resident_path_, staging_path_);
            break;
    }
    core::LogInfo(std::string("Local file system driver ready (resident=") + resident_path_ +
                  ", staging=" + staging_path_ +
                  ", commit=" + (copy_on_commit_ ? "copy" : "rename") + ")");
}

core::Result<std::unique_ptr<StagingWriter>, WriteError> LocalFileSystem::OpenStaging(
    const std::string& id, std::uint64_t offset) {
    if (!IsSafeName(id)) {
        return MakeWriteIoError("invalid object id", 0);
    }
    const auto path = StagingObjectPath(id);

#ifdef _WIN32
    {
        // Create without truncating, then reopen for in-place writes.
        std::ofstream create(path, std::ios::binary | std::ios::app);
    }
    std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!out.is_open()) {
        return MakeWriteIoError("failed to open staging file", 0);
    }
    std::error_code size_ec;
    const auto current = static_cast<std::uint64_t>(std::filesystem::file_size(path, size_ec));
    if (size_ec) {
        return MakeWriteIoError("failed to stat staging file", 0);
    }
#else
    FdGuard fd(::open(path.c_str(), O_CREAT | O_RDWR, 0644));
    if (fd.get() < 0) {
        return MakeWriteIoError(ErrnoMessage("failed to open staging file"), 0);
    }
    std::uint64_t current = 0;
    if (!CurrentSize(fd.get(), &current)) {
        return MakeWriteIoError(ErrnoMessage("failed to stat staging file"), 0);
    }
#endif

    if (current > kMaxObjectSize) {
        WriteError error;
        error.kind = WriteError::Kind::kFileTooLarge;
        error.file_size = current;
        error.limit = kMaxObjectSize;
        error.observed_size = current;
        return error;
    }
    if (offset > current) {
        WriteError error;
        error.kind = WriteError::Kind::kOffsetExceedsFileSize;
        error.offset = offset;
        error.file_size = current;
        error.observed_size = current;
        return error;
    }
    if (offset > kMaxObjectSize - current) {
        WriteError error;
        error.kind = WriteError::Kind::kOffsetTooLarge;
        error.offset = offset;
        error.file_size = current;
        error.limit = kMaxObjectSize;
        error.observed_size = current;
        return error;
    }

#ifdef _WIN32
    out.seekp(static_cast<std::streamoff>(offset));
    if (!out) {
        return MakeWriteIoError("failed to seek staging file", current);
    }
    return std::unique_ptr<StagingWriter>(
        std::make_unique<LocalStagingWriter>(path, std::move(out), current));
#else
    if (::lseek(fd.get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return MakeWriteIoError(ErrnoMessage("failed to seek staging file"), current);
    }
    return std::unique_ptr<StagingWriter>(
        std::make_unique<LocalStagingWriter>(fd.release(), current));
#endif
}

core::Result<void> LocalFileSystem::RemoveStaging(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object id"};
    }
    std::error_code ec;
    // A missing file is not an error: uploads that never received bytes have none.
    std::filesystem::remove(StagingObjectPath(id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to remove staging file " + id + ": " + ec.message()};
    }
    return core::Ok();
}

core::Result<std::string> LocalFileSystem::ReadStaging(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object id"};
    }
    const auto path = StagingObjectPath(id);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return core::Error{core::ErrorCode::kIoError, ec.message()};
        }
        return core::Error{core::ErrorCode::kNotFound, "staging file has no bytes"};
    }
    return path;
}

core::Result<void> LocalFileSystem::CommitStaging(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object id"};
    }
    const auto staging = StagingObjectPath(id);
    std::error_code ec;
    if (!std::filesystem::exists(staging, ec)) {
        return core::Error{core::ErrorCode::kNotFound, "staging file has no bytes"};
    }

    if (copy_on_commit_) {
        return CopyIntoResident(id);
    }

    std::filesystem::rename(staging, ResidentObjectPath(id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to move staging file " + id + ": " + ec.message()};
    }
    return core::Ok();
}

core::Result<void> LocalFileSystem::CopyIntoResident(const std::string& id) {
    const auto staging = StagingObjectPath(id);
    const auto final_path = ResidentObjectPath(id);
    // Copy next to the destination first, then rename, so readers never see a partial file.
    const auto partial_path =
        (std::filesystem::path(resident_path_) / ("." + id + ".partial")).string();

    std::error_code ec;
    std::filesystem::copy_file(staging, partial_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial_path, ignored);
        return core::Error{core::ErrorCode::kIoError,
                           "failed to copy staging file " + id + ": " + ec.message()};
    }
    std::filesystem::rename(partial_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial_path, ignored);
        return core::Error{core::ErrorCode::kIoError,
                           "failed to publish resident file " + id + ": " + ec.message()};
    }

    // The resident copy is durable at this point; a leftover staging file is only clutter.
    std::filesystem::remove(staging, ec);
    if (ec) {
        core::LogWarning("Failed to remove staging file " + id + " after copy: " + ec.message());
    }
    return core::Ok();
}

core::Result<void> LocalFileSystem::Remove(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid object id"};
    }
    const auto path = ResidentObjectPath(id);
    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
        if (ec) {
            return core::Error{core::ErrorCode::kIoError,
                               "failed to remove file " + id + ": " + ec.message()};
        }
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }
    return core::Ok();
}

core::Result<ObjectReader, ReadError> LocalFileSystem::Read(const std::string& id,
                                                            const ByteRange& range) {
    if (!IsSafeName(id)) {
        return MakeReadError(ReadError::Kind::kNotFound, 0);
    }
    const auto path = ResidentObjectPath(id);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return MakeReadError(ReadError::Kind::kNotFound, 0);
        }
        auto error = MakeReadError(ReadError::Kind::kIo, 0);
        error.message = "failed to open file " + id;
        return error;
    }

    std::error_code ec;
    const auto file_size = static_cast<std::uint64_t>(std::filesystem::file_size(path, ec));
    if (ec) {
        auto error = MakeReadError(ReadError::Kind::kIo, 0);
        error.message = "failed to stat file " + id + ": " + ec.message();
        return error;
    }

    std::uint64_t offset = 0;
    std::uint64_t length = file_size;
    switch (range.kind) {
        case ByteRange::Kind::kFull:
            break;
        case ByteRange::Kind::kStartOffset:
            if (file_size <= range.start) {
                auto error = MakeReadError(ReadError::Kind::kRangeStartExceedsFileSize, file_size);
                error.start = range.start;
                return error;
            }
            offset = range.start;
            length = file_size - range.start;
            break;
        case ByteRange::Kind::kInclusiveRange:
            if (range.start > range.end) {
                auto error = MakeReadError(ReadError::Kind::kInvalidRange, file_size);
                error.start = range.start;
                error.end = range.end;
                return error;
            }
            if (file_size <= range.end) {
                auto error = MakeReadError(ReadError::Kind::kRangeEndExceedsFileSize, file_size);
                error.start = range.start;
                error.end = range.end;
                return error;
            }
            offset = range.start;
            length = range.end - range.start + 1;
            break;
        case ByteRange::Kind::kSuffixLength:
            // A suffix longer than the file degrades to the whole file.
            length = std::min(range.suffix_length, file_size);
            offset = file_size - length;
            break;
    }

    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) {
        auto error = MakeReadError(ReadError::Kind::kIo, file_size);
        error.message = "failed to seek file " + id;
        return error;
    }
    return ObjectReader(std::move(file), offset, length, file_size);
}

std::string LocalFileSystem::StagingObjectPath(const std::string& id) const {
    return (std::filesystem::path(staging_path_) / id).string();
}

std::string LocalFileSystem::ResidentObjectPath(const std::string& id) const {
    return (std::filesystem::path(resident_path_) / id).string();
}

bool LocalFileSystem::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == ".." || name.front() == '.') {
        return false;
    }
    return true;
}

}  // namespace harbor::storage
