#include "harbor/services/content_inspector.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

namespace harbor::services {

namespace {

constexpr std::size_t kBufferSize = 8192;
constexpr std::size_t kSniffBytes = 512;

struct Signature {
    std::size_t offset;
    const char* magic;
    std::size_t length;
    const char* mime;
};

// Ordered: more specific signatures first.
const Signature kSignatures[] = {
    {0, "\x89PNG\r\n\x1a\n", 8, "image/png"},
    {0, "\xff\xd8\xff", 3, "image/jpeg"},
    {0, "GIF87a", 6, "image/gif"},
    {0, "GIF89a", 6, "image/gif"},
    {0, "BM", 2, "image/bmp"},
    {0, "II*\x00", 4, "image/tiff"},
    {0, "MM\x00*", 4, "image/tiff"},
    {0, "\x00\x00\x01\x00", 4, "image/x-icon"},
    {0, "%PDF-", 5, "application/pdf"},
    {0, "PK\x03\x04", 4, "application/zip"},
    {0, "\x1f\x8b", 2, "application/gzip"},
    {0, "BZh", 3, "application/x-bzip2"},
    {0, "\xfd" "7zXZ\x00", 6, "application/x-xz"},
    {0, "7z\xbc\xaf\x27\x1c", 6, "application/x-7z-compressed"},
    {0, "Rar!\x1a\x07", 6, "application/vnd.rar"},
    {0, "\x7f" "ELF", 4, "application/x-executable"},
    {0, "\x00" "asm", 4, "application/wasm"},
    {0, "SQLite format 3\x00", 16, "application/vnd.sqlite3"},
    {0, "OggS", 4, "audio/ogg"},
    {0, "fLaC", 4, "audio/x-flac"},
    {0, "ID3", 3, "audio/mpeg"},
    {0, "\x1a\x45\xdf\xa3", 4, "video/x-matroska"},
    {0, "wOFF", 4, "font/woff"},
    {0, "wOF2", 4, "font/woff2"},
    {4, "ftyp", 4, "video/mp4"},
};

bool Matches(const unsigned char* data, std::size_t size, const Signature& sig) {
    if (size < sig.offset + sig.length) {
        return false;
    }
    return std::memcmp(data + sig.offset, sig.magic, sig.length) == 0;
}

bool MatchesAt(const unsigned char* data, std::size_t size, std::size_t offset,
               const char* magic) {
    const auto length = std::strlen(magic);
    return size >= offset + length && std::memcmp(data + offset, magic, length) == 0;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

std::optional<std::string> SniffMime(const unsigned char* data, std::size_t size) {
    // RIFF containers carry their format in bytes 8..11.
    if (MatchesAt(data, size, 0, "RIFF")) {
        if (MatchesAt(data, size, 8, "WEBP")) {
            return std::string("image/webp");
        }
        if (MatchesAt(data, size, 8, "WAVE")) {
            return std::string("audio/wav");
        }
        if (MatchesAt(data, size, 8, "AVI ")) {
            return std::string("video/x-msvideo");
        }
    }
    for (const auto& sig : kSignatures) {
        if (Matches(data, size, sig)) {
            return std::string(sig.mime);
        }
    }
    return std::nullopt;
}

std::optional<std::string> GuessMimeFromName(const std::string& name) {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return std::nullopt;
    }
    const auto ext = ToLower(name.substr(dot + 1));

    if (ext == "txt" || ext == "log") return std::string("text/plain");
    if (ext == "md") return std::string("text/markdown");
    if (ext == "csv") return std::string("text/csv");
    if (ext == "html" || ext == "htm") return std::string("text/html");
    if (ext == "css") return std::string("text/css");
    if (ext == "js" || ext == "mjs") return std::string("text/javascript");
    if (ext == "json") return std::string("application/json");
    if (ext == "xml") return std::string("application/xml");
    if (ext == "yaml" || ext == "yml") return std::string("application/yaml");
    if (ext == "svg") return std::string("image/svg+xml");
    if (ext == "png") return std::string("image/png");
    if (ext == "jpg" || ext == "jpeg") return std::string("image/jpeg");
    if (ext == "gif") return std::string("image/gif");
    if (ext == "webp") return std::string("image/webp");
    if (ext == "pdf") return std::string("application/pdf");
    if (ext == "zip") return std::string("application/zip");
    if (ext == "gz") return std::string("application/gzip");
    if (ext == "tar") return std::string("application/x-tar");
    if (ext == "mp3") return std::string("audio/mpeg");
    if (ext == "wav") return std::string("audio/wav");
    if (ext == "mp4") return std::string("video/mp4");
    if (ext == "webm") return std::string("video/webm");
    return std::nullopt;
}

core::Result<ContentInfo> InspectContent(const std::string& path, const std::string& name,
                                         const std::optional<std::string>& declared_mime) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open staged bytes"};
    }

    Poco::SHA2Engine256 sha256;
    std::array<unsigned char, kSniffBytes> head{};
    std::size_t head_size = 0;
    std::uint64_t total = 0;
    std::array<char, kBufferSize> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytes = in.gcount();
        if (bytes <= 0) {
            break;
        }
        if (head_size < head.size()) {
            const auto take = std::min(head.size() - head_size, static_cast<std::size_t>(bytes));
            std::memcpy(head.data() + head_size, buffer.data(), take);
            head_size += take;
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
        total += static_cast<std::uint64_t>(bytes);
    }
    if (in.bad()) {
        return core::Error{core::ErrorCode::kIoError, "failed to read staged bytes"};
    }

    ContentInfo info;
    info.size_bytes = total;
    info.hash = Poco::DigestEngine::digestToHex(sha256.digest());
    if (declared_mime && !declared_mime->empty()) {
        info.mime = *declared_mime;
    } else if (auto sniffed = SniffMime(head.data(), head_size)) {
        info.mime = *sniffed;
    } else if (auto guessed = GuessMimeFromName(name)) {
        info.mime = *guessed;
    } else {
        info.mime = kDefaultMime;
    }
    return info;
}

}  // namespace harbor::services
