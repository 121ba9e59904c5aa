#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "harbor/services/content_inspector.h"

namespace {

using harbor::services::GuessMimeFromName;
using harbor::services::InspectContent;
using harbor::services::SniffMime;

std::optional<std::string> Sniff(const std::string& bytes) {
    return SniffMime(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::filesystem::path WriteTempFile(const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("harbor_mime_" + Poco::UUIDGenerator().createOne().toString());
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

}  // namespace

TEST(ContentInspector, SniffsKnownSignatures) {
    EXPECT_EQ(Sniff(std::string("\x89PNG\r\n\x1a\n", 8)), "image/png");
    EXPECT_EQ(Sniff("\xff\xd8\xff\xe0"), "image/jpeg");
    EXPECT_EQ(Sniff("GIF89a...."), "image/gif");
    EXPECT_EQ(Sniff("%PDF-1.7"), "application/pdf");
    EXPECT_EQ(Sniff(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16)), "image/webp");
    EXPECT_EQ(Sniff(std::string("RIFF\x10\x00\x00\x00WAVEfmt ", 16)), "audio/wav");
    EXPECT_EQ(Sniff(std::string("\x00\x00\x00\x18" "ftypmp42", 12)), "video/mp4");
    EXPECT_EQ(Sniff("PK\x03\x04"), "application/zip");
    EXPECT_EQ(Sniff("plain words"), std::nullopt);
    EXPECT_EQ(Sniff(""), std::nullopt);
}

TEST(ContentInspector, GuessesFromExtension) {
    EXPECT_EQ(GuessMimeFromName("Report.PDF"), "application/pdf");
    EXPECT_EQ(GuessMimeFromName("archive.tar"), "application/x-tar");
    EXPECT_EQ(GuessMimeFromName("data.json"), "application/json");
    EXPECT_EQ(GuessMimeFromName("noextension"), std::nullopt);
    EXPECT_EQ(GuessMimeFromName("trailingdot."), std::nullopt);
    EXPECT_EQ(GuessMimeFromName("file.unknownext"), std::nullopt);
}

TEST(ContentInspector, DeclaredMimeWins) {
    const auto path = WriteTempFile("%PDF-1.4 body");

    auto info = InspectContent(path.string(), "doc.txt", std::string("application/x-custom"));
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info.value().mime, "application/x-custom");
    EXPECT_EQ(info.value().size_bytes, 13u);

    auto sniffed = InspectContent(path.string(), "doc.txt", std::nullopt);
    ASSERT_TRUE(sniffed.ok());
    EXPECT_EQ(sniffed.value().mime, "application/pdf");

    std::filesystem::remove(path);
}

TEST(ContentInspector, HashesContent) {
    const auto path = WriteTempFile("file content");

    auto info = InspectContent(path.string(), "blob", std::nullopt);
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info.value().hash,
              "e0ac3601005dfa1864f5392aabaf7d898b1b5bab854f1acb4491bcd806b76b0c");
    EXPECT_EQ(info.value().mime, "application/octet-stream");
    EXPECT_EQ(info.value().size_bytes, 12u);

    std::filesystem::remove(path);
}

TEST(ContentInspector, MissingFileIsIoError) {
    auto info = InspectContent("/nonexistent/harbor/file", "x", std::nullopt);
    ASSERT_FALSE(info.ok());
    EXPECT_EQ(info.error().code, harbor::core::ErrorCode::kIoError);
}
