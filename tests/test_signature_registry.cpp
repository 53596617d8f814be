#include "verifetch/download/signature_registry.hpp"
#include "verifetch/download/file_destination.hpp"
#include "signature_samples.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace verifetch;
using download::SignatureRegistry;

TEST(SignatureRegistry, EverySampleMatchesOnlyItsOwnSignature) {
    for (const auto& [extension, content] : test::signatureSamples()) {
        std::string header = content.substr(0, 16);
        EXPECT_TRUE(SignatureRegistry::matchSignature(extension, header)) << extension;

        for (const auto& [other, unused] : test::signatureSamples()) {
            if (other != extension) {
                EXPECT_FALSE(SignatureRegistry::matchSignature(other, header))
                    << other << " matched " << extension;
            }
        }
    }
}

TEST(SignatureRegistry, DetectsFirstMatchingExtension) {
    for (const auto& [extension, content] : test::signatureSamples()) {
        auto detected = SignatureRegistry::detectExtension(content.substr(0, 16));
        ASSERT_TRUE(detected) << extension;
        EXPECT_EQ(*detected, extension);
    }
    EXPECT_FALSE(SignatureRegistry::detectExtension(""));
    EXPECT_FALSE(SignatureRegistry::detectExtension("plain text file"));
}

TEST(SignatureRegistry, TableOrderEndsWithBin) {
    const auto& signatures = SignatureRegistry::signatures();
    ASSERT_FALSE(signatures.empty());
    EXPECT_STREQ(signatures.front().extension, "jpg");
    EXPECT_STREQ(signatures.back().extension, "bin");
}

TEST(SignatureRegistry, BinNeverMatches) {
    EXPECT_TRUE(SignatureRegistry::hasSignature("bin"));
    for (const auto& [extension, content] : test::signatureSamples()) {
        EXPECT_FALSE(SignatureRegistry::matchSignature("bin", content));
    }
    EXPECT_FALSE(SignatureRegistry::matchSignature("bin", std::string(16, '\0')));
}

TEST(SignatureRegistry, UnknownExtensionsAndShortHeaders) {
    EXPECT_FALSE(SignatureRegistry::hasSignature("txt"));
    EXPECT_FALSE(SignatureRegistry::matchSignature("txt", "anything"));
    EXPECT_FALSE(SignatureRegistry::matchSignature("png", test::bytes("\x89PNG")));
    EXPECT_FALSE(SignatureRegistry::matchSignature("webp", "RIFF"));
}

TEST(SignatureRegistry, RiffContainersAreDistinguishedBySubtype) {
    std::string webp = test::sampleFor("webp").substr(0, 16);
    std::string wav = test::sampleFor("wav").substr(0, 16);
    EXPECT_TRUE(SignatureRegistry::matchSignature("webp", webp));
    EXPECT_FALSE(SignatureRegistry::matchSignature("wav", webp));
    EXPECT_TRUE(SignatureRegistry::matchSignature("wav", wav));
    EXPECT_FALSE(SignatureRegistry::matchSignature("webp", wav));
}

TEST(SignatureRegistry, AlternativeMagicBytes) {
    EXPECT_TRUE(SignatureRegistry::matchSignature("gif", "GIF87a"));
    EXPECT_TRUE(SignatureRegistry::matchSignature("mp3", test::bytes("\xFF\xFB\x90\x00")));
    EXPECT_TRUE(SignatureRegistry::matchSignature("mp3", test::bytes("\xFF\xF3\x90\x00")));
    EXPECT_TRUE(SignatureRegistry::matchSignature("zip", test::bytes("PK\x05\x06")));
    EXPECT_TRUE(SignatureRegistry::matchSignature("zip", test::bytes("PK\x07\x08")));
    EXPECT_TRUE(SignatureRegistry::matchSignature("swf", "FWS\x0A"));
}

TEST(SignatureRegistry, MimeTypeToExtension) {
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("image/jpeg"), "jpg");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("image/png; charset=binary"), "png");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("png"), "png");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("video/mp4"), "mp4");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("audio/mpeg"), "mp3");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("application/x-7z-compressed"), "7z");
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("application/octet-stream"), "bin");
}

TEST(SignatureRegistry, UnknownMimeTypeFallsBackToBin) {
    test::LogCapture logs;
    EXPECT_EQ(SignatureRegistry::inferExtensionFromMime("x-unknown/x-nothing-like-this"), "bin");
    EXPECT_TRUE(logs.contains("Unknown MIME type 'x-unknown/x-nothing-like-this'"));
}

TEST(SignatureRegistry, AdjustExtensionOnlyWhenContentDisagrees) {
    test::TempDirectory dir;
    download::FileDestinationOptions options;
    options.directory = dir.path();
    options.filename = "file";
    options.extension = "jpg";
    download::FileDestination destination(options);

    EXPECT_FALSE(download::adjustExtension(destination, test::sampleFor("jpg")));
    EXPECT_EQ(destination.extension(), "jpg");

    EXPECT_FALSE(download::adjustExtension(destination, "no known signature"));
    EXPECT_EQ(destination.extension(), "jpg");

    EXPECT_TRUE(download::adjustExtension(destination, test::sampleFor("png")));
    EXPECT_EQ(destination.extension(), "png");
    EXPECT_EQ(destination.realPath(), dir.path() / "file.png");
}
