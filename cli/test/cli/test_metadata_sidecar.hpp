#pragma once

#include <cli/metadata_sidecar.hpp>
#include <crypto/encryption_pipeline.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <fstream>
#include <iterator>

extern std::filesystem::path programDirectory;

namespace Cli::Test
{
    class MetadataSidecarTests : public ::testing::Test
    {
      protected:
        Utility::TemporaryDirectory directory_{programDirectory / "temp", true};
    };

    TEST_F(MetadataSidecarTests, SidecarSitsNextToTheFile)
    {
        EXPECT_EQ(sidecarPathFor("/data/report.pdf.enc"), std::filesystem::path{"/data/report.pdf.enc.meta.json"});
    }

    TEST_F(MetadataSidecarTests, MissingSidecarIsReported)
    {
        auto metadata = readMetadataSidecar(directory_.path() / "nothing.enc");
        ASSERT_FALSE(metadata.has_value());
        EXPECT_THAT(metadata.error(), ::testing::HasSubstr("missing"));
    }

    TEST_F(MetadataSidecarTests, BrokenSidecarIsReported)
    {
        const auto file = directory_.path() / "broken.enc";
        std::ofstream{sidecarPathFor(file)} << "{\"algorithm\": ";

        auto metadata = readMetadataSidecar(file);
        ASSERT_FALSE(metadata.has_value());
        EXPECT_THAT(metadata.error(), ::testing::HasSubstr("invalid"));
    }

    TEST_F(MetadataSidecarTests, IncompleteSidecarIsReported)
    {
        const auto file = directory_.path() / "partial.enc";
        std::ofstream{sidecarPathFor(file)} << "{\"algorithm\": \"AES-GCM\"}";

        auto metadata = readMetadataSidecar(file);
        ASSERT_FALSE(metadata.has_value());
        EXPECT_THAT(metadata.error(), ::testing::HasSubstr("incomplete"));
    }

    TEST_F(MetadataSidecarTests, EncryptedFileCanBeRestoredFromItsSidecar)
    {
        const auto plain = directory_.path() / "notes.txt";
        const auto encrypted = directory_.path() / "notes.txt.enc";
        const auto restored = directory_.path() / "restored.txt";
        std::ofstream{plain, std::ios_base::binary} << "meeting at noon";

        Crypto::EncryptionPipeline pipeline{};
        auto metadata = pipeline.encryptFile(plain, encrypted, "correct horse");
        ASSERT_TRUE(metadata.has_value()) << metadata.error().toString();
        ASSERT_TRUE(writeMetadataSidecar(encrypted, *metadata).has_value());

        auto loaded = readMetadataSidecar(encrypted);
        ASSERT_TRUE(loaded.has_value()) << loaded.error();
        EXPECT_EQ(loaded->salt, metadata->salt);
        EXPECT_EQ(loaded->iv, metadata->iv);
        EXPECT_EQ(loaded->originalMetadata.originalName, "notes.txt");

        ASSERT_TRUE(pipeline.decryptFile(encrypted, *loaded, restored, "correct horse").has_value());
        std::ifstream reader{restored, std::ios_base::binary};
        const std::string content{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
        EXPECT_EQ(content, "meeting at noon");
    }
}
