#include <gtest/gtest.h>
#include "ginseng/storage/blob_index.hpp"
#include "ginseng/storage/path_resolver.hpp"
#include "ginseng/storage/share_metadata.hpp"
#include "ginseng/storage/storage_config.hpp"
#include "ginseng/crypto/hash.hpp"
#include <filesystem>
#include <limits>
#include <fstream>
#include <random>
#include <unistd.h>

using namespace ginseng::storage;
using namespace ginseng::crypto;
using ginseng::core::TransferError;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("ginseng_storage_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    std::filesystem::path create_test_file(const std::filesystem::path& relative, size_t size) {
        auto file_path = test_dir_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file(file_path, std::ios::binary);
        
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>(dist(rng)));
        }
        return file_path;
    }
    
    static ShareMetadata sample_metadata(ShareType type) {
        ShareMetadata metadata;
        metadata.share_type = type;
        metadata.name = "photos";
        metadata.files.push_back({"a.jpg", "a.jpg", 100, hash_utils::to_hex(hash_utils::hash_string("a"))});
        metadata.files.push_back({"b.jpg", "trip/b.jpg", 250, hash_utils::to_hex(hash_utils::hash_string("b"))});
        metadata.total_size = 350;
        return metadata;
    }
    
    std::filesystem::path test_dir_;
};

TEST_F(StorageTest, StorageConfigLayout) {
    StorageConfig config(test_dir_ / "node");
    
    EXPECT_EQ(config.blob_directory, test_dir_ / "node" / "blobs");
    EXPECT_EQ(config.incomplete_directory, test_dir_ / "node" / "incomplete");
    EXPECT_EQ(config.database_path, test_dir_ / "node" / "index.db");
    EXPECT_TRUE(config.validate());
    
    EXPECT_EQ(config.get_blob_path("abcdef"), config.blob_directory / "ab" / "abcdef");
    EXPECT_EQ(config.get_incomplete_path("x.part"), config.incomplete_directory / "x.part");
    
    ASSERT_TRUE(config.create_directories());
    EXPECT_TRUE(std::filesystem::is_directory(config.blob_directory));
    EXPECT_TRUE(std::filesystem::is_directory(config.incomplete_directory));
    EXPECT_GT(config.get_available_space(), 0u);
    EXPECT_TRUE(config.has_sufficient_space(1));
    EXPECT_FALSE(config.has_sufficient_space(std::numeric_limits<uint64_t>::max()));
    
    config.chunk_size = 512;
    EXPECT_FALSE(config.validate());
    EXPECT_FALSE(StorageConfig().validate());
}

TEST_F(StorageTest, ShareMetadataSerialization) {
    auto metadata = sample_metadata(ShareType::DIRECTORY);
    auto text = metadata.serialize();
    
    ShareMetadata parsed;
    auto result = ShareMetadata::deserialize(text, parsed);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(parsed, metadata);
    
    // Canonical text is stable, so the share hash is too
    EXPECT_EQ(parsed.serialize(), text);
}

TEST_F(StorageTest, ShareMetadataRejectsMalformedText) {
    ShareMetadata parsed;
    EXPECT_EQ(ShareMetadata::deserialize("not json", parsed).error, TransferError::METADATA_ERROR);
    EXPECT_EQ(ShareMetadata::deserialize("{\"files\":[]}", parsed).error, TransferError::METADATA_ERROR);
    
    auto text = sample_metadata(ShareType::DIRECTORY).serialize();
    auto pos = text.find("directory");
    text.replace(pos, 9, "bucket___");
    auto result = ShareMetadata::deserialize(text, parsed);
    EXPECT_EQ(result.error, TransferError::METADATA_ERROR);
    EXPECT_EQ(result.message, "Unknown share type");
}

TEST_F(StorageTest, ShareMetadataValidation) {
    auto metadata = sample_metadata(ShareType::MULTIPLE_FILES);
    EXPECT_TRUE(metadata.validate().success());
    
    auto traversal = metadata;
    traversal.files[1].relative_path = "../../etc/passwd";
    EXPECT_EQ(traversal.validate().error, TransferError::METADATA_ERROR);
    
    auto absolute = metadata;
    absolute.files[1].relative_path = "/etc/passwd";
    EXPECT_EQ(absolute.validate().error, TransferError::METADATA_ERROR);
    
    auto bad_name = metadata;
    bad_name.files[0].name = "../a.jpg";
    EXPECT_EQ(bad_name.validate().error, TransferError::METADATA_ERROR);
    
    auto bad_share_name = sample_metadata(ShareType::DIRECTORY);
    bad_share_name.name = "..";
    EXPECT_EQ(bad_share_name.validate().error, TransferError::METADATA_ERROR);
    
    auto duplicate = metadata;
    duplicate.files[1].relative_path = "a.jpg";
    duplicate.files[1].name = "a.jpg";
    auto duplicate_result = duplicate.validate();
    EXPECT_EQ(duplicate_result.error, TransferError::METADATA_ERROR);
    EXPECT_EQ(duplicate_result.message, "Duplicate file in share: a.jpg");
    
    auto missing_hash = metadata;
    missing_hash.files[0].hash.clear();
    EXPECT_EQ(missing_hash.validate().error, TransferError::METADATA_ERROR);
    
    auto wrong_total = metadata;
    wrong_total.total_size = 1;
    EXPECT_EQ(wrong_total.validate().error, TransferError::METADATA_ERROR);
    
    ShareMetadata empty;
    EXPECT_EQ(empty.validate().error, TransferError::METADATA_ERROR);
}

TEST_F(StorageTest, DestinationPaths) {
    std::filesystem::path downloads = "/home/user/Downloads";
    
    auto directory = sample_metadata(ShareType::DIRECTORY);
    EXPECT_EQ(directory.destination_root(downloads), downloads / "photos");
    EXPECT_EQ(directory.destination_for(downloads, directory.files[1]),
              downloads / "photos" / "trip" / "b.jpg");
    
    auto multiple = sample_metadata(ShareType::MULTIPLE_FILES);
    EXPECT_EQ(multiple.destination_root(downloads), downloads);
    EXPECT_EQ(multiple.destination_for(downloads, multiple.files[1]), downloads / "trip" / "b.jpg");
    
    auto single = sample_metadata(ShareType::SINGLE_FILE);
    EXPECT_EQ(single.destination_for(downloads, single.files[0]), downloads / "a.jpg");
}

TEST_F(StorageTest, ShareTypeNames) {
    EXPECT_STREQ(to_string(ShareType::MULTIPLE_FILES), "multiple_files");
    EXPECT_EQ(share_type_from_string("directory"), ShareType::DIRECTORY);
    EXPECT_FALSE(share_type_from_string("Directory").has_value());
}

TEST_F(StorageTest, BlobIndexBlobs) {
    BlobIndex index(test_dir_ / "index.db");
    ASSERT_TRUE(index.initialize());
    ASSERT_TRUE(index.is_open());
    
    EXPECT_FALSE(index.has_blob("aa11"));
    EXPECT_TRUE(index.add_blob("aa11", 1024));
    EXPECT_TRUE(index.add_blob("bb22", 2048));
    EXPECT_TRUE(index.add_blob("aa11", 1024));
    
    EXPECT_TRUE(index.has_blob("aa11"));
    EXPECT_EQ(index.get_blob_size("bb22"), 2048u);
    EXPECT_EQ(index.get_blob_count(), 2u);
    EXPECT_EQ(index.get_total_size(), 3072u);
    
    EXPECT_TRUE(index.remove_blob("aa11").success());
    EXPECT_FALSE(index.has_blob("aa11"));
    EXPECT_EQ(index.get_blob_count(), 1u);
}

TEST_F(StorageTest, BlobIndexShares) {
    BlobIndex index(test_dir_ / "index.db");
    ASSERT_TRUE(index.initialize());
    
    auto metadata = sample_metadata(ShareType::DIRECTORY);
    auto manifest = metadata.serialize();
    auto share_hash = hash_utils::to_hex(hash_utils::hash_string(manifest));
    ASSERT_TRUE(index.add_share(share_hash, manifest, metadata));
    
    std::string stored;
    ASSERT_TRUE(index.get_manifest(share_hash, stored).success());
    EXPECT_EQ(stored, manifest);
    EXPECT_EQ(index.get_manifest("unknown", stored).error, TransferError::METADATA_ERROR);
    
    auto shares = index.list_shares();
    ASSERT_EQ(shares.size(), 1u);
    EXPECT_EQ(shares[0].share_hash, share_hash);
    EXPECT_EQ(shares[0].name, "photos");
    EXPECT_EQ(shares[0].share_type, ShareType::DIRECTORY);
    EXPECT_EQ(shares[0].total_size, 350u);
    EXPECT_EQ(shares[0].file_count, 2u);
    EXPECT_EQ(index.get_share_count(), 1u);
}

TEST_F(StorageTest, BlobIndexPersistsAcrossReopen) {
    {
        BlobIndex index(test_dir_ / "index.db");
        ASSERT_TRUE(index.initialize());
        ASSERT_TRUE(index.add_blob("cc33", 77));
    }
    
    BlobIndex reopened(test_dir_ / "index.db");
    ASSERT_TRUE(reopened.initialize());
    EXPECT_EQ(reopened.get_blob_size("cc33"), 77u);
}

TEST_F(StorageTest, ResolveMissingPath) {
    FilesystemPathResolver resolver;
    ResolvedPath resolved;
    
    auto result = resolver.resolve((test_dir_ / "nope.txt").string(), resolved);
    EXPECT_EQ(result.error, TransferError::PATH_ERROR);
    EXPECT_FALSE(resolved.exists);
    
    EXPECT_EQ(resolver.resolve("", resolved).error, TransferError::PATH_ERROR);
}

TEST_F(StorageTest, ResolveSingleFile) {
    auto file = create_test_file("report.pdf", 4096);
    FilesystemPathResolver resolver;
    
    ResolvedPath resolved;
    ASSERT_TRUE(resolver.resolve(file.string(), resolved).success());
    EXPECT_TRUE(resolved.exists);
    EXPECT_FALSE(resolved.is_directory);
    EXPECT_EQ(resolved.size, 4096u);
    
    std::vector<LocalFile> files;
    ASSERT_TRUE(resolver.enumerate(resolved, files).success());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, "report.pdf");
    EXPECT_EQ(files[0].relative_path, "report.pdf");
    EXPECT_EQ(files[0].size, 4096u);
}

TEST_F(StorageTest, EnumerateDirectory) {
    create_test_file("share/readme.txt", 10);
    create_test_file("share/docs/file.txt", 20);
    create_test_file("share/docs/deep/notes.md", 30);
    std::filesystem::create_directories(test_dir_ / "share" / "empty");
    
    FilesystemPathResolver resolver;
    ResolvedPath resolved;
    ASSERT_TRUE(resolver.resolve((test_dir_ / "share").string(), resolved).success());
    EXPECT_TRUE(resolved.is_directory);
    EXPECT_EQ(resolved.size, 60u);
    
    std::vector<LocalFile> files;
    ASSERT_TRUE(resolver.enumerate(resolved, files).success());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].relative_path, "docs/deep/notes.md");
    EXPECT_EQ(files[1].relative_path, "docs/file.txt");
    EXPECT_EQ(files[1].name, "file.txt");
    EXPECT_EQ(files[1].size, 20u);
    EXPECT_EQ(files[2].relative_path, "readme.txt");
}
