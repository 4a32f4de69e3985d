// tests/unit/storage_provider_test.cpp
#include <gtest/gtest.h>
#include "common/storage/include/FileStorageProvider.hpp"
#include "common/storage/include/InMemoryStorageProvider.hpp"
#include "common/storage/include/StorageProviderFactory.hpp"
#include "common/storage/include/StoragePath.hpp"
#include "common/errors/DataException.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace data_engine;
using namespace data_engine::storage;

namespace fs = std::filesystem;

// ========== FileStorageProvider ==========

class FileStorageProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        base_dir = fs::temp_directory_path() / ("data_engine_storage_" + std::to_string(stamp));
        fs::create_directories(base_dir);
        provider = std::make_unique<FileStorageProvider>(base_dir.string());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_dir, ec);
    }

    void WriteRaw(const std::string& relative, const std::string& content) {
        fs::path full = base_dir / relative;
        fs::create_directories(full.parent_path());
        std::ofstream file(full, std::ios::binary);
        file << content;
    }

    fs::path base_dir;
    std::unique_ptr<FileStorageProvider> provider;
};

TEST_F(FileStorageProviderTest, SaveThenLoadCreatesDirectories) {
    provider->SaveTextAsync("Nested/Dir/Characters.csv", "Id,Name\nhero,Hero\n").get();

    EXPECT_TRUE(fs::is_regular_file(base_dir / "Nested" / "Dir" / "Characters.csv"));
    EXPECT_TRUE(provider->Exists("Nested/Dir/Characters.csv"));
    EXPECT_EQ(provider->LoadTextAsync("Nested/Dir/Characters.csv").get(), "Id,Name\nhero,Hero\n");
}

TEST_F(FileStorageProviderTest, SaveOverwritesExistingContent) {
    provider->SaveTextAsync("Items.json", "[1, 2, 3]").get();
    provider->SaveTextAsync("Items.json", "[]").get();

    EXPECT_EQ(provider->LoadTextAsync("Items.json").get(), "[]");
}

TEST_F(FileStorageProviderTest, LoadMissingFileThrowsNotFound) {
    auto future = provider->LoadTextAsync("Missing.csv");

    try {
        future.get();
        FAIL() << "NotFoundException expected";
    } catch (const NotFoundException& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::NOT_FOUND);
        EXPECT_NE(std::string(e.what()).find("Missing.csv"), std::string::npos);
    }
}

TEST_F(FileStorageProviderTest, ExistsIsFalseForDirectories) {
    fs::create_directories(base_dir / "Localizations");

    EXPECT_FALSE(provider->Exists("Localizations"));
    EXPECT_FALSE(provider->Exists("nothing/here.json"));
}

TEST_F(FileStorageProviderTest, LoadMultipleMatchesPatternAtTopLevelOnly) {
    WriteRaw("Localizations/en.csv", "en");
    WriteRaw("Localizations/ko.csv", "ko");
    WriteRaw("Localizations/readme.txt", "ignored");
    WriteRaw("Localizations/Archive/old.csv", "nested");

    auto files = provider->LoadMultipleTextAsync("Localizations", "*.csv").get();

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files.at("Localizations/en.csv"), "en");
    EXPECT_EQ(files.at("Localizations/ko.csv"), "ko");
}

TEST_F(FileStorageProviderTest, LoadMultipleOnMissingFolderIsEmpty) {
    auto files = provider->LoadMultipleTextAsync("NoSuchFolder", "*.csv").get();
    EXPECT_TRUE(files.empty());
    EXPECT_TRUE(provider->ListFiles("NoSuchFolder").empty());
}

TEST_F(FileStorageProviderTest, ListFilesIsSorted) {
    WriteRaw("Data/b.json", "{}");
    WriteRaw("Data/a.json", "{}");
    WriteRaw("Data/c.csv", "");

    auto files = provider->ListFiles("Data", "*.json");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "Data/a.json");
    EXPECT_EQ(files[1], "Data/b.json");
}

TEST_F(FileStorageProviderTest, DeleteReportsWhetherFileExisted) {
    WriteRaw("Temp.csv", "x");

    EXPECT_TRUE(provider->DeleteAsync("Temp.csv").get());
    EXPECT_FALSE(provider->Exists("Temp.csv"));
    EXPECT_FALSE(provider->DeleteAsync("Temp.csv").get());
}

TEST_F(FileStorageProviderTest, ResolveFilePathIsAbsolute) {
    std::string resolved = provider->ResolveFilePath("./Localizations//en.csv");

    EXPECT_TRUE(fs::path(resolved).is_absolute());
    EXPECT_NE(resolved.find("Localizations"), std::string::npos);
    EXPECT_NE(resolved.find("en.csv"), std::string::npos);
}

// ========== InMemoryStorageProvider ==========

TEST(InMemoryStorageProviderTest, InitialFilesAreNormalized) {
    InMemoryStorageProvider provider({
        {"./Localizations\\en.csv", "en"},
        {"Characters.csv", "Id\n"}
    });

    EXPECT_EQ(provider.FileCount(), 2u);
    EXPECT_TRUE(provider.Exists("Localizations/en.csv"));
    EXPECT_EQ(provider.LoadTextAsync("Localizations/en.csv").get(), "en");
}

TEST(InMemoryStorageProviderTest, MissingFileThrowsNotFoundThroughFuture) {
    InMemoryStorageProvider provider;
    auto future = provider.LoadTextAsync("Items.json");

    EXPECT_THROW(future.get(), NotFoundException);
}

TEST(InMemoryStorageProviderTest, ListFilesExcludesSubfolders) {
    InMemoryStorageProvider provider({
        {"Localizations/en.csv", "en"},
        {"Localizations/ko.csv", "ko"},
        {"Localizations/LocalizationKeys.json", "[]"},
        {"Localizations/Old/ja.csv", "ja"},
        {"LocalizationsExtra/fr.csv", "fr"}
    });

    auto files = provider.ListFiles("Localizations/", "*.csv");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "Localizations/en.csv");
    EXPECT_EQ(files[1], "Localizations/ko.csv");

    auto loaded = provider.LoadMultipleTextAsync("Localizations", "*.json").get();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.begin()->second, "[]");

    EXPECT_TRUE(provider.LoadMultipleTextAsync("Missing", "*").get().empty());
}

TEST(InMemoryStorageProviderTest, ReadOnlyRejectsWrites) {
    InMemoryStorageProvider provider(std::map<std::string, std::string>{{"Items.json", "[]"}});
    provider.SetReadOnly(true);

    EXPECT_TRUE(provider.IsReadOnly());
    EXPECT_THROW(provider.SaveTextAsync("Items.json", "[1]").get(), IOFailureException);
    EXPECT_THROW(provider.DeleteAsync("Items.json").get(), IOFailureException);
    EXPECT_EQ(provider.GetFile("Items.json"), "[]");

    provider.SetReadOnly(false);
    provider.SaveTextAsync("Items.json", "[1]").get();
    EXPECT_EQ(provider.GetFile("Items.json"), "[1]");
}

TEST(InMemoryStorageProviderTest, ResolveFilePathUsesMemoryScheme) {
    InMemoryStorageProvider provider;
    EXPECT_EQ(provider.ResolveFilePath("Data\\Items.json"), "memory://Data/Items.json");
}

// ========== StorageProviderFactory / StoragePath ==========

TEST(StorageProviderFactoryTest, CreatesKnownBackends) {
    auto file = StorageProviderFactory::Create("file", "Resources");
    auto memory = StorageProviderFactory::Create("  MEMORY ");

    ASSERT_NE(file, nullptr);
    ASSERT_NE(memory, nullptr);
    EXPECT_EQ(file->Name(), "file");
    EXPECT_EQ(memory->Name(), "memory");
}

TEST(StorageProviderFactoryTest, UnknownBackendThrows) {
    EXPECT_FALSE(StorageProviderFactory::IsValidBackend("s3"));
    EXPECT_TRUE(StorageProviderFactory::IsValidBackend("File"));
    EXPECT_THROW(StorageProviderFactory::Create("s3"), std::invalid_argument);
    EXPECT_EQ(StorageProviderFactory::GetSupportedBackends().size(), 2u);
}

TEST(StoragePathTest, HelpersHandleLogicalPaths) {
    EXPECT_EQ(NormalizeLogicalPath(".\\a//b\\c.csv"), "a/b/c.csv");
    EXPECT_EQ(JoinLogicalPath("Localizations/", "en.csv"), "Localizations/en.csv");
    EXPECT_EQ(JoinLogicalPath("", "en.csv"), "en.csv");
    EXPECT_EQ(GetFileName("Localizations/zh-CN.csv"), "zh-CN.csv");
    EXPECT_EQ(GetFileStem("Localizations/zh-CN.csv"), "zh-CN");
    EXPECT_TRUE(MatchesPattern("ko.csv", "*.csv"));
    EXPECT_FALSE(MatchesPattern("ko.json", "*.csv"));
    EXPECT_TRUE(MatchesPattern("anything", "*"));
}
