#include <gtest/gtest.h>
#include "tagreg/registry_error.hpp"
#include "tagreg/store_format.hpp"
#include "tagreg/tag_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace tagreg;

class TagStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = std::filesystem::temp_directory_path() /
                  ("tagreg_store_test_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    static void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
    }

    RegistryState sampleState() const {
        RegistryState state;
        state.setKeyScheme(KeyScheme::Qualified);
        state.insert(TagNamespace::Type, "geo::Point", Uuid::generateV4());
        state.insert(TagNamespace::Custom, "test1", Uuid::generateV4());
        return state;
    }

    std::filesystem::path tempDir;
};

TEST_F(TagStoreTest, MissingStoreReadsEmpty) {
    TagStore store(tempDir / "types.toml");
    EXPECT_FALSE(store.exists());
    EXPECT_TRUE(store.read().empty());
    EXPECT_FALSE(store.exists());  // reading never creates the file
}

TEST_F(TagStoreTest, WriteThenRead) {
    TagStore store(tempDir / "types.toml");
    RegistryState state = sampleState();

    store.write(state);
    EXPECT_TRUE(store.exists());
    EXPECT_EQ(store.read(), state);
}

TEST_F(TagStoreTest, WriteCreatesParentDirectories) {
    TagStore store(tempDir / "nested" / "dir" / "types.toml");
    store.write(sampleState());
    EXPECT_TRUE(std::filesystem::exists(tempDir / "nested" / "dir" / "types.toml"));
}

TEST_F(TagStoreTest, WriteLeavesNoTemporaryFiles) {
    TagStore store(tempDir / "types.toml");
    store.write(sampleState());
    store.write(sampleState());

    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(tempDir)) {
        (void)entry;
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(TagStoreTest, LockPathIsSidecar) {
    TagStore store(tempDir / "types.toml");
    EXPECT_EQ(store.lockPath(), tempDir / "types.toml.lock");
}

TEST_F(TagStoreTest, CorruptStoreThrows) {
    auto path = tempDir / "types.toml";
    writeFile(path, "[type_tags]\nFoo = \"definitely not a uuid\"\n");

    TagStore store(path);
    EXPECT_THROW((void)store.read(), StoreCorrupt);
}

TEST_F(TagStoreTest, UnwritableLocationThrows) {
    // Parent "directory" is a regular file, so no directory can be created
    auto blocker = tempDir / "blocker";
    writeFile(blocker, "x");

    TagStore store(blocker / "types.toml");
    EXPECT_THROW(store.write(sampleState()), StoreUnwritable);
    EXPECT_EQ(readFile(blocker), "x");
}

TEST_F(TagStoreTest, ReplaceIsAtomicForOpenReaders) {
    auto path = tempDir / "types.toml";
    TagStore store(path);
    RegistryState before = sampleState();
    store.write(before);

    // A reader that opened the old file keeps seeing the complete old content
    std::ifstream oldReader(path, std::ios::binary);
    ASSERT_TRUE(oldReader.is_open());

    RegistryState after = before;
    after.insert(TagNamespace::Custom, "test2", Uuid::generateV4());
    store.write(after);

    std::stringstream buffer;
    buffer << oldReader.rdbuf();
    EXPECT_EQ(parseStore(buffer.str()), before);
    EXPECT_EQ(store.read(), after);
}

TEST_F(TagStoreTest, InterruptedWriteLeavesOldContents) {
    auto path = tempDir / "types.toml";
    TagStore store(path);
    RegistryState state = sampleState();
    store.write(state);

    // What a process killed mid-save leaves behind: a partial temp file
    writeFile(tempDir / ("types.toml.tmp." + std::to_string(::getpid()) + ".999"),
              "[type_tags]\n\"geo::Poi");

    EXPECT_EQ(store.read(), state);
}

TEST_F(TagStoreTest, WriteFileAtomicallyReplacesContent) {
    auto path = tempDir / "out.txt";
    writeFileAtomically(path, "first");
    EXPECT_EQ(readFile(path), "first");
    writeFileAtomically(path, "second");
    EXPECT_EQ(readFile(path), "second");
}

TEST_F(TagStoreTest, RemoveStaleTemporaries) {
    auto path = tempDir / "types.toml";
    TagStore store(path);
    RegistryState state = sampleState();
    store.write(state);

    writeFile(tempDir / "types.toml.tmp.1234.0", "partial");
    writeFile(tempDir / "types.toml.tmp.1234.1", "partial");
    writeFile(tempDir / "types.toml.lock", "");
    writeFile(tempDir / "types.toml.bak", "keep");

    EXPECT_EQ(store.removeStaleTemporaries(), 2u);
    EXPECT_FALSE(std::filesystem::exists(tempDir / "types.toml.tmp.1234.0"));
    EXPECT_TRUE(std::filesystem::exists(tempDir / "types.toml.lock"));
    EXPECT_TRUE(std::filesystem::exists(tempDir / "types.toml.bak"));
    EXPECT_EQ(store.read(), state);
}

TEST_F(TagStoreTest, RemoveStaleTemporariesWithoutDirectory) {
    TagStore store(tempDir / "missing" / "types.toml");
    EXPECT_EQ(store.removeStaleTemporaries(), 0u);
    EXPECT_FALSE(std::filesystem::exists(tempDir / "missing"));
}
