/**
 * @file test_transfer_state_store.cpp
 * @brief Unit tests for the file-backed resume state
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/fetcher/pipeline/transfer_state_store.h>

namespace kcenon::fetcher::test {

class TransferStateStoreTest : public TempDirectoryFixture {
protected:
    transfer_state_key key_{"job-7", "ch_2"};
};

TEST_F(TransferStateStoreTest, PathEncodesInstanceAndChannel) {
    transfer_state_store store(state_dir_);

    EXPECT_EQ(store.directory(), state_dir_);
    EXPECT_EQ(store.path_for(key_), state_dir_ / "transfer_state_job-7_ch_2.json");
}

TEST_F(TransferStateStoreTest, KeyCannotEscapeDirectory) {
    transfer_state_store store(state_dir_);
    transfer_state_key key{"../jobs/nightly", "ch\\1"};

    auto path = store.path_for(key);

    EXPECT_EQ(path.parent_path(), state_dir_);
    EXPECT_EQ(path.filename().string(), "transfer_state_.._jobs_nightly_ch_1.json");
    ASSERT_TRUE(store.save(key, {"/a"}, {}).has_value());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(TransferStateStoreTest, MissingStateLoadsEmpty) {
    transfer_state_store store(state_dir_);

    auto loaded = store.load(key_);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded.value().empty());
    EXPECT_FALSE(store.exists(key_));
}

TEST_F(TransferStateStoreTest, SaveThenLoad) {
    transfer_state_store store(state_dir_);

    ASSERT_TRUE(store.save(key_, {"/in/a.csv", "/in/b \"q\".csv"}, {"/in/c.csv"}).has_value());
    EXPECT_TRUE(store.exists(key_));

    auto loaded = store.load(key_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().processed_files,
              (std::vector<std::string>{"/in/a.csv", "/in/b \"q\".csv"}));
    EXPECT_EQ(loaded.value().remaining_files, (std::vector<std::string>{"/in/c.csv"}));
    EXPECT_NE(loaded.value().timestamp, std::chrono::system_clock::time_point{});
}

TEST_F(TransferStateStoreTest, SaveLeavesNoTemporaryFile) {
    transfer_state_store store(state_dir_);

    ASSERT_TRUE(store.save(key_, {"/a"}, {"/b"}).has_value());
    ASSERT_TRUE(store.save(key_, {"/a", "/b"}, {}).has_value());

    auto temp_path = store.path_for(key_);
    temp_path += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp_path));
    EXPECT_EQ(store.load(key_).value().processed_files, (std::vector<std::string>{"/a", "/b"}));
}

TEST_F(TransferStateStoreTest, FailedSaveKeepsPreviousDocument) {
    transfer_state_store store(state_dir_);
    ASSERT_TRUE(store.save(key_, {"/a"}, {"/b"}).has_value());

    auto temp_path = store.path_for(key_);
    temp_path += ".tmp";
    std::filesystem::create_directories(temp_path);

    auto saved = store.save(key_, {"/a", "/b"}, {});

    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, error_code::state_write_error);
    auto loaded = store.load(key_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().processed_files, (std::vector<std::string>{"/a"}));
    EXPECT_EQ(loaded.value().remaining_files, (std::vector<std::string>{"/b"}));
}

TEST_F(TransferStateStoreTest, KeysAreIndependent) {
    transfer_state_store store(state_dir_);
    transfer_state_key other{"job-7", "ch_3"};

    ASSERT_TRUE(store.save(key_, {"/a"}, {}).has_value());

    EXPECT_TRUE(store.load(other).value().empty());
}

TEST_F(TransferStateStoreTest, ClearRemovesFile) {
    transfer_state_store store(state_dir_);
    ASSERT_TRUE(store.save(key_, {"/a"}, {"/b"}).has_value());

    ASSERT_TRUE(store.clear(key_).has_value());

    EXPECT_FALSE(store.exists(key_));
    EXPECT_TRUE(store.clear(key_).has_value());
}

TEST_F(TransferStateStoreTest, CorruptedFileIsReported) {
    transfer_state_store store(state_dir_);
    create_text_file(store.path_for(key_), "{ not json");

    auto loaded = store.load(key_);

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

TEST_F(TransferStateStoreTest, MalformedEscapeIsReportedAsCorrupted) {
    transfer_state_store store(state_dir_);
    create_text_file(store.path_for(key_),
                     "{\"processed_files\": [\"/in/\\uZZZZ.csv\"], \"remaining_files\": []}");

    auto loaded = store.load(key_);

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::state_corrupted);
}

TEST_F(TransferStateStoreTest, DocumentWithoutRemainingFiles) {
    auto state = deserialize_transfer_state(R"({"processed_files": ["/x"]})");

    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state.value().processed_files, (std::vector<std::string>{"/x"}));
    EXPECT_TRUE(state.value().remaining_files.empty());
}

TEST_F(TransferStateStoreTest, SerializedDocumentShape) {
    transfer_state state;
    state.processed_files = {"/a"};
    state.timestamp = std::chrono::system_clock::now();

    auto json = serialize_transfer_state(state);

    EXPECT_NE(json.find("\"processed_files\""), std::string::npos);
    EXPECT_NE(json.find("\"remaining_files\": []"), std::string::npos);
    EXPECT_NE(json.find("\"timestamp\""), std::string::npos);
}

}  // namespace kcenon::fetcher::test
