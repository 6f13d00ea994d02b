/**
 * @file test_fetch_module.cpp
 * @brief Unit tests for the module lifecycle and the file source module
 */

#include <kcenon/fetcher/module/fetch_module.h>

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/fetcher/module/file_source_module.h>

#include <stdexcept>

namespace kcenon::fetcher::test {

namespace {

/**
 * @brief Module whose stages succeed or fail on request
 */
class scripted_module : public fetch_module_base {
public:
    explicit scripted_module(job_config config) : fetch_module_base(std::move(config)) {}

    [[nodiscard]] auto name() const -> std::string_view override { return "scripted"; }

    [[nodiscard]] auto initialize() -> bool override {
        stages.emplace_back("initialize");
        seen_temp_dir = temp_dir();
        return initialize_ok;
    }

    [[nodiscard]] auto fetch() -> fetch_result override {
        stages.emplace_back("fetch");
        if (throw_in_fetch) {
            throw std::runtime_error("disk on fire");
        }

        fetch_result result;
        result.success = fetch_ok;
        if (!fetch_ok) {
            result.error = "remote gone";
            return result;
        }
        auto file = temp_dir() / "payload.csv";
        std::ofstream(file) << "a,b\n";
        result.files_downloaded.push_back(file);
        return result;
    }

    [[nodiscard]] auto validate(const fetch_result& fetched) -> validation_result override {
        stages.emplace_back("validate");
        validation_result result;
        result.upload_folder = "out";
        result.success = validate_ok;
        if (validate_ok) {
            result.valid_files = fetched.files_downloaded;
        } else {
            result.validation_errors = {"x: bad", "y: bad"};
        }
        return result;
    }

    [[nodiscard]] auto upload(const validation_result& validated) -> upload_result override {
        stages.emplace_back("upload");
        return fetch_module_base::upload(validated);
    }

    using fetch_module_base::log_context;

    bool initialize_ok = true;
    bool fetch_ok = true;
    bool validate_ok = true;
    bool throw_in_fetch = false;
    std::vector<std::string> stages;
    std::filesystem::path seen_temp_dir;
};

auto scripted_config() -> job_config {
    job_config config;
    config.job_id = "daily";
    config.service_id = "svc";
    config.channel_number = 4;
    config.source_type = "scripted";
    config.channel_config["channel_number"] = 4;
    return config;
}

}  // namespace

// =============================================================================
// fetch_module_base lifecycle Tests
// =============================================================================

class FetchModuleLifecycleTest : public TempDirectoryFixture {};

TEST_F(FetchModuleLifecycleTest, RunsAllStagesAndRemovesTempDir) {
    scripted_module module(scripted_config());

    auto result = module.execute();

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(module.stages,
              (std::vector<std::string>{"initialize", "fetch", "validate", "upload"}));
    ASSERT_FALSE(module.seen_temp_dir.empty());
    EXPECT_EQ(module.seen_temp_dir.filename().string().rfind("daily_ch4_", 0), 0u);
    EXPECT_FALSE(std::filesystem::exists(module.seen_temp_dir));
    ASSERT_TRUE(result.upload.has_value());
    EXPECT_EQ(result.upload->uploaded_files.size(), 1u);
}

TEST_F(FetchModuleLifecycleTest, LogContextCarriesJobIdentity) {
    scripted_module module(scripted_config());

    auto ctx = module.log_context();

    EXPECT_EQ(ctx.job_id, "daily");
    EXPECT_EQ(ctx.service_id, "svc");
    EXPECT_TRUE(ctx.remote_path.empty());
}

TEST_F(FetchModuleLifecycleTest, InitializeFailureStopsEarly) {
    scripted_module module(scripted_config());
    module.initialize_ok = false;

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Initialization failed");
    EXPECT_EQ(module.stages, (std::vector<std::string>{"initialize"}));
    EXPECT_FALSE(std::filesystem::exists(module.seen_temp_dir));
}

TEST_F(FetchModuleLifecycleTest, MissingRequiredFieldFailsConfigValidation) {
    auto config = scripted_config();
    config.channel_config = YAML::Node(YAML::NodeType::Map);
    scripted_module module(config);

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Config validation failed");
    EXPECT_EQ(module.stages, (std::vector<std::string>{"initialize"}));
}

TEST_F(FetchModuleLifecycleTest, FetchFailureShortCircuits) {
    scripted_module module(scripted_config());
    module.fetch_ok = false;

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Fetch failed");
    EXPECT_EQ(result.details, "remote gone");
    EXPECT_TRUE(result.fetch.has_value());
    EXPECT_FALSE(result.validation.has_value());
    EXPECT_EQ(module.stages, (std::vector<std::string>{"initialize", "fetch"}));
    EXPECT_FALSE(std::filesystem::exists(module.seen_temp_dir));
}

TEST_F(FetchModuleLifecycleTest, ValidationFailureJoinsReasons) {
    scripted_module module(scripted_config());
    module.validate_ok = false;

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Validation failed");
    EXPECT_EQ(result.details, "x: bad; y: bad");
    EXPECT_FALSE(result.upload.has_value());
    EXPECT_EQ(module.stages, (std::vector<std::string>{"initialize", "fetch", "validate"}));
}

TEST_F(FetchModuleLifecycleTest, ExceptionBecomesFailedResult) {
    scripted_module module(scripted_config());
    module.throw_in_fetch = true;

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "disk on fire");
    EXPECT_FALSE(std::filesystem::exists(module.seen_temp_dir));
}

TEST_F(FetchModuleLifecycleTest, UploadCopiesIntoUploadDirectory) {
    auto config = scripted_config();
    config.channel_config["upload_directory"] = (test_dir_ / "upload").string();
    scripted_module module(config);

    auto result = module.execute();

    ASSERT_TRUE(result.success);
    auto expected = test_dir_ / "upload" / "out" / "payload.csv";
    EXPECT_EQ(read_file(expected), "a,b\n");
    ASSERT_TRUE(result.upload.has_value());
    EXPECT_EQ(result.upload->uploaded_files, (std::vector<std::filesystem::path>{expected}));
    EXPECT_EQ(result.upload->upload_folder, "out");
}

// =============================================================================
// file_source_module Tests
// =============================================================================

class FileSourceModuleTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        remote_ = std::make_shared<fake_remote_filesystem>();
        deps_.connect = fixed_connection(remote_);
        deps_.sleeper = sleeper_.function();
    }

    auto load(const std::string& yaml) -> job_config {
        auto config = yaml_job_config_manager::from_document("daily", "svc", YAML::Load(yaml));
        EXPECT_TRUE(config.has_value()) << config.error().message;
        return config.value();
    }

    auto local_document() const -> std::string {
        return "channel_number: 3\n"
               "source_type: local\n"
               "path: /in\n"
               "state_directory: " + state_dir_.string() + "\n"
               "upload_directory: " + (test_dir_ / "upload").string() + "\n";
    }

    std::shared_ptr<fake_remote_filesystem> remote_;
    recording_sleeper sleeper_;
    pipeline_dependencies deps_;
};

TEST_F(FileSourceModuleTest, FetchValidateAndUpload) {
    remote_->add_file("/in/a.csv", "1,2\n");
    remote_->add_file("/in/b.bin", "\x01\x02");
    remote_->add_file("/in/c.JSON", "{}");
    file_source_module module(load(local_document()), deps_);

    auto result = module.execute();

    ASSERT_TRUE(result.success) << result.error.value_or("") << " " << result.details.value_or("");
    ASSERT_TRUE(result.fetch.has_value());
    EXPECT_EQ(result.fetch->files_downloaded.size(), 3u);
    EXPECT_EQ(result.fetch->metadata.total_found, 3u);

    ASSERT_TRUE(result.validation.has_value());
    EXPECT_EQ(result.validation->valid_files.size(), 2u);
    EXPECT_EQ(result.validation->invalid_files.size(), 1u);
    EXPECT_EQ(result.validation->validation_errors,
              (std::vector<std::string>{"b.bin: unsupported file type"}));

    auto folder = test_dir_ / "upload" / "data" / "local" / "ch_3" / "validated";
    EXPECT_TRUE(std::filesystem::exists(folder / "a.csv"));
    EXPECT_TRUE(std::filesystem::exists(folder / "c.JSON"));
    EXPECT_FALSE(std::filesystem::exists(folder / "b.bin"));
    EXPECT_TRUE(remote_->is_closed());
}

TEST_F(FileSourceModuleTest, EmptySourceFailsValidation) {
    remote_->add_directory("/in");
    file_source_module module(load(local_document()), deps_);

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Validation failed");
    EXPECT_EQ(result.details, "No files found");
}

TEST_F(FileSourceModuleTest, ConnectionFailureFailsFetch) {
    deps_.connect = [](const transfer_config&) {
        resolved_connection failed;
        failed.failure = "Connection Refused";
        return failed;
    };
    file_source_module module(load(local_document()), deps_);

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Fetch failed");
    EXPECT_EQ(result.details, "Failed to create connection");
}

TEST_F(FileSourceModuleTest, TransferConfigCarriesResumeKey) {
    remote_->add_file("/in/a.csv", "x");
    file_source_module module(load(local_document()), deps_);

    (void)module.execute();

    ASSERT_TRUE(module.transfer_settings().has_value());
    EXPECT_EQ(module.transfer_settings()->download.instance_id, "daily");
    EXPECT_EQ(module.transfer_settings()->download.channel_id, "ch_3");
    EXPECT_EQ(module.transfer_settings()->connection.type, "local");
}

TEST_F(FileSourceModuleTest, S3RequiresCredentials) {
    file_source_module module(
        load("channel_number: 2\ns3: { connection: { bucket: exports } }\n"), deps_);

    auto result = module.execute();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Config validation failed");
    EXPECT_TRUE(remote_->list_calls().empty());
}

TEST_F(FileSourceModuleTest, FtpRequiresHost) {
    file_source_module module(
        load("channel_number: 2\nftp: { scope: { path: /in } }\n"), deps_);

    auto result = module.execute();

    EXPECT_EQ(result.error, "Config validation failed");
}

TEST_F(FileSourceModuleTest, NameAndUploadFolderFollowSourceType) {
    file_source_module module(
        load("channel_number: 8\nsource_type: sftp\nhost: h\n"), deps_);

    EXPECT_EQ(module.name(), "sftp");
    EXPECT_EQ(module.upload_folder(), "data/sftp/ch_8/validated");
}

}  // namespace kcenon::fetcher::test
