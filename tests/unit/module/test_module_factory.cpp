/**
 * @file test_module_factory.cpp
 * @brief Unit tests for source-type to module resolution
 */

#include <gtest/gtest.h>

#include <kcenon/fetcher/module/file_source_module.h>
#include <kcenon/fetcher/module/module_factory.h>

namespace kcenon::fetcher::test {

namespace {

auto config_of(const std::string& source_type) -> job_config {
    job_config config;
    config.job_id = "job";
    config.service_id = "svc";
    config.channel_number = 1;
    config.source_type = source_type;
    return config;
}

}  // namespace

TEST(ModuleFactoryTest, EmptyFactorySupportsNothing) {
    module_factory factory;

    EXPECT_TRUE(factory.supported_types().empty());
    EXPECT_FALSE(factory.supports("ftp"));

    auto created = factory.create(config_of("ftp"));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::unsupported_source_type);
}

TEST(ModuleFactoryTest, DefaultModulesCoverFileSources) {
    auto factory = module_factory::with_default_modules();

    EXPECT_EQ(factory.supported_types(),
              (std::vector<std::string>{"ftp", "local", "s3", "sftp"}));

    auto created = factory.create(config_of("sftp"));
    ASSERT_TRUE(created.has_value()) << created.error().message;
    EXPECT_EQ(created.value()->name(), "sftp");
    EXPECT_NE(dynamic_cast<file_source_module*>(created.value().get()), nullptr);
}

TEST(ModuleFactoryTest, UnknownTypeIsRejected) {
    auto factory = module_factory::with_default_modules();

    auto created = factory.create(config_of("gopher"));

    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::unsupported_source_type);
    EXPECT_EQ(created.error().message, "unsupported source type: gopher");
}

TEST(ModuleFactoryTest, SourceTypesAreCaseInsensitive) {
    auto factory = module_factory::with_default_modules();

    EXPECT_TRUE(factory.supports("S3"));
    EXPECT_TRUE(factory.create(config_of("FTP")).has_value());
}

TEST(ModuleFactoryTest, RegisteredCreatorReplacesDefault) {
    auto factory = module_factory::with_default_modules();
    int calls = 0;
    factory.register_module("LOCAL", [&calls](const job_config& config) {
        ++calls;
        return std::make_unique<file_source_module>(config);
    });

    EXPECT_TRUE(factory.create(config_of("local")).has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(factory.supported_types().size(), 4u);
}

TEST(ModuleFactoryTest, NullCreatorResultIsReported) {
    module_factory factory;
    factory.register_module("broken", [](const job_config&) {
        return std::unique_ptr<fetch_module>();
    });

    auto created = factory.create(config_of("broken"));

    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::module_initialization_failed);
}

}  // namespace kcenon::fetcher::test
