/**
 * @file test_strand_log.cpp
 * @brief Strand日志层测试
 */

#include "strand/common/log/strand_log_manager.h"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace strand::common::log;

/**
 * @brief 日志管理器测试类
 */
class StrandLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        StrandLogManager::Instance().Shutdown();
    }
    
    void TearDown() override {
        StrandLogManager::Instance().Shutdown();
    }
    
    std::shared_ptr<::spdlog::logger> CaptureLogger(const std::string& name) {
        auto sink = std::make_shared<::spdlog::sinks::ostream_sink_mt>(captured_);
        auto logger = std::make_shared<::spdlog::logger>(name, sink);
        logger->set_pattern("%l|%v");
        logger->set_level(::spdlog::level::info);
        StrandLogManager::Instance().RegisterLogger(logger);
        return logger;
    }
    
    std::ostringstream captured_;
};

TEST_F(StrandLogTest, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::OFF);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(ParseLogLevel("INFO").has_value());
    
    EXPECT_EQ(ToSpdlogLevel(LogLevel::ERROR), ::spdlog::level::err);
}

TEST_F(StrandLogTest, InitializeFromStringCreatesConfiguredLoggers) {
    ASSERT_TRUE(StrandLogManager::Instance().InitializeFromString(R"({
        "global": { "log_level": "warn" },
        "loggers": [
            { "name": "injector" },
            { "name": "quiet", "level": "off" }
        ]
    })"));
    
    EXPECT_TRUE(StrandLogManager::Instance().IsInitialized());
    
    const auto* injector_config = StrandLogManager::Instance().GetConfig().GetLoggerConfig("injector");
    ASSERT_NE(injector_config, nullptr);
    EXPECT_EQ(injector_config->level, LogLevel::WARN);
    EXPECT_TRUE(injector_config->file.empty());
    EXPECT_FALSE(injector_config->console);
    
    auto quiet = STRAND_GET_LOGGER("quiet");
    ASSERT_NE(quiet, nullptr);
    EXPECT_EQ(quiet->level(), ::spdlog::level::off);
    EXPECT_TRUE(quiet->sinks().empty());
}

TEST_F(StrandLogTest, InvalidConfigRejected) {
    EXPECT_FALSE(StrandLogManager::Instance().InitializeFromString("not json"));
    EXPECT_FALSE(StrandLogManager::Instance().InitializeFromString(R"({"global": {"log_level": "loud"}})"));
    EXPECT_FALSE(StrandLogManager::Instance().InitializeFromString(R"({"loggers": [{"name": "a", "level": "x"}]})"));
    EXPECT_FALSE(StrandLogManager::Instance().InitializeFromString(R"({"loggers": [{"level": "info"}]})"));
    EXPECT_FALSE(StrandLogManager::Instance().IsInitialized());
}

TEST_F(StrandLogTest, UnconfiguredLoggerHasNoSinks) {
    auto logger = STRAND_GET_LOGGER("never_configured");
    ASSERT_NE(logger, nullptr);
    EXPECT_TRUE(logger->sinks().empty());
    EXPECT_EQ(logger->level(), ::spdlog::level::info);
    EXPECT_EQ(STRAND_GET_LOGGER("never_configured"), logger);
}

TEST_F(StrandLogTest, FileLoggerWritesDailyFile) {
    const auto log_dir = std::filesystem::temp_directory_path() / "strand_log_file_test" / "nested";
    std::filesystem::remove_all(log_dir.parent_path());
    
    nlohmann::json config = {
        {"loggers", nlohmann::json::array({
            {{"name", "audit"}, {"level", "info"}, {"file", (log_dir / "audit.log").string()}},
        })},
    };
    ASSERT_TRUE(StrandLogManager::Instance().InitializeFromJson(config));
    
    auto logger = STRAND_GET_LOGGER("audit");
    ASSERT_NE(logger, nullptr);
    ASSERT_EQ(logger->sinks().size(), 1u);
    logger->info("member graph validated");
    logger->flush();
    
    ASSERT_TRUE(std::filesystem::is_directory(log_dir));
    std::string content;
    size_t file_count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        ++file_count;
        EXPECT_EQ(entry.path().filename().string().rfind("audit_", 0), 0u);
        std::ifstream file(entry.path());
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }
    EXPECT_EQ(file_count, 1u);
    EXPECT_NE(content.find("[audit] [info] member graph validated"), std::string::npos);
    
    StrandLogManager::Instance().Shutdown();
    std::filesystem::remove_all(log_dir.parent_path());
}

TEST_F(StrandLogTest, LoggerSinkWritesEachStatement) {
    CaptureLogger("events");
    
    auto sink = MakeLoggerSink("events", LogLevel::WARN);
    sink("a - get");
    sink("a - constructing");
    
    EXPECT_EQ(captured_.str(), "warning|a - get\nwarning|a - constructing\n");
}

TEST_F(StrandLogTest, LoggerSinkRespectsLoggerLevel) {
    CaptureLogger("events");
    
    auto sink = MakeLoggerSink("events");
    sink("a - get");
    EXPECT_TRUE(captured_.str().empty());
    
    StrandLogManager::Instance().SetGlobalLogLevel(LogLevel::DEBUG);
    sink("a - get");
    EXPECT_EQ(captured_.str(), "debug|a - get\n");
}

TEST_F(StrandLogTest, MacrosUseRegisteredLogger) {
    CaptureLogger("injector");
    
    STRAND_LOG_INFO("injector", "created with {} members", 4);
    STRAND_LOG_DEBUG("injector", "filtered");
    
    EXPECT_EQ(captured_.str(), "info|created with 4 members\n");
}
