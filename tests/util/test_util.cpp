// XMLWITNESS - Util Module Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>

#include <xmlwitness/util/fs.h>
#include <xmlwitness/util/logging.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace xmlwitness {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& out,
                                          LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [&out](const LogEntry& entry) { out.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_THROW(LogLevelFromString("verbose"), std::invalid_argument);
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>(LogLevel::Info, false);
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, SilentWithoutSinks) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Trace);
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::WITNESS));
}

TEST_F(LoggingTest, LoggerWillLog) {
    std::vector<LogEntry> entries;
    Capture(entries);
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::DEFAULT));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    std::vector<LogEntry> entries;
    Capture(entries);
    auto& logger = Logger::Instance();

    logger.EnableCategory(LogCategory::XML);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::XML));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::WITNESS));

    LOG_INFO(LogCategory::WITNESS) << "dropped";
    LOG_INFO(LogCategory::XML) << "kept";
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::WITNESS));
}

TEST_F(LoggingTest, StreamAndPrintfMacros) {
    std::vector<LogEntry> entries;
    Capture(entries);
    Logger::Instance().SetLevel(LogLevel::Debug);

    LOG_DEBUG(LogCategory::CRYPTO) << "modulus " << 2048 << " bits";
    LogWarnF(LogCategory::WITNESS, "offset %zu of %d", static_cast<size_t>(7), 9);
    LOG_TRACE(LogCategory::CRYPTO) << "below level";

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "modulus 2048 bits");
    EXPECT_EQ(entries[0].category, LogCategory::CRYPTO);
    EXPECT_EQ(entries[0].level, LogLevel::Debug);
    EXPECT_EQ(entries[1].message, "offset 7 of 9");
    EXPECT_EQ(entries[1].level, LogLevel::Warn);
    EXPECT_GT(entries[1].line, 0);
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    std::vector<LogEntry> all;
    std::vector<LogEntry> warnings;
    Capture(all);
    Capture(warnings, LogLevel::Warn);

    LOG_INFO(LogCategory::CLI) << "info";
    LOG_ERROR(LogCategory::CLI) << "error";

    EXPECT_EQ(all.size(), 2u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "error");
}

TEST_F(LoggingTest, ScopedLogTimerLogsAtDebug) {
    std::vector<LogEntry> entries;
    Capture(entries);
    Logger::Instance().SetLevel(LogLevel::Debug);
    {
        ScopedLogTimer timer(LogCategory::WITNESS, "stage");
    }
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].message.find("stage"), std::string::npos);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::XML;
    entry.message = "no KeyInfo";
    entry.file = "/src/xml/dsig.cpp";
    entry.line = 42;

    LogFormat format;
    format.showTimestamp = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] [xml] no KeyInfo");

    format.showLocation = true;
    format.showCategory = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] dsig.cpp:42 no KeyInfo");
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    char path[] = "/tmp/xmlwitness_log_test_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    {
        auto sink = std::make_shared<FileSink>(path, LogLevel::Info);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_INFO(LogCategory::CLI) << "wrote witness";
        Logger::Instance().Flush();
        Logger::Instance().ClearSinks();
    }

    auto content = ReadFile(path);
    std::remove(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_NE(content->find("[cli] "), std::string::npos);
    EXPECT_NE(content->find("wrote witness"), std::string::npos);
}

// ============================================================================
// Filesystem Tests
// ============================================================================

class FilesystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        char path[] = "/tmp/xmlwitness_fs_test_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);
        path_ = path;
    }

    void TearDown() override {
        std::remove(path_.c_str());
        std::remove((path_ + ".tmp").c_str());
    }

    std::string path_;
};

TEST_F(FilesystemTest, FileExists) {
    EXPECT_TRUE(Exists(path_));
    EXPECT_FALSE(Exists(path_ + ".missing"));
    EXPECT_FALSE(Exists("/tmp"));
}

TEST_F(FilesystemTest, ReadWriteFile) {
    std::string content = "{\"dataPadded\":[\"60\"]}\n";
    ASSERT_TRUE(WriteFile(path_, content));

    auto read = ReadFile(path_);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, content);
    EXPECT_FALSE(Exists(path_ + ".tmp"));
}

TEST_F(FilesystemTest, ReadKeepsBinaryBytes) {
    std::string content("a\0b\r\n", 5);
    ASSERT_TRUE(WriteFile(path_, content));
    EXPECT_EQ(ReadFile(path_)->size(), 5u);
}

TEST_F(FilesystemTest, WriteReplacesExisting) {
    ASSERT_TRUE(WriteFile(path_, "first version, longer"));
    ASSERT_TRUE(WriteFile(path_, "second"));
    EXPECT_EQ(*ReadFile(path_), "second");
}

TEST_F(FilesystemTest, MissingFileReadsAsNullopt) {
    EXPECT_FALSE(ReadFile("/nonexistent/dir/signed.xml").has_value());
    EXPECT_FALSE(WriteFile("/nonexistent/dir/out.json", "x"));
}

} // namespace
} // namespace util
} // namespace xmlwitness
