/*
 * AclKit - Windows Security Interop Library
 * Copyright (C) 2026 AclKit Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <string>

#include "../src/Utils/Logger.hpp"
#include "../src/Utils/JSONUtils.hpp"
#include "TestHelpers.hpp"

using namespace AclKit::Utils;
using AclKit::Tests::TempDirectory;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerFileSinkTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Back to the configuration the test runner starts with
        LoggerConfig cfg;
        cfg.toConsole = true;
        cfg.toFile = false;
        cfg.async = false;
        cfg.minimalLevel = LogLevel::Warn;
        Logger::Instance().Initialize(cfg);
    }

    LoggerConfig FileConfig() const {
        LoggerConfig cfg;
        cfg.toConsole = false;
        cfg.toFile = true;
        cfg.async = false;
        cfg.logDirectory = m_temp.Child(L"logs");
        cfg.baseFileName = L"unit";
        cfg.minimalLevel = LogLevel::Info;
        cfg.flushLevel = LogLevel::Trace;
        return cfg;
    }

    std::string ReadLog(const std::wstring& name) const {
        std::string text;
        FileUtils::Error err;
        EXPECT_TRUE(FileUtils::ReadAllTextUtf8(FileUtils::Combine(m_temp.Child(L"logs"), name), text, &err))
            << "win32=" << err.win32;
        return text;
    }

    TempDirectory m_temp;
};

TEST_F(LoggerFileSinkTest, WritesRecordsAtOrAboveMinimalLevel) {
    Logger::Instance().Initialize(FileConfig());
    ASSERT_TRUE(Logger::Instance().IsInitialized());
    EXPECT_FALSE(Logger::Instance().IsEnabled(LogLevel::Debug));
    EXPECT_TRUE(Logger::Instance().IsEnabled(LogLevel::Info));

    AK_LOG_DEBUG(L"Test", L"hidden %d", 1);
    AK_LOG_INFO(L"Test", L"visible %d", 2);
    AK_LOG_ERROR(L"Test", L"failure %ls", L"text");
    Logger::Instance().ShutDown();

    const std::string text = ReadLog(L"unit.log");
    EXPECT_THAT(text, Not(HasSubstr("hidden 1")));
    EXPECT_THAT(text, HasSubstr("[INFO]"));
    EXPECT_THAT(text, HasSubstr("visible 2"));
    EXPECT_THAT(text, HasSubstr("[ERROR]"));
    EXPECT_THAT(text, HasSubstr("[Test]"));
}

TEST_F(LoggerFileSinkTest, WinErrorRecordCarriesCode) {
    LoggerConfig cfg = FileConfig();
    cfg.jsonLines = true;
    Logger::Instance().Initialize(cfg);

    AK_LOG_WIN_ERROR(L"Registry", ERROR_ACCESS_DENIED, L"cannot open %ls", L"HKCU\\Software");
    Logger::Instance().ShutDown();

    std::istringstream lines(ReadLog(L"unit.log"));
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(lines, line)));
    if (!line.empty() && line.back() == '\r') line.pop_back();

    JSON::Json record;
    JSON::Error jerr;
    ASSERT_TRUE(JSON::Parse(line, record, &jerr)) << jerr.message;
    EXPECT_EQ("ERROR", JSON::GetOr<std::string>(record, "level", ""));
    EXPECT_EQ("Registry", JSON::GetOr<std::string>(record, "category", ""));
    EXPECT_EQ(5, JSON::GetOr<int>(record, "win32", 0));
    EXPECT_THAT(JSON::GetOr<std::string>(record, "message", ""), HasSubstr("HKCU\\Software"));
}

TEST_F(LoggerFileSinkTest, RotatesWhenFileIsFull) {
    LoggerConfig cfg = FileConfig();
    cfg.maxFileSizeBytes = 512;
    cfg.maxFileCount = 3;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 40; ++i) {
        AK_LOG_WARN(L"Rotate", L"record number %d with some padding to fill the file", i);
    }
    Logger::Instance().ShutDown();

    const std::wstring dir = m_temp.Child(L"logs");
    EXPECT_TRUE(FileUtils::Exists(FileUtils::Combine(dir, L"unit.log")));
    EXPECT_TRUE(FileUtils::Exists(FileUtils::Combine(dir, L"unit.1.log")));
    EXPECT_TRUE(FileUtils::Exists(FileUtils::Combine(dir, L"unit.2.log")));
    EXPECT_FALSE(FileUtils::Exists(FileUtils::Combine(dir, L"unit.3.log")));

    // The newest record lives in the active file
    EXPECT_THAT(ReadLog(L"unit.log"), HasSubstr("record number 39"));
}

TEST_F(LoggerFileSinkTest, AsyncDeliveryIsDrainedOnShutDown) {
    LoggerConfig cfg = FileConfig();
    cfg.async = true;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 50; ++i) {
        AK_LOG_INFO(L"Async", L"queued %d", i);
    }
    Logger::Instance().ShutDown();
    EXPECT_FALSE(Logger::Instance().IsInitialized());

    const std::string text = ReadLog(L"unit.log");
    EXPECT_THAT(text, HasSubstr("queued 0"));
    EXPECT_THAT(text, HasSubstr("queued 49"));
}

TEST_F(LoggerFileSinkTest, FlushWaitsForQueuedRecords) {
    LoggerConfig cfg = FileConfig();
    cfg.async = true;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::Block;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 200; ++i) {
        AK_LOG_INFO(L"Flush", L"pending %d", i);
    }
    Logger::Instance().Flush();

    // Logger still owns the file, so read it with write sharing
    const std::wstring path = FileUtils::Combine(m_temp.Child(L"logs"), L"unit.log");
    HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    ASSERT_NE(INVALID_HANDLE_VALUE, h) << "win32=" << ::GetLastError();

    std::string text;
    char buffer[4096];
    DWORD read = 0;
    while (::ReadFile(h, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
        text.append(buffer, read);
    }
    ::CloseHandle(h);

    EXPECT_TRUE(Logger::Instance().IsInitialized());
    EXPECT_THAT(text, HasSubstr("pending 199"));
    Logger::Instance().ShutDown();
}

TEST(LoggerTest, LevelNames) {
    EXPECT_STREQ(L"TRACE", Logger::LevelToString(LogLevel::Trace));
    EXPECT_STREQ(L"WARN", Logger::LevelToString(LogLevel::Warn));
    EXPECT_STREQ(L"FATAL", Logger::LevelToString(LogLevel::Fatal));
}

TEST(LoggerTest, FormatWinErrorIsNotEmpty) {
    EXPECT_FALSE(Logger::FormatWinError(ERROR_ACCESS_DENIED).empty());
}
