/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include "../../src/util/log.h"
#include "../../src/util/logmanager.h"
#include <fstream>
#include <filesystem>
#include <functional>
#include <thread>
#include <vector>
#include <regex>
#include <unistd.h>
#include <cstdio>

namespace xlease {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel;
        test_log_dir = "/tmp/xlease_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        std::filesystem::remove_all(test_log_dir);
        unsetenv("LOG_LEVEL");
    }

    bool containsLogMessage(const std::string& log_content, const std::string& level, const std::string& message) {
        // [LEVEL] ... message
        std::string pattern = "\\[" + level + "\\].*" + message;
        std::regex re(pattern);
        return std::regex_search(log_content, re);
    }

    std::string captureLogOutput(std::function<void()> func) {
        // The logger writes to stderr when no log file is set
        std::string tmp_file = test_log_dir + "/capture.log";

        int saved_stderr = dup(STDERR_FILENO);
        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        fclose(temp);
        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::ifstream file(tmp_file);
        std::string content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
        std::filesystem::remove(tmp_file);
        return content;
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
};

TEST_F(LoggingTest, DefaultLevelIsWarning) {
    EXPECT_EQ(original_log_level, LOG_WARNING);
}

TEST_F(LoggingTest, LogLevelFiltering) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        trace() << "trace message";
        debug() << "debug message";
        info() << "info message";
        warning() << "warning message";
        error() << "error message";
    });

    EXPECT_FALSE(containsLogMessage(output, "TRACE", "trace message"));
    EXPECT_FALSE(containsLogMessage(output, "DEBUG", "debug message"));
    EXPECT_TRUE(containsLogMessage(output, "INFO", "info message"));
    EXPECT_TRUE(containsLogMessage(output, "WARNING", "warning message"));
    EXPECT_TRUE(containsLogMessage(output, "ERROR", "error message"));
}

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel, LOG_TRACE);

    EXPECT_TRUE(setLogLevelFromString("DEBUG"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    EXPECT_TRUE(setLogLevelFromString("INFO"));
    EXPECT_EQ(logLevel, LOG_INFO);

    EXPECT_TRUE(setLogLevelFromString("WARN")); // Alias
    EXPECT_EQ(logLevel, LOG_WARNING);

    EXPECT_TRUE(setLogLevelFromString("ERROR"));
    EXPECT_EQ(logLevel, LOG_ERROR);

    EXPECT_TRUE(setLogLevelFromString("FATAL")); // Alias
    EXPECT_EQ(logLevel, LOG_SEVERE);

    EXPECT_TRUE(setLogLevelFromString("DeBuG"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    EXPECT_FALSE(setLogLevelFromString("INVALID"));
    EXPECT_EQ(logLevel, LOG_DEBUG);
}

TEST_F(LoggingTest, SetLogLevelFromEnvironment) {
    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_DEBUG);

    setenv("LOG_LEVEL", "ERROR", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_ERROR);

    // Invalid level does not change the current level
    int current_level = logLevel;
    setenv("LOG_LEVEL", "INVALID_LEVEL", 1);
    auto output = captureLogOutput([&]() {
        initLoggingFromEnv();
    });
    EXPECT_EQ(logLevel, current_level);
    EXPECT_TRUE(output.find("Invalid LOG_LEVEL") != std::string::npos);
}

TEST_F(LoggingTest, MessageFormat) {
    logLevel = LOG_INFO;
    const std::string saved = Logger::get().getThreadName();
    Logger::get().setThreadName("worker-1");
    auto output = captureLogOutput([]() {
        info() << "added lease " << 42 << " at " << 3145728ULL;
    });
    Logger::get().setThreadName(saved);

    EXPECT_TRUE(std::regex_search(output,
        std::regex("\\[worker-1\\] \\[INFO\\] added lease 42 at 3145728\\n")));
}

TEST_F(LoggingTest, ThreadSafety) {
    logLevel = LOG_INFO;
    const int num_threads = 8;
    const int messages_per_thread = 50;

    std::string output = captureLogOutput([&]() {
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([i, messages_per_thread]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    info() << "Thread " << i << " message " << j;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    });

    // One line per message, none interleaved
    size_t lines = 0;
    for (char c : output) {
        if (c == '\n') lines++;
    }
    EXPECT_EQ(lines, size_t(num_threads * messages_per_thread));
}

TEST_F(LoggingTest, LogManagerFileOutput) {
    {
        LogManager log_mgr(test_log_dir);
        EXPECT_EQ(log_mgr.path(), test_log_dir + "/xlease.log");

        logLevel = LOG_INFO;
        info() << "test message to file";
        warning() << "warning to file";
    }

    std::string content = readFile(test_log_dir + "/xlease.log");
    EXPECT_TRUE(containsLogMessage(content, "INFO", "test message to file"));
    EXPECT_TRUE(containsLogMessage(content, "WARNING", "warning to file"));

    // Back on stderr after the manager is gone
    auto output = captureLogOutput([]() {
        warning() << "after manager";
    });
    EXPECT_TRUE(output.find("after manager") != std::string::npos);
}

TEST_F(LoggingTest, LogManagerCreatesDirectory) {
    std::string nested = test_log_dir + "/a/b";
    {
        LogManager log_mgr(nested);
        warning() << "nested";
    }
    EXPECT_TRUE(std::filesystem::exists(nested + "/xlease.log"));
}

TEST_F(LoggingTest, LogRotation) {
    {
        LogManager log_mgr(test_log_dir);
        warning() << "before rotation";
        log_mgr.rotate();
        warning() << "after rotation";
    }

    std::string current_log = test_log_dir + "/xlease.log";
    std::string content = readFile(current_log);
    EXPECT_TRUE(content.find("after rotation") != std::string::npos);
    EXPECT_TRUE(content.find("before rotation") == std::string::npos);

    bool found_rotated = false;
    for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
        if (entry.path().string().find("xlease.log.") != std::string::npos) {
            found_rotated = true;
            EXPECT_TRUE(readFile(entry.path().string()).find("before rotation") != std::string::npos);
        }
    }
    EXPECT_TRUE(found_rotated) << "Should have found a rotated log file";
}

TEST_F(LoggingTest, LogManagerRejectsDirectory) {
    std::filesystem::create_directories(test_log_dir + "/xlease.log");
    EXPECT_THROW(LogManager log_mgr(test_log_dir), std::runtime_error);
}

TEST_F(LoggingTest, ErrnoDescription) {
    std::string s = errnoWithDescription(ENOENT);
    EXPECT_TRUE(s.find("errno:2") != std::string::npos);
    EXPECT_TRUE(s.find("No such file") != std::string::npos);
}

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(logLevelToString(LOG_TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LOG_WARNING), "WARNING");
    EXPECT_STREQ(logLevelToString(LOG_SEVERE), "SEVERE");
}

} // namespace xlease
