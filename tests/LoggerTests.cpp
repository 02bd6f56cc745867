#include <gtest/gtest.h>

#include <filesystem>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "Logger.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;
using namespace TestSupport;

namespace
{
    std::vector<std::string> SplitLines(const std::string& Contents)
    {
        std::vector<std::string> Lines;
        std::istringstream Stream(Contents);
        std::string Line;
        while (std::getline(Stream, Line))
        {
            Lines.push_back(Line);
        }
        return Lines;
    }
}

class LoggerTest : public ::testing::Test
{
protected:
    TempDir Scratch;
};

TEST_F(LoggerTest, ConcurrentWritersNeverInterleaveLines)
{
    constexpr int THREADS = 8;
    constexpr int ENTRIES = 200;
    ScopedTestLog TestLog(Scratch.Path() / "concurrent.log");

    std::vector<std::thread> Writers;
    for (int t = 0; t < THREADS; ++t)
    {
        Writers.emplace_back([t]()
        {
            for (int i = 0; i < ENTRIES; ++i)
            {
                const std::string Message = "writer " + std::to_string(t) + " entry " + std::to_string(i) + " " + std::string(64, 'x');
                switch (i % 4)
                {
                case 0:  Log.Info(Message); break;
                case 1:  Log.Success(Message); break;
                case 2:  Log.Warning(Message); break;
                default: Log.Error(Message); break;
                }
            }
        });
    }
    for (auto& Writer : Writers)
    {
        Writer.join();
    }

    const std::vector<std::string> Lines = SplitLines(TestLog.Contents());
    ASSERT_EQ(Lines.size(), static_cast<size_t>(THREADS * ENTRIES));

    const std::regex Shape(R"(^\d{4}-\d\d-\d\d \d\d:\d\d:\d\d \[(INFO|SUCCESS|WARNING|ERROR)\] writer \d+ entry \d+ x{64}$)");
    for (const auto& Line : Lines)
    {
        EXPECT_TRUE(std::regex_match(Line, Shape)) << Line;
    }
}

TEST_F(LoggerTest, InitAppendsToExistingFile)
{
    const FS::path File = Scratch.Path() / "existing.log";
    WriteFile(File, "earlier run\n");

    Logger Local;
    Local.SetConsoleEcho(false);
    ASSERT_TRUE(Local.Init(File.string()));
    Local.Warning("second run");
    Local.Close();

    const std::vector<std::string> Lines = SplitLines(ReadFile(File));
    ASSERT_EQ(Lines.size(), 2u);
    EXPECT_EQ(Lines[0], "earlier run");
    EXPECT_NE(Lines[1].find("[WARNING] second run"), std::string::npos);
}

TEST_F(LoggerTest, InitCreatesMissingParentFolders)
{
    const FS::path File = Scratch.Path() / "logs" / "nested" / "run.log";

    Logger Local;
    Local.SetConsoleEcho(false);
    ASSERT_TRUE(Local.Init(File.string()));
    Local.Info("hello");
    Local.Close();

    EXPECT_EQ(Local.CurrentLogFilePath, File.string());
    EXPECT_NE(ReadFile(File).find("[INFO] hello"), std::string::npos);
}

TEST_F(LoggerTest, ReinitSwitchesFiles)
{
    const FS::path First = Scratch.Path() / "first.log";
    const FS::path Second = Scratch.Path() / "second.log";

    Logger Local;
    Local.SetConsoleEcho(false);
    ASSERT_TRUE(Local.Init(First.string()));
    Local.Info("one");
    ASSERT_TRUE(Local.Init(Second.string()));
    Local.Info("two");
    Local.Close();

    EXPECT_EQ(ReadFile(First).find("two"), std::string::npos);
    EXPECT_NE(ReadFile(Second).find("[INFO] two"), std::string::npos);
}
