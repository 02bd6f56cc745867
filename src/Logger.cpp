#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>

Logger Log;
namespace FS = std::filesystem;

bool Logger::Init(const std::string& LogFilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (LogFile.is_open())
    {
        LogFile.close();
    }

    FS::path LogPath(LogFilePath);
    std::error_code ec;
    if (LogPath.has_parent_path() && !FS::exists(LogPath.parent_path(), ec))
    {
        FS::create_directories(LogPath.parent_path(), ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogPath.parent_path().string() << " - " << ec.message() << "\n";
        }
    }

    CurrentLogFilePath = LogFilePath;
    OpenLogFile(CurrentLogFilePath);
    return LogFile.is_open();
}

Logger::~Logger()
{
    Close();
}

void Logger::Close()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    if (LogFile.is_open())
    {
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::SetConsoleEcho(bool Enabled)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    ConsoleEcho = Enabled;
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    const std::string Line = GetTimestamp() + " [" + LevelToString(Level) + "] " + Message;

    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (ConsoleEcho)
    {
        if (Level == LogLevel::ERROR || Level == LogLevel::WARNING)
        {
            std::cerr << Line << "\n";
        }
        else
        {
            std::cout << Line << "\n";
        }
    }

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << Line << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Success(const std::string& Message)
{
    Log(LogLevel::SUCCESS, Message);
}

void Logger::Warning(const std::string& Message)
{
    Log(LogLevel::WARNING, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:    return "INFO";
    case LogLevel::SUCCESS: return "SUCCESS";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR:   return "ERROR";
    default:                return "UNKNOWN";
    }
}
