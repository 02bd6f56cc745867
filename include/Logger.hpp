#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool Init(const std::string& LogFilePath);
    void Close();

    void Log(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message);
    void Success(const std::string& Message);
    void Warning(const std::string& Message);
    void Error(const std::string& Message);

    // Console mirroring is on by default; tests turn it off to keep output readable.
    void SetConsoleEcho(bool Enabled);

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    bool ConsoleEcho = true;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
