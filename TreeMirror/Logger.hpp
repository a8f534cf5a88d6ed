#pragma once

#include <chrono>
#include <ctime>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

enum class LogLevel { Debug = 0, Info, Warn, Error };

class Logger
{
public:
    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    bool init(const std::string& filename = "", LogLevel minLevel = LogLevel::Info)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = minLevel;
        if (file_.is_open())
        {
            file_.close();
        }
        if (!filename.empty())
        {
            file_.open(filename, std::ios::out | std::ios::app);
            return file_.is_open();
        }
        return true;
    }

    void setMinLevel(LogLevel lvl)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = lvl;
    }

    void log(LogLevel lvl, const char* file, int line, const char* func, const char* fmt, ...) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (lvl < minLevel_) return;
        }

        va_list args;
        va_start(args, fmt);
        std::string buffer = format(fmt, args);
        va_end(args);

        auto ts = nowString();
        const char* levelStr = levelToString(lvl);

        std::ostringstream oss;
        oss << ts << " [" << levelStr << "] "
            << baseName(file) << ":" << line << " (" << func << ") - " << buffer << "\n";

        std::string out = oss.str();

        std::lock_guard<std::mutex> lk(mutex_);
        std::fwrite(out.data(), 1, out.size(), stdout);
        fflush(stdout);

        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

    static std::optional<LogLevel> levelFromString(const std::string& name)
    {
        if ("debug" == name) return LogLevel::Debug;
        if ("info" == name) return LogLevel::Info;
        if ("warn" == name) return LogLevel::Warn;
        if ("error" == name) return LogLevel::Error;
        return std::nullopt;
    }

private:
    Logger() : minLevel_(LogLevel::Info) {}
    ~Logger()
    {
        if (file_.is_open()) file_.close();
    }

    // long paths must not be cut, so the message is measured first
    static std::string format(const char* fmt, va_list args)
    {
        va_list measureArgs;
        va_copy(measureArgs, args);
        int size = std::vsnprintf(nullptr, 0, fmt, measureArgs);
        va_end(measureArgs);
        if (0 > size)
        {
            return std::string(fmt);
        }

        std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        return std::string(buffer.data(), static_cast<std::size_t>(size));
    }

    std::string nowString() {
        using namespace std::chrono;
        auto t = system_clock::now();
        auto tt = system_clock::to_time_t(t);
        auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

        std::tm tm_buf;
#if defined(_WIN32)
        localtime_s(&tm_buf, &tt);
#else
        localtime_r(&tt, &tm_buf);
#endif
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
        return std::string(buf);
    }

    const char* levelToString(LogLevel l) const {
        switch (l) {
        case LogLevel::Debug: return "DBG";
        case LogLevel::Info:  return "INF";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Error: return "ERR";
        default: return "UNK";
        }
    }

    // __FILE__ carries the build path; keep the file name only
    static const char* baseName(const char* path)
    {
        const char* name = path;
        for (const char* p = path; *p; ++p)
        {
            if ('/' == *p || '\\' == *p) name = p + 1;
        }
        return name;
    }

    std::mutex mutex_;
    std::ofstream file_;
    LogLevel minLevel_;
};

#define LOG(level, fmt, ...) \
        do { Logger::instance().log(LogLevel::level, __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); } while(0)
