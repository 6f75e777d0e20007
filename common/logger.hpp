#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

class logger
{
    bool debug_on = false;
    bool info_on = false;
    bool warning_on = true;
    bool error_on = true;
    bool critical_on = true;
    std::mutex log_mutex;

    logger() = default;
    ~logger() = default;

    static std::string timestamp()
    {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%H:%M:%S")
            << "." << std::setw(3) << std::setfill('0') << ms.count();
        return oss.str();
    }

    void write(std::ostream &out, const char *tag, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        out << timestamp() << ' ' << tag << ' ' << msg << '\n';
    }

public:
    logger(const logger &) = delete;
    logger &operator=(const logger &) = delete;
    logger(logger &&) = delete;
    logger &operator=(logger &&) = delete;

    static logger &getInstance()
    {
        static logger instance;
        return instance;
    }

    bool isDebugEnabled() const { return debug_on; }
    bool isInfoEnabled() const { return info_on; }
    bool isWarningEnabled() const { return warning_on; }
    bool isErrorEnabled() const { return error_on; }
    bool isCriticalEnabled() const { return critical_on; }

    void setDebugEnabled(bool enable) { debug_on = enable; }
    void setInfoEnabled(bool enable) { info_on = enable; }
    void setWarningEnabled(bool enable) { warning_on = enable; }
    void setErrorEnabled(bool enable) { error_on = enable; }
    void setCriticalEnabled(bool enable) { critical_on = enable; }

    // 0 = warnings and above, 1 = +info, 2 = +debug
    void setVerbosity(int level)
    {
        info_on = level >= 1;
        debug_on = level >= 2;
    }

    void logDebug(const std::string &msg)
    {
        if (debug_on)
            write(std::cout, "🔍 [DEBUG]", msg);
    }

    void logInfo(const std::string &msg)
    {
        if (info_on)
            write(std::cout, "✨ [INFO]", msg);
    }

    void logWarning(const std::string &msg)
    {
        if (warning_on)
            write(std::cerr, "⚠️ [WARN]", msg);
    }

    void logError(const std::string &msg)
    {
        if (error_on)
            write(std::cerr, "❌ [ERROR]", msg);
    }

    void logCritical(const std::string &msg)
    {
        if (critical_on)
            write(std::cerr, "🚨 [CRITICAL]", msg);
    }
};

#define LOG_DEBUG(msg)                                 \
    do                                                 \
    {                                                  \
        if (logger::getInstance().isDebugEnabled())    \
        {                                              \
            std::ostringstream oss;                    \
            oss << msg;                                \
            logger::getInstance().logDebug(oss.str()); \
        }                                              \
    } while (0)

#define LOG_INFO(msg)                                 \
    do                                                \
    {                                                 \
        if (logger::getInstance().isInfoEnabled())    \
        {                                             \
            std::ostringstream oss;                   \
            oss << msg;                               \
            logger::getInstance().logInfo(oss.str()); \
        }                                             \
    } while (0)

#define LOG_WARN(msg)                                    \
    do                                                   \
    {                                                    \
        if (logger::getInstance().isWarningEnabled())    \
        {                                                \
            std::ostringstream oss;                      \
            oss << msg;                                  \
            logger::getInstance().logWarning(oss.str()); \
        }                                                \
    } while (0)

#define LOG_ERROR(msg)                                 \
    do                                                 \
    {                                                  \
        if (logger::getInstance().isErrorEnabled())    \
        {                                              \
            std::ostringstream oss;                    \
            oss << msg;                                \
            logger::getInstance().logError(oss.str()); \
        }                                              \
    } while (0)

#define LOG_CRITICAL(msg)                                 \
    do                                                    \
    {                                                     \
        if (logger::getInstance().isCriticalEnabled())    \
        {                                                 \
            std::ostringstream oss;                       \
            oss << msg;                                   \
            logger::getInstance().logCritical(oss.str()); \
        }                                                 \
    } while (0)
