#include "common/logger.hpp"

// plog
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/FuncMessageFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Logger.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace pairrtc {
namespace logging {
namespace {

struct LogAppender : public plog::IAppender {
    LoggingCallback callback;

    void write(const plog::Record &record) override {
        const auto severity = record.getSeverity();
        auto formatted = plog::FuncMessageFormatter::format(record);
        formatted.pop_back(); // remove newline

        std::string str = formatted;
        if (!callback || !callback(static_cast<Level>(severity), str)) {
            std::cout << plog::severityToString(severity) << " " << str << std::endl;
        }
    }
};

} // namespace

void InitLogger(Level level, LoggingCallback callback) {
    static std::unique_ptr<LogAppender> appender;
    const auto severity = static_cast<plog::Severity>(level);
    if (appender) {
        appender->callback = std::move(callback);
        InitLogger(severity, nullptr); // change the severity
    } else if (callback) {
        appender = std::make_unique<LogAppender>();
        appender->callback = std::move(callback);
        InitLogger(severity, appender.get());
    } else {
        InitLogger(severity, nullptr); // log to cout
    }
}

void InitLogger(plog::Severity severity, plog::IAppender *appender) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    static plog::Logger<0> *logger = nullptr;
    static std::mutex mutex;
    std::lock_guard lock(mutex);
    if (!logger) {
        logger = &plog::init(severity, appender ? appender : &console_appender);
        PLOG_DEBUG << "Logger initialized";
    } else {
        logger->setMaxSeverity(severity);
        if (appender) {
            logger->addAppender(appender);
        }
    }
}

Level LevelFromString(const std::string& level_string) {
    std::string lower = level_string;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "fatal") {
        return Level::FATAL;
    } else if (lower == "error") {
        return Level::ERROR;
    } else if (lower == "warning") {
        return Level::WARNING;
    } else if (lower == "info") {
        return Level::INFO;
    } else if (lower == "debug") {
        return Level::DEBUG;
    } else if (lower == "verbose") {
        return Level::VERBOSE;
    } else if (lower == "none") {
        return Level::NONE;
    }
    throw std::invalid_argument("Unknown logging level: " + level_string);
}

} // namespace logging
} // namespace pairrtc
