#pragma once

#include <filesystem>
#include <string>

#include <log4cxx/basicconfigurator.h>
#include <log4cxx/consoleappender.h>
#include <log4cxx/logger.h>
#include <log4cxx/patternlayout.h>
#include <log4cxx/propertyconfigurator.h>

#include "Env.hpp"

namespace Logger {
    inline log4cxx::LoggerPtr Get(const std::string& aName = "main")
    {
        return log4cxx::LoggerPtr(log4cxx::Logger::getLogger(aName));
    }

    // configuration source, first found:
    //  file from LOG4CXX env, ./logger.conf, console with WARN level.
    // LOG_LEVEL env overrides root level
    inline log4cxx::LoggerPtr Prepare()
    {
        const std::string sConf = Util::getEnv("LOG4CXX");
        if (!sConf.empty()) {
            log4cxx::PropertyConfigurator::configure(sConf);
        } else if (std::filesystem::exists("logger.conf")) {
            log4cxx::PropertyConfigurator::configure("logger.conf");
        } else {
            auto sAppender = new log4cxx::ConsoleAppender(log4cxx::LayoutPtr(new log4cxx::PatternLayout("%d [%t] [%-5p] %c: %m%n")));
            log4cxx::BasicConfigurator::configure(log4cxx::AppenderPtr(sAppender));
            log4cxx::Logger::getRootLogger()->setLevel(log4cxx::Level::getWarn());
        }

        const std::string sLevel = Util::getEnv("LOG_LEVEL");
        if (!sLevel.empty())
            log4cxx::Logger::getRootLogger()->setLevel(log4cxx::Level::toLevel(sLevel));

        return Get();
    }
} // namespace Logger

inline log4cxx::LoggerPtr sLogger = Logger::Prepare();

#define TRACE(x) LOG4CXX_TRACE(sLogger, x)
#define DEBUG(x) LOG4CXX_DEBUG(sLogger, x)
#define INFO(x)  LOG4CXX_INFO(sLogger, x)
#define WARN(x)  LOG4CXX_WARN(sLogger, x)
#define ERROR(x) LOG4CXX_ERROR(sLogger, x)
#define FATAL(x) LOG4CXX_FATAL(sLogger, x)
