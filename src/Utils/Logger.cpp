// src/Utils/Logger.cpp
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <iostream> // For errors raised before any sink exists

namespace FirebaseAdmin {
namespace Utils {

    std::mutex Logger::s_Mutex;
    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;

    void Logger::Init(const std::filesystem::path& logDir,
                      const std::string& logFileName,
                      spdlog::level::level_enum consoleLevel,
                      spdlog::level::level_enum fileLevel) {
        std::lock_guard<std::mutex> lock(s_Mutex);
        InitSinks(logDir, logFileName, consoleLevel, fileLevel);
    }

    void Logger::InitSinks(const std::filesystem::path& logDir,
                           const std::string& logFileName,
                           spdlog::level::level_enum consoleLevel,
                           spdlog::level::level_enum fileLevel) {
        try {
            s_GlobalSinks.clear();

            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(consoleLevel);
            console_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v%$");
            s_GlobalSinks.push_back(console_sink);

            if (!logDir.empty() && !logFileName.empty()) {
                if (!std::filesystem::exists(logDir)) {
                    std::filesystem::create_directories(logDir);
                }
                std::filesystem::path logFilePath = logDir / logFileName;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath.string(), 1024 * 1024 * 5, 3);
                file_sink->set_level(fileLevel);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                s_GlobalSinks.push_back(file_sink);
            }

            // Re-initialising replaces the previous core logger in the registry
            spdlog::drop("Core");
            s_CoreLogger = std::make_shared<spdlog::logger>("Core", s_GlobalSinks.begin(), s_GlobalSinks.end());
            spdlog::register_logger(s_CoreLogger);
            s_CoreLogger->set_level(spdlog::level::trace);
            s_CoreLogger->flush_on(spdlog::level::warn);

            s_CoreLogger->debug("Logger initialized. Console level: {}, File level: {}",
                                spdlog::level::to_string_view(consoleLevel),
                                spdlog::level::to_string_view(fileLevel));

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            s_GlobalSinks.clear();
            s_CoreLogger = std::make_shared<spdlog::logger>("Core_Fallback", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER INITIALIZATION FAILED. USING FALLBACK CONSOLE LOGGER.");
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Log file system setup failed: " << ex.what() << std::endl;
            s_GlobalSinks.clear();
            s_CoreLogger = std::make_shared<spdlog::logger>("Core_FS_Fallback", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            s_CoreLogger->set_level(spdlog::level::err);
            s_CoreLogger->error("LOGGER FILE SYSTEM SETUP FAILED. USING FALLBACK CONSOLE LOGGER.");
        }
    }

    std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
        std::lock_guard<std::mutex> lock(s_Mutex);
        if (!s_CoreLogger) {
            // Library users are not required to call Init(); warnings and errors still reach stderr
            InitSinks("", "", spdlog::level::warn, spdlog::level::trace);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string& name) {
        auto logger = spdlog::get(name);
        if (!logger) {
            std::vector<spdlog::sink_ptr> sinks;
            {
                std::lock_guard<std::mutex> lock(s_Mutex);
                if (!s_CoreLogger) {
                    InitSinks("", "", spdlog::level::warn, spdlog::level::trace);
                }
                // A failed Init() leaves only the fallback logger's sinks
                sinks = s_GlobalSinks.empty() ? s_CoreLogger->sinks() : s_GlobalSinks;
            }
            logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(spdlog::level::trace); // Sinks do the filtering
            logger->flush_on(spdlog::level::warn);
            try {
                spdlog::register_logger(logger);
            } catch (const spdlog::spdlog_ex&) {
                // Another thread registered the same name first
                logger = spdlog::get(name);
            }
        }
        return logger;
    }

    void Logger::SetLevel(const std::string& loggerName, spdlog::level::level_enum level) {
        auto logger = spdlog::get(loggerName);
        if (logger) {
            logger->set_level(level);
        } else {
            GetCoreLogger()->warn("Attempted to set level for non-existent logger: {}", loggerName);
        }
    }

} // namespace Utils
} // namespace FirebaseAdmin
