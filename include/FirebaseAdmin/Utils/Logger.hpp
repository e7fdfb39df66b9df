// include/FirebaseAdmin/Utils/Logger.hpp
#ifndef FIREBASE_ADMIN_LOGGER_HPP
#define FIREBASE_ADMIN_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <vector>
#include <filesystem>
#include <string>

namespace FirebaseAdmin::Utils {

    class Logger {
    public:
        // Call this once before creating any client. An empty logDir or logFileName
        // disables the rotating file sink.
        static void Init(const std::filesystem::path &logDir = "",
                         const std::string &logFileName = "firebase_admin.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        // Default "Core" logger, used by the FIREBASE_LOG_* macros
        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named logger sharing the sinks installed by Init(). Created on first use.
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

        static void SetLevel(const std::string &loggerName, spdlog::level::level_enum level);

    private:
        // Callers hold s_Mutex
        static void InitSinks(const std::filesystem::path &logDir,
                              const std::string &logFileName,
                              spdlog::level::level_enum consoleLevel,
                              spdlog::level::level_enum fileLevel);

        static std::mutex s_Mutex; // guards s_GlobalSinks and s_CoreLogger
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace FirebaseAdmin::Utils

#define FIREBASE_LOG_TRACE(...)    if(auto& logger = ::FirebaseAdmin::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define FIREBASE_LOG_INFO(...)     if(auto& logger = ::FirebaseAdmin::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define FIREBASE_LOG_WARN(...)     if(auto& logger = ::FirebaseAdmin::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define FIREBASE_LOG_ERROR(...)    if(auto& logger = ::FirebaseAdmin::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define FIREBASE_LOG_CRITICAL(...) if(auto& logger = ::FirebaseAdmin::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // FIREBASE_ADMIN_LOGGER_HPP
