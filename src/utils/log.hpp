#ifndef ROUNDWISE_UTILS_LOG_HPP
#define ROUNDWISE_UTILS_LOG_HPP

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <unistd.h>

#include "terminal.hpp"

namespace Roundwise::Log {
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3,
        Off = 4
    };

    // Log areas, printed as a tag in front of every record.
    namespace Area {
        inline constexpr std::string_view kQuant = "Quant";
        inline constexpr std::string_view kData  = "Data";
        inline constexpr std::string_view kGraph = "Graph";
        inline constexpr std::string_view kUtils = "Utils";
    }

    namespace Details {
        [[nodiscard]] inline Level parse_level(std::string value, Level fallback) {
            for (auto& character : value) {
                character = static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
            }
            if (value == "debug") return Level::Debug;
            if (value == "info") return Level::Info;
            if (value == "warning" || value == "warn") return Level::Warning;
            if (value == "error") return Level::Error;
            if (value == "off" || value == "none") return Level::Off;
            return fallback;
        }

        [[nodiscard]] inline Level initial_level() {
            if (const char* env = std::getenv("ROUNDWISE_LOG_LEVEL")) {
                return parse_level(env, Level::Info);
            }
            return Level::Info;
        }

        inline std::atomic<Level>& threshold() {
            static std::atomic<Level> level{initial_level()};
            return level;
        }

        inline std::mutex& sink_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        [[nodiscard]] inline bool colorize() {
            static const bool enabled = ::isatty(STDERR_FILENO) != 0;
            return enabled;
        }

        [[nodiscard]] inline std::string_view label(Level level) {
            switch (level) {
                case Level::Debug:   return "DEBUG";
                case Level::Info:    return "INFO ";
                case Level::Warning: return "WARN ";
                case Level::Error:   return "ERROR";
                default:             return "     ";
            }
        }

        [[nodiscard]] inline std::string_view color(Level level) {
            using namespace ::Roundwise::Utils::Terminal;
            switch (level) {
                case Level::Debug:   return Colors::kBrightBlack;
                case Level::Info:    return Colors::kTurquoise;
                case Level::Warning: return Colors::kOrange;
                case Level::Error:   return Colors::kCrimson;
                default:             return Colors::kReset;
            }
        }

        inline void write(Level level, std::string_view area, const std::string& message) {
            std::ostringstream line;
            if (colorize()) {
                line << ::Roundwise::Utils::Terminal::ApplyColor(label(level), color(level));
            } else {
                line << label(level);
            }
            line << " [" << area << "] " << message << '\n';

            std::lock_guard<std::mutex> lock(sink_mutex());
            std::clog << line.str() << std::flush;
        }
    }

    inline void set_level(Level level) noexcept {
        Details::threshold().store(level);
    }

    [[nodiscard]] inline Level level() noexcept {
        return Details::threshold().load();
    }

    [[nodiscard]] inline bool enabled(Level candidate) noexcept {
        return candidate != Level::Off && candidate >= level();
    }

    template <class... Args>
    void write(Level severity, std::string_view area, Args&&... args) {
        if (!enabled(severity)) {
            return;
        }
        std::ostringstream stream;
        (stream << ... << std::forward<Args>(args));
        Details::write(severity, area, stream.str());
    }

    template <class... Args>
    void debug(std::string_view area, Args&&... args) {
        write(Level::Debug, area, std::forward<Args>(args)...);
    }

    template <class... Args>
    void info(std::string_view area, Args&&... args) {
        write(Level::Info, area, std::forward<Args>(args)...);
    }

    template <class... Args>
    void warning(std::string_view area, Args&&... args) {
        write(Level::Warning, area, std::forward<Args>(args)...);
    }

    template <class... Args>
    void error(std::string_view area, Args&&... args) {
        write(Level::Error, area, std::forward<Args>(args)...);
    }

    // Restores the previous threshold on scope exit.
    class ScopedLevel {
    public:
        explicit ScopedLevel(Level level) : previous_(::Roundwise::Log::level()) { set_level(level); }
        ~ScopedLevel() { set_level(previous_); }

        ScopedLevel(const ScopedLevel&) = delete;
        ScopedLevel& operator=(const ScopedLevel&) = delete;

    private:
        Level previous_;
    };
}

#endif // ROUNDWISE_UTILS_LOG_HPP
