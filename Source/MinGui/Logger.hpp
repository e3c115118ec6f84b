#pragma once


// =============================
// MinGui - Logger.hpp (C++23, header-only)
// =============================
// Goals
//  - Always-safe to include from any MinGui header (no heavy deps)
//  - C++23 std::format_to_n / std::println backend
//  - Zero overhead when disabled (compile-time switch)
//  - Runtime min-level filter and optional category filter
//  - Safe to call from inside a native window procedure: never throws and
//    never allocates in MinGui code (records are formatted into a fixed
//    stack buffer and truncated when longer)
//  - Optional sink so hosts and tests can capture records instead of stdio
//
// Notes
//  - Categories are plain string literals (const char*): "Registry", "Class",
//    "Window", "Dispatch", "Loop", "Native", "Gui".
//  - A sink runs under the logger mutex and must not log itself.

#include <cstdint>
#include <atomic>
#include <mutex>
#include <string_view>
#include <print>        // C++23 std::println
#include <format>       // std::format_string, std::format_to_n
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort
#include <exception>

#ifndef MINGUI_ENABLE_LOGGING
#  define MINGUI_ENABLE_LOGGING 1
#endif
#ifndef MINGUI_ENABLE_LOG_ASSERT
#  define MINGUI_ENABLE_LOG_ASSERT 1
#endif
#ifndef MINGUI_LOG_RECORD_CAPACITY
#  define MINGUI_LOG_RECORD_CAPACITY 512
#endif

namespace mingui::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // A record is emitted if (level <= MinLevel).
    };

    [[nodiscard]] constexpr const char* ToShortLevel(LogLevel lvl) noexcept {
        switch (lvl) {
        case LogLevel::Fatal:   return "F";
        case LogLevel::Error:   return "E";
        case LogLevel::Warn:    return "W";
        case LogLevel::Info:    return "I";
        case LogLevel::Verbose: return "V";
        default:                return "-";
        }
    }

    // Receives every record that passes the filters. `message` is only valid
    // for the duration of the call.
    struct LogSink {
        void* userData = nullptr;
        void (*write)(void* userData, LogLevel level, const char* category, std::string_view message) noexcept = nullptr;

        [[nodiscard]] constexpr bool IsValid() const noexcept { return write != nullptr; }
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().m_MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().m_MinLevel.load(std::memory_order_relaxed); }

        // nullptr accepts every category. Must stay a stable C-string literal.
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().m_CategoryFilter.store(cat, std::memory_order_relaxed);
        }

        // Installs `sink` and returns the previous one. An invalid sink restores
        // stdout/stderr output.
        static LogSink SetSink(LogSink sink) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.m_Mutex);
            const LogSink previous = self.m_Sink;
            self.m_Sink = sink;
            return previous;
        }

        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (lvl > self.m_MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.m_CategoryFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false;
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Write(LogLevel lvl, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!IsEnabled(lvl, category)) return;

            char buffer[MINGUI_LOG_RECORD_CAPACITY];
            std::string_view message;
            try {
                const auto result = std::format_to_n(buffer, sizeof(buffer), fmt, static_cast<Args&&>(args)...);
                const auto written = static_cast<std::size_t>(result.out - buffer);
                message = std::string_view(buffer, written);
                if (static_cast<std::size_t>(result.size) > written && written >= 3) {
                    buffer[written - 1] = '.';
                    buffer[written - 2] = '.';
                    buffer[written - 3] = '.';
                }
            }
            catch (const std::exception&) {
                message = "<log record could not be formatted>";
            }
            Emit(lvl, category, message);
        }

        [[noreturn]] static void Abort() noexcept {
            std::fflush(stderr);
            std::abort();
        }

    private:
        Logger() = default;

        static void Emit(LogLevel lvl, const char* category, std::string_view message) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.m_Mutex);
            if (self.m_Sink.IsValid()) {
                self.m_Sink.write(self.m_Sink.userData, lvl, category, message);
                return;
            }

            std::FILE* stream = (lvl <= LogLevel::Warn) ? stderr : stdout;
            try {
                if (category) {
                    std::println(stream, "[{}][{}] {}", ToShortLevel(lvl), category, message);
                }
                else {
                    std::println(stream, "[{}] {}", ToShortLevel(lvl), message);
                }
            }
            catch (const std::exception&) {
                // Output failures are not reportable from the logger itself.
            }
        }

    private:
        std::mutex m_Mutex{};
        LogSink m_Sink{};
        std::atomic<LogLevel> m_MinLevel{ LogLevel::Info };
        std::atomic<const char*> m_CategoryFilter{ nullptr };
    };

    // Installs a sink for the lifetime of the scope.
    class ScopedLogSink final {
    public:
        explicit ScopedLogSink(LogSink sink) noexcept : m_Previous(Logger::SetSink(sink)) {}
        ~ScopedLogSink() { (void)Logger::SetSink(m_Previous); }

        ScopedLogSink(const ScopedLogSink&) = delete;
        ScopedLogSink& operator=(const ScopedLogSink&) = delete;

    private:
        LogSink m_Previous;
    };

} // namespace mingui::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if MINGUI_ENABLE_LOGGING
#define MINGUI_INTERNAL_LOG(Level, Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::mingui::core::Logger::IsEnabled((Level), _cat)) { \
            ::mingui::core::Logger::Write((Level), _cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define MINGUI_LOG_VERBOSE(Category, Fmt, ...) MINGUI_INTERNAL_LOG(::mingui::core::LogLevel::Verbose, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define MINGUI_LOG_INFO(Category, Fmt, ...)    MINGUI_INTERNAL_LOG(::mingui::core::LogLevel::Info, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define MINGUI_LOG_WARNING(Category, Fmt, ...) MINGUI_INTERNAL_LOG(::mingui::core::LogLevel::Warn, Category, Fmt __VA_OPT__(,) __VA_ARGS__)
#define MINGUI_LOG_ERROR(Category, Fmt, ...)   MINGUI_INTERNAL_LOG(::mingui::core::LogLevel::Error, Category, Fmt __VA_OPT__(,) __VA_ARGS__)

// Fatal records are always written, then the process aborts.
#define MINGUI_LOG_FATAL(Category, Fmt, ...) do { \
        ::mingui::core::Logger::Write(::mingui::core::LogLevel::Fatal, (Category), (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        ::mingui::core::Logger::Abort(); \
    } while (0)
#else
#define MINGUI_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define MINGUI_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define MINGUI_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define MINGUI_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define MINGUI_LOG_FATAL(Category, Fmt, ...)    ::mingui::core::Logger::Abort()
#endif

// ----------------------
// Assert macro: logs under "Assert" and continues.
// MINGUI_ASSERT(Expr) or MINGUI_ASSERT(Expr, Msg)
// ----------------------
#if MINGUI_ENABLE_LOG_ASSERT
#ifndef MINGUI_ASSERT
#include <source_location>

#define MINGUI_EXPAND(x) x
#define MINGUI_GET_MACRO(_1,_2,NAME,...) NAME

#define MINGUI_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::mingui::core::Logger::Write(::mingui::core::LogLevel::Error, "Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

#define MINGUI_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::mingui::core::Logger::Write(::mingui::core::LogLevel::Error, "Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

#define MINGUI_ASSERT(...) \
            MINGUI_EXPAND(MINGUI_GET_MACRO(__VA_ARGS__, MINGUI_ASSERT_2, MINGUI_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef MINGUI_ASSERT
#define MINGUI_ASSERT(...) ((void)0)
#endif
#endif
