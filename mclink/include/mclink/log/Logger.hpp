#pragma once

#include "mclink/Result.hpp"
#include "mclink/coroutine/coroutine.hpp"
#include "mclink/log/format.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <print>
#include <source_location>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

namespace mclink::log
{
    namespace detail
    {
        /** "Task<int> ns::Class::method(int) const" -> "ns::Class::method" */
        consteval auto shortFunctionName(std::string_view function_name) -> std::string_view
        {
            auto paren{ function_name.find('(') };
            if (paren == std::string_view::npos) {
                return function_name;
            }
            auto name{ function_name.substr(0, paren) };
            auto space{ name.rfind(' ') };
            return space == std::string_view::npos ? name : name.substr(space + 1);
        }

        static_assert(shortFunctionName("void test()") == "test");
        static_assert(shortFunctionName("int ns::Class::method(int) const") == "ns::Class::method");
        static_assert(shortFunctionName("Class()") == "Class");
    }

    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        Level level;
        std::string message;
        std::thread::id threadId;
        std::string_view file;
        uint32_t line;
        std::string_view function;
    };

    struct LoggerConfig
    {
        bool showTimestamp{ true };
        std::string timestampFormat{ "{:%Y-%m-%d %H:%M:%S}" };
        bool showLevel{ true };
        bool showThreadId{ false };
        bool showFile{ false };
        bool showLine{ false };
        bool showFunction{ false };
        bool console{ true };
        Level minLevel{ Level::Info };
        std::filesystem::path file{}; /**< appended to when not empty */
    };

    template<typename... Args>
    struct FormatString
    {
        std::format_string<Args...> str;
        std::source_location loc;
        std::string_view function;

        template<typename T>
            requires std::convertible_to<const T&, std::string_view>
        consteval FormatString(const T& s, std::source_location l = std::source_location::current())
          : str(s)
          , loc(l)
          , function(detail::shortFunctionName(l.function_name()))
        {
        }
    };

    /**
     * Process wide logger. Entries are formatted on the calling thread and
     * handed through a channel to a dedicated thread that writes them to the
     * console and, when configured, a log file.
     */
    class Logger
    {
        struct FileCloser
        {
            auto operator()(std::FILE* file) const -> void { std::fclose(file); }
        };

      public:
        static auto instance() -> Logger&
        {
            static Logger logger;
            return logger;
        }

        Logger()
          : m_thread([this]() { m_ctx.run(); })
        {
            coro::co_spawn(m_ctx, [this](coro::IExecutor& ex) -> coro::Task<void> { return process(ex); });
        }

        ~Logger()
        {
            m_channel.close();
            if (m_thread.joinable()) {
                m_thread.join();
            }
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        auto setConfig(LoggerConfig config) -> Result<void>
        {
            std::unique_ptr<std::FILE, FileCloser> file;
            if (!config.file.empty()) {
                std::error_code ec;
                if (config.file.has_parent_path()) {
                    std::filesystem::create_directories(config.file.parent_path(), ec);
                    if (ec) {
                        return std::unexpected(ec);
                    }
                }
                file.reset(std::fopen(config.file.c_str(), "a"));
                if (!file) {
                    return std::unexpected(std::error_code(errno, std::generic_category()));
                }
            }

            m_minLevel = config.minLevel;
            std::lock_guard lock(m_mutex);
            m_config = std::move(config);
            m_file = std::move(file);
            return success();
        }

        auto isEnabled(Level level) const noexcept -> bool { return level >= m_minLevel.load(); }

        template<typename... Args>
        auto log(Level level,
                 std::source_location loc,
                 std::string_view function,
                 std::format_string<Args...> fmt,
                 Args&&... args) -> void
        {
            if (!isEnabled(level)) {
                return;
            }

            try {
                m_channel.push({ std::chrono::system_clock::now(),
                                 level,
                                 std::format(fmt, std::forward<Args>(args)...),
                                 std::this_thread::get_id(),
                                 loc.file_name(),
                                 loc.line(),
                                 function });
            } catch (const std::exception& ex) {
                std::println(stderr, "Logger: dropped entry from {}:{}: {}", loc.file_name(), loc.line(), ex.what());
            }
        }

      private:
        auto process(coro::IExecutor& ex) -> coro::Task<void>
        {
            while (true) {
                auto entry{ co_await m_channel.next() };
                if (!entry) {
                    break;
                }
                write(*entry);
            }
            ex.stop();
        }

        auto write(const LogEntry& entry) -> void
        {
            std::lock_guard lock(m_mutex);

            std::string line;
            auto out{ std::back_inserter(line) };

            if (m_config.showTimestamp) {
                try {
                    auto ts{ std::chrono::floor<std::chrono::milliseconds>(entry.timestamp) };
                    std::format_to(out, "[{}] ", std::vformat(m_config.timestampFormat, std::make_format_args(ts)));
                } catch (const std::format_error&) {
                    std::format_to(out, "[Timestamp Error] ");
                }
            }

            if (m_config.showLevel) {
                std::format_to(out, "[{}] ", entry.level);
            }

            if (m_config.showThreadId) {
                std::stringstream ss;
                ss << entry.threadId;
                std::format_to(out, "[Thread {}] ", ss.str());
            }

            if (m_config.showFile || m_config.showLine || m_config.showFunction) {
                line += '[';
                auto first{ true };
                if (m_config.showFile) {
                    std::format_to(out, "{}", std::filesystem::path(entry.file).filename().string());
                    first = false;
                }
                if (m_config.showLine) {
                    std::format_to(out, "{}{}", first ? "" : ":", entry.line);
                    first = false;
                }
                if (m_config.showFunction) {
                    std::format_to(out, "{}in {}", first ? "" : " ", entry.function);
                }
                line += "] ";
            }

            line += entry.message;

            if (m_config.console) {
                std::println(entry.level >= Level::Warning ? stderr : stdout, "{}", line);
            }
            if (m_file) {
                std::println(m_file.get(), "{}", line);
                std::fflush(m_file.get());
            }
        }

        std::mutex m_mutex;
        LoggerConfig m_config{};
        std::unique_ptr<std::FILE, FileCloser> m_file;
        std::atomic<Level> m_minLevel{ Level::Info };
        coro::Channel<LogEntry> m_channel{};
        coro::Context m_ctx{};
        std::thread m_thread;
    };

    template<typename... Args>
    auto debug(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Debug, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto info(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Info, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto warning(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Warning, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto error(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Error, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }
} // namespace mclink::log
