/*
 * AclKit - Windows Security Interop Library
 * Copyright (C) 2026 AclKit Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file Logger.hpp
 * @brief Thread-safe logging facility used across AclKit.
 *
 * Supports:
 * - Synchronous or queued (worker thread) delivery
 * - Console (stderr) and rotating file sinks
 * - Plain prefix or JSON Lines records
 * - Win32 error decoration via FormatMessageW
 *
 * @note All public methods are thread-safe.
 */

#include <atomic>
#include <cstdint>
#include <cstdarg>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>

#ifdef _WIN32
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <Windows.h>
#endif

namespace AclKit {
	namespace Utils {

		/**
		 * @brief Severity levels, least to most severe.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,
			Debug,
			Info,
			Warn,
			Error,
			Fatal
		};

		/**
		 * @brief Logger configuration. Usually produced by Config::Settings.
		 */
		struct LoggerConfig {
			/// Queue bound in async mode
			size_t maxQueueSize = 1000;

			enum class BackPressurePolicy {
				Block,
				DropOldest,
				DropNewest
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = false;
			bool toConsole = true;
			bool toFile = false;
			bool jsonLines = false;
			bool includeSrcLocation = true;
			bool includeProcThreadId = true;

			std::wstring logDirectory = L"logs";
			std::wstring baseFileName = L"AclKit";
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;
			size_t maxFileCount = 10;

			LogLevel minimalLevel = LogLevel::Info;
			LogLevel flushLevel = LogLevel::Error;
		};

		/**
		 * @brief Process-wide logger.
		 *
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   Logger::Instance().Initialize(cfg);
		 *   AK_LOG_INFO(L"FileSystemAcl", L"created %ls", path.c_str());
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief (Re)initialize the logger. Pending records of a previous
			 * configuration are flushed first.
			 */
			void Initialize(const LoggerConfig& cfg);

			/// Stops the worker, drains the queue and closes the log file.
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] LogLevel minimalLevel() const noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			void LogEx(LogLevel level,
			           const wchar_t* category,
			           const wchar_t* file,
			           int line,
			           const wchar_t* function,
			           const wchar_t* format, ...);

			/**
			 * @brief Log a message decorated with the text of a Win32 error code.
			 */
			void LogWinErrorEx(LogLevel level,
			                   const wchar_t* category,
			                   const wchar_t* file,
			                   int line,
			                   const wchar_t* function,
			                   DWORD errorCode,
			                   const wchar_t* contextFormat, ...);

			void LogMessage(LogLevel level,
			                const wchar_t* category,
			                const std::wstring& message,
			                const wchar_t* file = nullptr,
			                int line = 0,
			                const wchar_t* function = nullptr,
			                DWORD winError = 0);

			void Flush();

			/// Path of the file currently written to, empty if none.
			[[nodiscard]] std::wstring CurrentLogFile() const;

			/// Converts __FILE__/__FUNCTION__; the returned pointer is thread-local.
			[[nodiscard]] static const wchar_t* NarrowToWideTLS(const char* s);

			[[nodiscard]] static std::wstring FormatMessageV(const wchar_t* fmt, va_list args);

			[[nodiscard]] static std::wstring FormatWinError(DWORD err);

			[[nodiscard]] static const wchar_t* LevelToString(LogLevel level) noexcept;

			/**
			 * @brief Logs entry and exit (with elapsed microseconds) of a scope.
			 */
			class Scope {
			public:
				Scope(const wchar_t* category,
				      const wchar_t* file,
				      int line,
				      const wchar_t* function,
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;

			private:
				const wchar_t* m_category;
				const wchar_t* m_file;
				const wchar_t* m_function;
				int m_line;
				LARGE_INTEGER m_start{};
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::wstring category;
				std::wstring message;
				std::wstring file;
				std::wstring function;
				int line = 0;
				uint32_t pid = 0;
				uint32_t tid = 0;
				uint64_t ts_100ns = 0;
				DWORD winError = 0;
			};

			void WorkerLoop();
			[[nodiscard]] bool Enqueue(LogItem&& item);
			void Write(const LogItem& item);
			void WriteConsoleLine(const std::wstring& line);
			void WriteFileLine(const std::wstring& line);

			[[nodiscard]] std::wstring FormatLine(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::wstring EscapeJson(const std::wstring& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void CloseLogFile() noexcept;
			[[nodiscard]] std::wstring BaseLogPath() const;

			[[nodiscard]] static uint64_t NowAsFileTime100nsUTC();
			[[nodiscard]] static std::wstring FormatIso8601UTC(uint64_t filetime100ns);

			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };
			std::atomic<bool> m_workerRunning{ false };
			/// Set by the worker while a dequeued item is being written (m_queueMutex)
			bool m_writing = false;

			/// Serializes sink writes between the worker and synchronous callers
			mutable std::mutex m_sinkMutex;
			HANDLE m_file{ INVALID_HANDLE_VALUE };
			uint64_t m_currentSize{ 0 };
			std::wstring m_currentPath;
		};

	}  // namespace Utils
}  // namespace AclKit

#define AK_LOG_IMPL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::AclKit::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), \
                ::AclKit::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::AclKit::Utils::Logger::NarrowToWideTLS(__FUNCTION__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define AK_LOG_TRACE(category, fmt, ...) AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)
#define AK_LOG_DEBUG(category, fmt, ...) AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)
#define AK_LOG_INFO(category, fmt, ...)  AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)
#define AK_LOG_WARN(category, fmt, ...)  AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)
#define AK_LOG_ERROR(category, fmt, ...) AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)
#define AK_LOG_FATAL(category, fmt, ...) AK_LOG_IMPL_(::AclKit::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

/// Logs an explicit Win32/LSTATUS code at ERROR level
#define AK_LOG_WIN_ERROR(category, code, fmt, ...) \
    do { \
        auto& _lg = ::AclKit::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::AclKit::Utils::LogLevel::Error)) { \
            _lg.LogWinErrorEx(::AclKit::Utils::LogLevel::Error, (category), \
                ::AclKit::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::AclKit::Utils::Logger::NarrowToWideTLS(__FUNCTION__), \
                static_cast<DWORD>(code), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// Logs GetLastError() at ERROR level
#define AK_LOG_LAST_ERROR(category, fmt, ...) \
    do { \
        const DWORD _ak_le = ::GetLastError(); \
        AK_LOG_WIN_ERROR(category, _ak_le, fmt, ##__VA_ARGS__); \
    } while(0)

#define AK_LOG_CONCAT_INNER_(a, b) a##b
#define AK_LOG_CONCAT_(a, b) AK_LOG_CONCAT_INNER_(a, b)

/// Logs scope entry and exit with timing at DEBUG level
#define AK_LOG_SCOPE(category) \
    ::AclKit::Utils::Logger::Scope AK_LOG_CONCAT_(_ak_scope_obj_, __LINE__)( \
        (category), \
        ::AclKit::Utils::Logger::NarrowToWideTLS(__FILE__), \
        __LINE__, \
        ::AclKit::Utils::Logger::NarrowToWideTLS(__FUNCTION__))
