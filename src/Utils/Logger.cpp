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
#include "pch.h"
#include "Logger.hpp"

#include <array>
#include <cstdio>
#include <cwchar>
#include <vector>

namespace AclKit {
    namespace Utils {

        namespace {
            /// Upper bound for a single formatted message (characters)
            constexpr size_t kMaxMessageChars = 64 * 1024;

            /// Number of thread-local conversion slots handed out round-robin
            constexpr size_t kTlsSlots = 4;

            /// 100ns ticks between 1601-01-01 and 1970-01-01
            constexpr uint64_t kUnixEpochAs100ns = 116444736000000000ULL;
        }

        // ============================================================================
        // Singleton lifecycle
        // ============================================================================

        Logger& Logger::Instance() {
            static Logger instance;
            return instance;
        }

        Logger::Logger() = default;

        Logger::~Logger() {
            ShutDown();
        }

        void Logger::Initialize(const LoggerConfig& cfg) {
            if (m_initialized.load(std::memory_order_acquire)) {
                ShutDown();
            }

            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                m_cfg = cfg;
                if (m_cfg.maxQueueSize == 0) {
                    m_cfg.maxQueueSize = 1;
                }
            }
            m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
            m_stop.store(false, std::memory_order_release);

            if (cfg.toFile) {
                std::lock_guard<std::mutex> lock(m_sinkMutex);
                OpenLogFileIfNeeded();
            }

            if (cfg.async) {
                m_worker = std::thread(&Logger::WorkerLoop, this);
                m_workerRunning.store(true, std::memory_order_release);
            }

            m_initialized.store(true, std::memory_order_release);
        }

        void Logger::ShutDown() {
            if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
                return;
            }

            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                m_stop.store(true, std::memory_order_release);
                m_workerRunning.store(false, std::memory_order_release);
            }
            m_queueCv.notify_all();
            m_spaceCv.notify_all();

            if (m_worker.joinable()) {
                m_worker.join();
            }

            // Anything left behind by a racing producer is written synchronously
            std::deque<LogItem> remaining;
            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                remaining.swap(m_queue);
            }
            for (const auto& item : remaining) {
                Write(item);
            }

            std::lock_guard<std::mutex> lock(m_sinkMutex);
            CloseLogFile();
        }

        bool Logger::IsInitialized() const noexcept {
            return m_initialized.load(std::memory_order_acquire);
        }

        void Logger::setMinimalLevel(LogLevel level) noexcept {
            m_minLevel.store(level, std::memory_order_release);
        }

        LogLevel Logger::minimalLevel() const noexcept {
            return m_minLevel.load(std::memory_order_acquire);
        }

        bool Logger::IsEnabled(LogLevel level) const noexcept {
            return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
        }

        // ============================================================================
        // Entry points
        // ============================================================================

        void Logger::LogEx(LogLevel level,
                           const wchar_t* category,
                           const wchar_t* file,
                           int line,
                           const wchar_t* function,
                           const wchar_t* format, ...) {
            if (!IsEnabled(level) || format == nullptr) {
                return;
            }

            va_list args;
            va_start(args, format);
            std::wstring message = FormatMessageV(format, args);
            va_end(args);

            LogMessage(level, category, message, file, line, function, 0);
        }

        void Logger::LogWinErrorEx(LogLevel level,
                                   const wchar_t* category,
                                   const wchar_t* file,
                                   int line,
                                   const wchar_t* function,
                                   DWORD errorCode,
                                   const wchar_t* contextFormat, ...) {
            if (!IsEnabled(level)) {
                return;
            }

            std::wstring message;
            if (contextFormat != nullptr) {
                va_list args;
                va_start(args, contextFormat);
                message = FormatMessageV(contextFormat, args);
                va_end(args);
            }

            const std::wstring text = FormatWinError(errorCode);
            message += L" (win32=";
            message += std::to_wstring(errorCode);
            if (!text.empty()) {
                message += L": ";
                message += text;
            }
            message += L')';

            LogMessage(level, category, message, file, line, function, errorCode);
        }

        void Logger::LogMessage(LogLevel level,
                                const wchar_t* category,
                                const std::wstring& message,
                                const wchar_t* file,
                                int line,
                                const wchar_t* function,
                                DWORD winError) {
            if (!IsInitialized() || !IsEnabled(level)) {
                return;
            }

            LogItem item;
            item.level = level;
            item.category = category ? category : L"";
            item.message = message;
            item.file = file ? file : L"";
            item.function = function ? function : L"";
            item.line = line;
            item.pid = ::GetCurrentProcessId();
            item.tid = ::GetCurrentThreadId();
            item.ts_100ns = NowAsFileTime100nsUTC();
            item.winError = winError;

            bool async = false;
            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                async = m_cfg.async;
            }

            if (async && m_workerRunning.load(std::memory_order_acquire) && Enqueue(std::move(item))) {
                return;
            }
            Write(item);
        }

        void Logger::Flush() {
            if (m_workerRunning.load(std::memory_order_acquire)) {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_spaceCv.wait(lock, [this] {
                    return (m_queue.empty() && !m_writing) || m_stop.load(std::memory_order_acquire);
                });
            }

            std::lock_guard<std::mutex> lock(m_sinkMutex);
            if (m_file != INVALID_HANDLE_VALUE) {
                (void)::FlushFileBuffers(m_file);
            }
            (void)std::fflush(stderr);
        }

        std::wstring Logger::CurrentLogFile() const {
            std::lock_guard<std::mutex> lock(m_sinkMutex);
            return m_currentPath;
        }

        // ============================================================================
        // Queue
        // ============================================================================

        bool Logger::Enqueue(LogItem&& item) {
            LoggerConfig::BackPressurePolicy policy;
            size_t maxSize = 0;
            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                policy = m_cfg.bpPolicy;
                maxSize = m_cfg.maxQueueSize;
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                if (m_stop.load(std::memory_order_acquire)) {
                    // Worker is gone; the caller writes synchronously
                    return false;
                }
                if (m_queue.size() >= maxSize) {
                    switch (policy) {
                    case LoggerConfig::BackPressurePolicy::Block:
                        m_spaceCv.wait(lock, [&] {
                            return m_queue.size() < maxSize || m_stop.load(std::memory_order_acquire);
                        });
                        break;
                    case LoggerConfig::BackPressurePolicy::DropOldest:
                        m_queue.pop_front();
                        break;
                    case LoggerConfig::BackPressurePolicy::DropNewest:
                        return true;
                    }
                    if (m_stop.load(std::memory_order_acquire)) {
                        return false;
                    }
                }
                m_queue.push_back(std::move(item));
            }
            m_queueCv.notify_one();
            return true;
        }

        void Logger::WorkerLoop() {
            for (;;) {
                LogItem item;
                {
                    std::unique_lock<std::mutex> lock(m_queueMutex);
                    m_queueCv.wait(lock, [this] {
                        return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
                    });
                    if (m_queue.empty()) {
                        return;
                    }
                    item = std::move(m_queue.front());
                    m_queue.pop_front();
                    m_writing = true;
                }
                m_spaceCv.notify_all();
                Write(item);
                {
                    std::lock_guard<std::mutex> lock(m_queueMutex);
                    m_writing = false;
                }
                // Flush() waits for an empty queue with nothing in flight
                m_spaceCv.notify_all();
            }
        }

        // ============================================================================
        // Sinks
        // ============================================================================

        void Logger::Write(const LogItem& item) {
            LoggerConfig cfg;
            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                cfg = m_cfg;
            }

            const std::wstring line = FormatLine(item);

            std::lock_guard<std::mutex> lock(m_sinkMutex);
            if (cfg.toConsole) {
                WriteConsoleLine(line);
            }
            if (cfg.toFile) {
                WriteFileLine(line);
            }

            if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(cfg.flushLevel)) {
                if (m_file != INVALID_HANDLE_VALUE) {
                    (void)::FlushFileBuffers(m_file);
                }
                (void)std::fflush(stderr);
            }
        }

        void Logger::WriteConsoleLine(const std::wstring& line) {
            (void)std::fwprintf(stderr, L"%ls\n", line.c_str());
        }

        void Logger::WriteFileLine(const std::wstring& line) {
            // Records are stored as UTF-8
            std::wstring withEol = line;
            withEol += L"\r\n";

            const int needed = ::WideCharToMultiByte(CP_UTF8, 0, withEol.data(), static_cast<int>(withEol.size()),
                                                     nullptr, 0, nullptr, nullptr);
            if (needed <= 0) {
                return;
            }
            std::string utf8(static_cast<size_t>(needed), '\0');
            (void)::WideCharToMultiByte(CP_UTF8, 0, withEol.data(), static_cast<int>(withEol.size()),
                                        utf8.data(), needed, nullptr, nullptr);

            RotateIfNeeded(utf8.size());
            OpenLogFileIfNeeded();
            if (m_file == INVALID_HANDLE_VALUE) {
                return;
            }

            DWORD written = 0;
            if (::WriteFile(m_file, utf8.data(), static_cast<DWORD>(utf8.size()), &written, nullptr)) {
                m_currentSize += written;
            }
            else {
                (void)std::fwprintf(stderr, L"[Logger] WriteFile failed (win32=%lu)\n", ::GetLastError());
            }
        }

        std::wstring Logger::BaseLogPath() const {
            std::wstring path = m_cfg.logDirectory;
            if (!path.empty() && path.back() != L'\\' && path.back() != L'/') {
                path += L'\\';
            }
            path += m_cfg.baseFileName;
            return path;
        }

        void Logger::OpenLogFileIfNeeded() {
            if (m_file != INVALID_HANDLE_VALUE) {
                return;
            }

            if (!m_cfg.logDirectory.empty()) {
                if (!::CreateDirectoryW(m_cfg.logDirectory.c_str(), nullptr)) {
                    const DWORD le = ::GetLastError();
                    if (le != ERROR_ALREADY_EXISTS) {
                        (void)std::fwprintf(stderr, L"[Logger] cannot create log directory %ls (win32=%lu)\n",
                                            m_cfg.logDirectory.c_str(), le);
                        return;
                    }
                }
            }

            const std::wstring path = BaseLogPath() + L".log";
            m_file = ::CreateFileW(path.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_DELETE,
                                   nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
            if (m_file == INVALID_HANDLE_VALUE) {
                (void)std::fwprintf(stderr, L"[Logger] cannot open %ls (win32=%lu)\n", path.c_str(), ::GetLastError());
                return;
            }

            LARGE_INTEGER size{};
            m_currentSize = ::GetFileSizeEx(m_file, &size) ? static_cast<uint64_t>(size.QuadPart) : 0;
            m_currentPath = path;
        }

        void Logger::RotateIfNeeded(size_t nextWriteBytes) {
            if (m_file == INVALID_HANDLE_VALUE || m_cfg.maxFileSizeBytes == 0) {
                return;
            }
            if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
                return;
            }

            CloseLogFile();

            // AclKit.log -> AclKit.1.log -> ... -> AclKit.(N-1).log; the oldest is dropped
            const std::wstring base = BaseLogPath();
            const size_t keep = m_cfg.maxFileCount > 0 ? m_cfg.maxFileCount : 1;
            if (keep > 1) {
                const std::wstring oldest = base + L"." + std::to_wstring(keep - 1) + L".log";
                (void)::DeleteFileW(oldest.c_str());
                for (size_t i = keep - 1; i > 1; --i) {
                    const std::wstring from = base + L"." + std::to_wstring(i - 1) + L".log";
                    const std::wstring to = base + L"." + std::to_wstring(i) + L".log";
                    (void)::MoveFileExW(from.c_str(), to.c_str(), MOVEFILE_REPLACE_EXISTING);
                }
                const std::wstring current = base + L".log";
                const std::wstring first = base + L".1.log";
                if (!::MoveFileExW(current.c_str(), first.c_str(), MOVEFILE_REPLACE_EXISTING)) {
                    (void)std::fwprintf(stderr, L"[Logger] rotation failed (win32=%lu)\n", ::GetLastError());
                }
            }
            else {
                const std::wstring current = base + L".log";
                (void)::DeleteFileW(current.c_str());
            }
        }

        void Logger::CloseLogFile() noexcept {
            if (m_file != INVALID_HANDLE_VALUE) {
                (void)::FlushFileBuffers(m_file);
                (void)::CloseHandle(m_file);
                m_file = INVALID_HANDLE_VALUE;
            }
            m_currentSize = 0;
            m_currentPath.clear();
        }

        // ============================================================================
        // Formatting
        // ============================================================================

        std::wstring Logger::FormatLine(const LogItem& item) const {
            bool json = false;
            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                json = m_cfg.jsonLines;
            }
            return json ? FormatAsJson(item) : FormatPrefix(item) + item.message;
        }

        std::wstring Logger::FormatPrefix(const LogItem& item) const {
            bool withIds = true;
            bool withSrc = true;
            {
                std::lock_guard<std::mutex> lock(m_cfgMutex);
                withIds = m_cfg.includeProcThreadId;
                withSrc = m_cfg.includeSrcLocation;
            }

            std::wstring out;
            out.reserve(128 + item.message.size());
            out += FormatIso8601UTC(item.ts_100ns);
            out += L" [";
            out += LevelToString(item.level);
            out += L"]";
            if (withIds) {
                out += L" [";
                out += std::to_wstring(item.pid);
                out += L':';
                out += std::to_wstring(item.tid);
                out += L']';
            }
            if (!item.category.empty()) {
                out += L" [";
                out += item.category;
                out += L']';
            }
            if (withSrc && !item.file.empty()) {
                // Only the file name, full build paths are noise
                const size_t slash = item.file.find_last_of(L"\\/");
                out += L" (";
                out += slash == std::wstring::npos ? item.file : item.file.substr(slash + 1);
                out += L':';
                out += std::to_wstring(item.line);
                if (!item.function.empty()) {
                    out += L' ';
                    out += item.function;
                }
                out += L')';
            }
            out += L' ';
            return out;
        }

        std::wstring Logger::FormatAsJson(const LogItem& item) const {
            std::wstring out;
            out.reserve(192 + item.message.size());
            out += L"{\"ts\":\"";
            out += FormatIso8601UTC(item.ts_100ns);
            out += L"\",\"level\":\"";
            out += LevelToString(item.level);
            out += L"\",\"category\":\"";
            out += EscapeJson(item.category);
            out += L"\",\"pid\":";
            out += std::to_wstring(item.pid);
            out += L",\"tid\":";
            out += std::to_wstring(item.tid);
            if (!item.file.empty()) {
                out += L",\"file\":\"";
                out += EscapeJson(item.file);
                out += L"\",\"line\":";
                out += std::to_wstring(item.line);
                out += L",\"function\":\"";
                out += EscapeJson(item.function);
                out += L'"';
            }
            if (item.winError != 0) {
                out += L",\"win32\":";
                out += std::to_wstring(item.winError);
            }
            out += L",\"message\":\"";
            out += EscapeJson(item.message);
            out += L"\"}";
            return out;
        }

        std::wstring Logger::EscapeJson(const std::wstring& s) {
            std::wstring out;
            out.reserve(s.size() + 8);
            for (const wchar_t c : s) {
                switch (c) {
                case L'"':  out += L"\\\""; break;
                case L'\\': out += L"\\\\"; break;
                case L'\n': out += L"\\n"; break;
                case L'\r': out += L"\\r"; break;
                case L'\t': out += L"\\t"; break;
                default:
                    if (c < 0x20) {
                        wchar_t buf[8]{};
                        (void)std::swprintf(buf, 8, L"\\u%04x", static_cast<unsigned>(c));
                        out += buf;
                    }
                    else {
                        out += c;
                    }
                }
            }
            return out;
        }

        const wchar_t* Logger::LevelToString(LogLevel level) noexcept {
            switch (level) {
            case LogLevel::Trace: return L"TRACE";
            case LogLevel::Debug: return L"DEBUG";
            case LogLevel::Info:  return L"INFO";
            case LogLevel::Warn:  return L"WARN";
            case LogLevel::Error: return L"ERROR";
            case LogLevel::Fatal: return L"FATAL";
            }
            return L"?";
        }

        std::wstring Logger::FormatMessageV(const wchar_t* fmt, va_list args) {
            if (fmt == nullptr) {
                return {};
            }

            std::vector<wchar_t> buffer(512);
            for (;;) {
                va_list copy;
                va_copy(copy, args);
                const int n = std::vswprintf(buffer.data(), buffer.size(), fmt, copy);
                va_end(copy);

                if (n >= 0 && static_cast<size_t>(n) < buffer.size()) {
                    return std::wstring(buffer.data(), static_cast<size_t>(n));
                }
                if (buffer.size() >= kMaxMessageChars) {
                    // Either a malformed format or an oversized message; keep what fits
                    buffer.back() = L'\0';
                    return std::wstring(buffer.data());
                }
                buffer.resize(std::min(buffer.size() * 2, kMaxMessageChars));
            }
        }

        std::wstring Logger::FormatWinError(DWORD err) {
            wchar_t* raw = nullptr;
            const DWORD len = ::FormatMessageW(
                FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                nullptr, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                reinterpret_cast<LPWSTR>(&raw), 0, nullptr);
            if (len == 0 || raw == nullptr) {
                return {};
            }

            std::wstring text(raw, len);
            ::LocalFree(raw);
            while (!text.empty() && (text.back() == L'\r' || text.back() == L'\n' || text.back() == L' ' || text.back() == L'.')) {
                text.pop_back();
            }
            return text;
        }

        const wchar_t* Logger::NarrowToWideTLS(const char* s) {
            thread_local std::array<std::wstring, kTlsSlots> slots;
            thread_local size_t next = 0;

            std::wstring& slot = slots[next];
            next = (next + 1) % kTlsSlots;

            slot.clear();
            if (s != nullptr) {
                // __FILE__ and __FUNCTION__ are ASCII in practice
                for (const char* p = s; *p != '\0'; ++p) {
                    slot.push_back(static_cast<wchar_t>(static_cast<unsigned char>(*p)));
                }
            }
            return slot.c_str();
        }

        uint64_t Logger::NowAsFileTime100nsUTC() {
            FILETIME ft{};
            ::GetSystemTimePreciseAsFileTime(&ft);
            return (static_cast<uint64_t>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
        }

        std::wstring Logger::FormatIso8601UTC(uint64_t filetime100ns) {
            FILETIME ft{};
            ft.dwLowDateTime = static_cast<DWORD>(filetime100ns & 0xFFFFFFFFULL);
            ft.dwHighDateTime = static_cast<DWORD>(filetime100ns >> 32);

            SYSTEMTIME st{};
            if (!::FileTimeToSystemTime(&ft, &st)) {
                return std::to_wstring((filetime100ns - kUnixEpochAs100ns) / 10000ULL);
            }

            wchar_t buf[40]{};
            (void)std::swprintf(buf, 40, L"%04u-%02u-%02uT%02u:%02u:%02u.%03uZ",
                                st.wYear, st.wMonth, st.wDay, st.wHour, st.wMinute, st.wSecond, st.wMilliseconds);
            return buf;
        }

        // ============================================================================
        // Scope
        // ============================================================================

        Logger::Scope::Scope(const wchar_t* category,
                             const wchar_t* file,
                             int line,
                             const wchar_t* function,
                             LogLevel level)
            : m_category(category), m_file(file), m_function(function), m_line(line), m_level(level) {
            (void)::QueryPerformanceCounter(&m_start);
            auto& lg = Logger::Instance();
            if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
                lg.LogMessage(m_level, m_category, L"Enter", m_file, m_line, m_function);
            }
        }

        Logger::Scope::~Scope() {
            auto& lg = Logger::Instance();
            if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) {
                return;
            }

            LARGE_INTEGER now{};
            LARGE_INTEGER freq{};
            (void)::QueryPerformanceCounter(&now);
            (void)::QueryPerformanceFrequency(&freq);
            const long long us = freq.QuadPart > 0
                ? (now.QuadPart - m_start.QuadPart) * 1000000LL / freq.QuadPart
                : 0;

            try {
                lg.LogMessage(m_level, m_category, L"Exit (" + std::to_wstring(us) + L" us)", m_file, m_line, m_function);
            }
            catch (const std::exception& ex) {
                (void)std::fprintf(stderr, "[Logger] scope exit logging failed: %s\n", ex.what());
            }
        }

    }  // namespace Utils
}  // namespace AclKit
