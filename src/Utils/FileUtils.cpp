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
#include "FileUtils.hpp"

#include <cwchar>
#include <random>
#include <vector>

namespace AclKit {
    namespace Utils {
        namespace FileUtils {

            namespace {
                constexpr int kMaxTempDirAttempts = 16;

                void SetError(Error* err, DWORD code, const char* msg) noexcept {
                    if (!err) return;
                    err->win32 = code;
                    try {
                        err->message = msg;
                    }
                    catch (const std::bad_alloc&) {
                        err->message.clear();
                    }
                }

                [[nodiscard]] bool IsSeparator(wchar_t c) noexcept {
                    return c == L'\\' || c == L'/';
                }

                [[nodiscard]] std::wstring_view TrimTrailingSeparators(std::wstring_view path) noexcept {
                    // Keep "C:\" and "\" intact
                    while (path.size() > 1 && IsSeparator(path.back())) {
                        if (path.size() == 3 && path[1] == L':') break;
                        path.remove_suffix(1);
                    }
                    return path;
                }

                /// Deletes a single entry found while walking, clearing read-only first
                bool DeleteEntry(const std::wstring& fullPath, const WIN32_FIND_DATAW& fd, Error* err) {
                    if (fd.dwFileAttributes & FILE_ATTRIBUTE_READONLY) {
                        (void)::SetFileAttributesW(fullPath.c_str(), fd.dwFileAttributes & ~FILE_ATTRIBUTE_READONLY);
                    }

                    const bool isDir = (fd.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
                    const BOOL ok = isDir ? ::RemoveDirectoryW(fullPath.c_str()) : ::DeleteFileW(fullPath.c_str());
                    if (!ok) {
                        const DWORD le = ::GetLastError();
                        SetError(err, le, isDir ? "RemoveDirectoryW failed" : "DeleteFileW failed");
                        AK_LOG_WIN_ERROR(L"FileUtils", le, L"cannot delete %ls", fullPath.c_str());
                        return false;
                    }
                    return true;
                }

                bool RemoveTree(const std::wstring& dir, Error* err) {
                    const std::wstring pattern = Combine(dir, L"*");
                    WIN32_FIND_DATAW fd{};
                    HANDLE find = ::FindFirstFileExW(pattern.c_str(), FindExInfoBasic, &fd,
                                                     FindExSearchNameMatch, nullptr, FIND_FIRST_EX_LARGE_FETCH);
                    if (find == INVALID_HANDLE_VALUE) {
                        const DWORD le = ::GetLastError();
                        if (le == ERROR_FILE_NOT_FOUND) {
                            return true;
                        }
                        SetError(err, le, "FindFirstFileExW failed");
                        return false;
                    }

                    struct FindGuard {
                        HANDLE h;
                        ~FindGuard() noexcept { ::FindClose(h); }
                    } guard{ find };

                    bool ok = true;
                    do {
                        const std::wstring_view name = fd.cFileName;
                        if (name == L"." || name == L"..") {
                            continue;
                        }

                        const std::wstring child = Combine(dir, name);
                        const bool isDir = (fd.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
                        const bool isReparse = (fd.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT) != 0;

                        if (isDir && !isReparse) {
                            // The child's own DACL may deny listing; the delete below decides
                            (void)RemoveTree(child, nullptr);
                        }
                        if (!DeleteEntry(child, fd, err)) {
                            ok = false;
                        }
                    } while (::FindNextFileW(find, &fd));

                    return ok;
                }
            }

            // ============================================================================
            // Path Helpers
            // ============================================================================

            std::wstring GetFullPath(std::wstring_view path, Error* err) {
                if (path.empty()) {
                    SetError(err, ERROR_INVALID_PARAMETER, "Empty path");
                    return {};
                }
                if (path.size() > MAX_REASONABLE_PATH_LENGTH) {
                    SetError(err, ERROR_FILENAME_EXCED_RANGE, "Path too long");
                    return {};
                }

                const std::wstring in(path);
                DWORD needed = ::GetFullPathNameW(in.c_str(), 0, nullptr, nullptr);
                if (needed == 0) {
                    SetError(err, ::GetLastError(), "GetFullPathNameW failed");
                    return {};
                }

                std::wstring out(needed, L'\0');
                const DWORD written = ::GetFullPathNameW(in.c_str(), needed, out.data(), nullptr);
                if (written == 0 || written >= needed) {
                    SetError(err, written == 0 ? ::GetLastError() : ERROR_INSUFFICIENT_BUFFER, "GetFullPathNameW failed");
                    return {};
                }
                out.resize(written);
                return out;
            }

            std::wstring GetParentPath(std::wstring_view path) {
                path = TrimTrailingSeparators(path);
                const size_t pos = path.find_last_of(L"\\/");
                if (pos == std::wstring_view::npos) {
                    return {};
                }
                // "C:\dir" -> "C:\" and "\dir" -> "\"
                if (pos == 0 || (pos == 2 && path[1] == L':')) {
                    return std::wstring(path.substr(0, pos + 1));
                }
                return std::wstring(path.substr(0, pos));
            }

            std::wstring GetFileName(std::wstring_view path) {
                path = TrimTrailingSeparators(path);
                const size_t pos = path.find_last_of(L"\\/");
                return std::wstring(pos == std::wstring_view::npos ? path : path.substr(pos + 1));
            }

            std::wstring Combine(std::wstring_view left, std::wstring_view right) {
                if (left.empty()) return std::wstring(right);
                if (right.empty()) return std::wstring(left);

                std::wstring out(left);
                const bool leftSep = IsSeparator(out.back());
                const bool rightSep = IsSeparator(right.front());
                if (leftSep && rightSep) {
                    right.remove_prefix(1);
                }
                else if (!leftSep && !rightSep) {
                    out += L'\\';
                }
                out += right;
                return out;
            }

            // ============================================================================
            // File Existence and Status
            // ============================================================================

            bool Exists(std::wstring_view path, Error* err) {
                if (path.empty()) {
                    SetError(err, ERROR_INVALID_PARAMETER, "Empty path");
                    return false;
                }
                const std::wstring p(path);
                const DWORD attrs = ::GetFileAttributesW(p.c_str());
                if (attrs == INVALID_FILE_ATTRIBUTES) {
                    const DWORD le = ::GetLastError();
                    if (le != ERROR_FILE_NOT_FOUND && le != ERROR_PATH_NOT_FOUND) {
                        SetError(err, le, "GetFileAttributesW failed");
                    }
                    return false;
                }
                return true;
            }

            bool IsDirectory(std::wstring_view path, Error* err) {
                if (path.empty()) {
                    SetError(err, ERROR_INVALID_PARAMETER, "Empty path");
                    return false;
                }
                const std::wstring p(path);
                const DWORD attrs = ::GetFileAttributesW(p.c_str());
                if (attrs == INVALID_FILE_ATTRIBUTES) {
                    const DWORD le = ::GetLastError();
                    if (le != ERROR_FILE_NOT_FOUND && le != ERROR_PATH_NOT_FOUND) {
                        SetError(err, le, "GetFileAttributesW failed");
                    }
                    return false;
                }
                return (attrs & FILE_ATTRIBUTE_DIRECTORY) != 0;
            }

            // ============================================================================
            // Reading/Writing
            // ============================================================================

            bool ReadAllTextUtf8(std::wstring_view path, std::string& out, Error* err) {
                out.clear();
                const std::wstring p(path);
                HANDLE h = ::CreateFileW(p.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                                         OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
                if (h == INVALID_HANDLE_VALUE) {
                    const DWORD le = ::GetLastError();
                    SetError(err, le, "CreateFileW failed");
                    AK_LOG_WIN_ERROR(L"FileUtils", le, L"cannot open %ls", p.c_str());
                    return false;
                }

                struct HandleGuard {
                    HANDLE h;
                    ~HandleGuard() noexcept { ::CloseHandle(h); }
                } guard{ h };

                LARGE_INTEGER size{};
                if (!::GetFileSizeEx(h, &size)) {
                    SetError(err, ::GetLastError(), "GetFileSizeEx failed");
                    return false;
                }
                if (static_cast<uint64_t>(size.QuadPart) > MAX_READ_FILE_SIZE) {
                    SetError(err, ERROR_FILE_TOO_LARGE, "File too large");
                    return false;
                }

                try {
                    out.resize(static_cast<size_t>(size.QuadPart));
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, "Memory allocation failed");
                    return false;
                }

                size_t total = 0;
                while (total < out.size()) {
                    const DWORD chunk = static_cast<DWORD>(std::min<size_t>(out.size() - total, 1u << 20));
                    DWORD read = 0;
                    if (!::ReadFile(h, out.data() + total, chunk, &read, nullptr)) {
                        SetError(err, ::GetLastError(), "ReadFile failed");
                        out.clear();
                        return false;
                    }
                    if (read == 0) break;
                    total += read;
                }
                out.resize(total);
                return true;
            }

            bool WriteAllTextUtf8Atomic(std::wstring_view path, std::string_view utf8, Error* err) {
                const std::wstring target(path);
                const std::wstring temp = target + L".tmp" + std::to_wstring(::GetCurrentProcessId());

                HANDLE h = ::CreateFileW(temp.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
                if (h == INVALID_HANDLE_VALUE) {
                    const DWORD le = ::GetLastError();
                    SetError(err, le, "CreateFileW failed");
                    AK_LOG_WIN_ERROR(L"FileUtils", le, L"cannot create %ls", temp.c_str());
                    return false;
                }

                size_t total = 0;
                bool ok = true;
                while (total < utf8.size()) {
                    const DWORD chunk = static_cast<DWORD>(std::min<size_t>(utf8.size() - total, 1u << 20));
                    DWORD written = 0;
                    if (!::WriteFile(h, utf8.data() + total, chunk, &written, nullptr)) {
                        SetError(err, ::GetLastError(), "WriteFile failed");
                        ok = false;
                        break;
                    }
                    total += written;
                }
                if (ok && !::FlushFileBuffers(h)) {
                    SetError(err, ::GetLastError(), "FlushFileBuffers failed");
                    ok = false;
                }
                ::CloseHandle(h);

                if (ok && !::MoveFileExW(temp.c_str(), target.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
                    SetError(err, ::GetLastError(), "MoveFileExW failed");
                    ok = false;
                }
                if (!ok) {
                    (void)::DeleteFileW(temp.c_str());
                }
                return ok;
            }

            // ============================================================================
            // Directory Operations
            // ============================================================================

            bool CreateDirectories(std::wstring_view dir, Error* err) {
                if (dir.empty()) {
                    SetError(err, ERROR_INVALID_PARAMETER, "Empty path");
                    return false;
                }

                const std::wstring full = GetFullPath(dir, err);
                if (full.empty()) {
                    return false;
                }
                if (IsDirectory(full)) {
                    return true;
                }

                const std::wstring parent = GetParentPath(full);
                if (!parent.empty() && parent != full && !IsDirectory(parent)) {
                    if (!CreateDirectories(parent, err)) {
                        return false;
                    }
                }

                if (!::CreateDirectoryW(full.c_str(), nullptr)) {
                    const DWORD le = ::GetLastError();
                    if (le == ERROR_ALREADY_EXISTS && IsDirectory(full)) {
                        return true;
                    }
                    SetError(err, le, "CreateDirectoryW failed");
                    AK_LOG_WIN_ERROR(L"FileUtils", le, L"cannot create directory %ls", full.c_str());
                    return false;
                }
                return true;
            }

            bool RemoveFile(std::wstring_view path, Error* err) {
                const std::wstring p(path);
                const DWORD attrs = ::GetFileAttributesW(p.c_str());
                if (attrs != INVALID_FILE_ATTRIBUTES && (attrs & FILE_ATTRIBUTE_READONLY)) {
                    (void)::SetFileAttributesW(p.c_str(), attrs & ~FILE_ATTRIBUTE_READONLY);
                }
                if (!::DeleteFileW(p.c_str())) {
                    const DWORD le = ::GetLastError();
                    if (le == ERROR_FILE_NOT_FOUND) {
                        return true;
                    }
                    SetError(err, le, "DeleteFileW failed");
                    return false;
                }
                return true;
            }

            bool RemoveDirectoryRecursive(std::wstring_view dir, Error* err) {
                if (dir.empty()) {
                    SetError(err, ERROR_INVALID_PARAMETER, "Empty path");
                    return false;
                }

                const std::wstring root(TrimTrailingSeparators(dir));
                if (!IsDirectory(root)) {
                    return !Exists(root) || RemoveFile(root, err);
                }

                bool ok = RemoveTree(root, err);
                if (!::RemoveDirectoryW(root.c_str())) {
                    const DWORD le = ::GetLastError();
                    SetError(err, le, "RemoveDirectoryW failed");
                    AK_LOG_WIN_ERROR(L"FileUtils", le, L"cannot remove %ls", root.c_str());
                    ok = false;
                }
                return ok;
            }

            std::wstring CreateUniqueTempDirectory(std::wstring_view prefix, Error* err) {
                wchar_t tempRoot[MAX_PATH + 1]{};
                const DWORD len = ::GetTempPathW(MAX_PATH + 1, tempRoot);
                if (len == 0 || len > MAX_PATH) {
                    SetError(err, len == 0 ? ::GetLastError() : ERROR_BUFFER_OVERFLOW, "GetTempPathW failed");
                    return {};
                }

                std::random_device rd;
                std::mt19937_64 gen(rd());
                for (int attempt = 0; attempt < kMaxTempDirAttempts; ++attempt) {
                    wchar_t suffix[24]{};
                    (void)std::swprintf(suffix, 24, L"%016llx", static_cast<unsigned long long>(gen()));

                    std::wstring candidate = Combine(tempRoot, std::wstring(prefix) + L"_" + suffix);
                    if (::CreateDirectoryW(candidate.c_str(), nullptr)) {
                        return candidate;
                    }
                    const DWORD le = ::GetLastError();
                    if (le != ERROR_ALREADY_EXISTS) {
                        SetError(err, le, "CreateDirectoryW failed");
                        return {};
                    }
                }

                SetError(err, ERROR_ALREADY_EXISTS, "No unique temp directory name found");
                return {};
            }

        }//namespace FileUtils
    }//namespace Utils
}//namespace AclKit
