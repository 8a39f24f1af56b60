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
#include "FileSystemTargets.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

namespace AclKit {
namespace Security {

namespace {

    /// Resolved path, or the input itself when it cannot be resolved (e.g. empty)
    [[nodiscard]] std::wstring ResolveFullPath(std::wstring_view path) {
        if (path.empty()) {
            return {};
        }
        std::wstring full = Utils::FileUtils::GetFullPath(path);
        return full.empty() ? std::wstring(path) : full;
    }

    [[nodiscard]] bool IsNotFound(DWORD code) noexcept {
        return code == ERROR_FILE_NOT_FOUND || code == ERROR_PATH_NOT_FOUND;
    }

}  // namespace

// ============================================================================
// DirectoryInfo / FileInfo
// ============================================================================

DirectoryInfo::DirectoryInfo(std::wstring_view path)
    : m_path(path), m_fullName(ResolveFullPath(path)) {
}

std::wstring DirectoryInfo::Name() const {
    return Utils::FileUtils::GetFileName(m_fullName);
}

bool DirectoryInfo::Exists() const {
    return !m_fullName.empty() && Utils::FileUtils::IsDirectory(m_fullName);
}

FileInfo::FileInfo(std::wstring_view path)
    : m_path(path), m_fullName(ResolveFullPath(path)) {
}

std::wstring FileInfo::Name() const {
    return Utils::FileUtils::GetFileName(m_fullName);
}

std::wstring FileInfo::DirectoryName() const {
    return Utils::FileUtils::GetParentPath(m_fullName);
}

bool FileInfo::Exists() const {
    return !m_fullName.empty() &&
           Utils::FileUtils::Exists(m_fullName) &&
           !Utils::FileUtils::IsDirectory(m_fullName);
}

// ============================================================================
// FileStream - lifetime
// ============================================================================

FileStream::FileStream(HANDLE handle, std::wstring path, FileAccess access, int bufferSize) noexcept
    : m_handle(handle), m_path(std::move(path)), m_access(access), m_bufferSize(bufferSize) {
}

FileStream::~FileStream() noexcept {
    Close();
}

FileStream::FileStream(FileStream&& other) noexcept
    : m_handle(other.m_handle),
      m_path(std::move(other.m_path)),
      m_access(other.m_access),
      m_bufferSize(other.m_bufferSize) {
    other.m_handle = INVALID_HANDLE_VALUE;
    other.m_access = FileAccess::None;
    other.m_bufferSize = 0;
}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        Close();
        m_handle = other.m_handle;
        m_path = std::move(other.m_path);
        m_access = other.m_access;
        m_bufferSize = other.m_bufferSize;
        other.m_handle = INVALID_HANDLE_VALUE;
        other.m_access = FileAccess::None;
        other.m_bufferSize = 0;
    }
    return *this;
}

void FileStream::Close() noexcept {
    if (m_handle == INVALID_HANDLE_VALUE || m_handle == nullptr) {
        m_handle = INVALID_HANDLE_VALUE;
        return;
    }
    if (!::CloseHandle(m_handle)) {
        AK_LOG_LAST_ERROR(L"FileSystemAcl", L"CloseHandle failed for %ls", m_path.c_str());
    }
    m_handle = INVALID_HANDLE_VALUE;
}

bool FileStream::CanRead() const noexcept {
    return !IsClosed() &&
           (static_cast<uint8_t>(m_access) & static_cast<uint8_t>(FileAccess::Read)) != 0;
}

bool FileStream::CanWrite() const noexcept {
    return !IsClosed() &&
           (static_cast<uint8_t>(m_access) & static_cast<uint8_t>(FileAccess::Write)) != 0;
}

// ============================================================================
// FileStream - open
// ============================================================================

DWORD FileStream::CreationDisposition(FileMode mode) noexcept {
    switch (mode) {
    case FileMode::CreateNew:    return CREATE_NEW;
    case FileMode::Create:       return CREATE_ALWAYS;
    case FileMode::Open:         return OPEN_EXISTING;
    case FileMode::OpenOrCreate: return OPEN_ALWAYS;
    case FileMode::Truncate:     return TRUNCATE_EXISTING;
    case FileMode::Append:       return OPEN_ALWAYS;
    }
    return 0;
}

bool FileStream::OpenNative(std::wstring_view path,
                            DWORD desiredAccess,
                            DWORD shareMode,
                            DWORD creationDisposition,
                            DWORD flagsAndAttributes,
                            SECURITY_ATTRIBUTES* securityAttributes,
                            bool seekToEnd,
                            FileAccess access,
                            int bufferSize,
                            FileStream& out,
                            Error* err) noexcept {
    out.Close();

    try {
        std::wstring fullPath(path);
        HANDLE handle = ::CreateFileW(fullPath.c_str(),
                                      desiredAccess,
                                      shareMode,
                                      securityAttributes,
                                      creationDisposition,
                                      flagsAndAttributes,
                                      nullptr);
        if (handle == INVALID_HANDLE_VALUE) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKindFromWin32(le, false), le, L"CreateFileW failed");
            if (IsNotFound(le)) {
                AK_LOG_DEBUG(L"FileSystemAcl", L"CreateFileW: %ls not found (win32=%lu)", fullPath.c_str(), le);
            }
            else {
                AK_LOG_WIN_ERROR(L"FileSystemAcl", le, L"CreateFileW failed: %ls", fullPath.c_str());
            }
            return false;
        }

        FileStream stream(handle, std::move(fullPath), access, bufferSize);
        if (seekToEnd) {
            LARGE_INTEGER zero{};
            if (!::SetFilePointerEx(handle, zero, nullptr, FILE_END)) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKind::IO, le, L"SetFilePointerEx failed");
                AK_LOG_WIN_ERROR(L"FileSystemAcl", le, L"cannot seek to end of %ls", stream.Name().c_str());
                return false;
            }
        }

        out = std::move(stream);
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

bool FileStream::Open(std::wstring_view path, FileMode mode, FileAccess access, FileShare share,
                      FileStream& out, Error* err) noexcept {
    if (path.empty()) {
        SetError(err, ErrorKind::Argument, 0, L"Empty path", L"path");
        return false;
    }

    const DWORD disposition = CreationDisposition(mode);
    if (disposition == 0) {
        SetError(err, ErrorKind::ArgumentOutOfRange, 0, L"Invalid file mode", L"mode");
        return false;
    }
    if (access == FileAccess::None) {
        SetError(err, ErrorKind::ArgumentOutOfRange, 0, L"No access requested", L"access");
        return false;
    }

    const bool canWrite = (static_cast<uint8_t>(access) & static_cast<uint8_t>(FileAccess::Write)) != 0;
    const bool canRead = (static_cast<uint8_t>(access) & static_cast<uint8_t>(FileAccess::Read)) != 0;
    if (!canWrite && mode != FileMode::Open && mode != FileMode::OpenOrCreate) {
        SetError(err, ErrorKind::Argument, 0, L"File mode requires write access", L"access");
        return false;
    }
    if (mode == FileMode::Append && canRead) {
        SetError(err, ErrorKind::Argument, 0, L"Append mode cannot be combined with read access", L"access");
        return false;
    }

    DWORD desired = 0;
    if (canRead) desired |= GENERIC_READ;
    if (canWrite) desired |= GENERIC_WRITE;

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = (share & FileShare::Inheritable) == FileShare::Inheritable ? TRUE : FALSE;

    const DWORD shareMode = static_cast<DWORD>(share & (FileShare::ReadWrite | FileShare::Delete));

    try {
        const std::wstring fullPath = ResolveFullPath(path);
        return OpenNative(fullPath, desired, shareMode, disposition, FILE_ATTRIBUTE_NORMAL, &sa,
                          mode == FileMode::Append, access, GetLimits().defaultBufferSize, out, err);
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

// ============================================================================
// FileStream - I/O
// ============================================================================

bool FileStream::Write(const void* data, DWORD size, Error* err) noexcept {
    if (IsClosed()) {
        SetError(err, ErrorKind::ObjectDisposed, ERROR_INVALID_HANDLE, L"Stream is closed", L"fileStream");
        return false;
    }
    if (!CanWrite()) {
        SetError(err, ErrorKind::Argument, ERROR_ACCESS_DENIED, L"Stream does not support writing");
        return false;
    }

    DWORD written = 0;
    if (!::WriteFile(m_handle, data, size, &written, nullptr) || written != size) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::IO, le, L"WriteFile failed");
        AK_LOG_WIN_ERROR(L"FileSystemAcl", le, L"WriteFile failed: %ls", m_path.c_str());
        return false;
    }
    return true;
}

bool FileStream::Length(uint64_t& out, Error* err) const noexcept {
    if (IsClosed()) {
        SetError(err, ErrorKind::ObjectDisposed, ERROR_INVALID_HANDLE, L"Stream is closed", L"fileStream");
        return false;
    }

    LARGE_INTEGER size{};
    if (!::GetFileSizeEx(m_handle, &size)) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::IO, le, L"GetFileSizeEx failed");
        return false;
    }
    out = static_cast<uint64_t>(size.QuadPart);
    return true;
}

bool FileStream::Position(uint64_t& out, Error* err) const noexcept {
    if (IsClosed()) {
        SetError(err, ErrorKind::ObjectDisposed, ERROR_INVALID_HANDLE, L"Stream is closed", L"fileStream");
        return false;
    }

    LARGE_INTEGER zero{};
    LARGE_INTEGER pos{};
    if (!::SetFilePointerEx(m_handle, zero, &pos, FILE_CURRENT)) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::IO, le, L"SetFilePointerEx failed");
        return false;
    }
    out = static_cast<uint64_t>(pos.QuadPart);
    return true;
}

}  // namespace Security
}  // namespace AclKit
