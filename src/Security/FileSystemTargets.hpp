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
/**
 * @file FileSystemTargets.hpp
 * @brief Filesystem objects the ACL facade operates on.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "SecurityTypes.hpp"

namespace AclKit {
namespace Security {

/**
 * @brief A directory path and its absolute form. The directory need not exist.
 */
class DirectoryInfo {
public:
    DirectoryInfo() = default;
    explicit DirectoryInfo(std::wstring_view path);

    [[nodiscard]] const std::wstring& OriginalPath() const noexcept { return m_path; }
    [[nodiscard]] const std::wstring& FullName() const noexcept { return m_fullName; }
    [[nodiscard]] std::wstring Name() const;

    /// True iff the path names an existing directory
    [[nodiscard]] bool Exists() const;

private:
    std::wstring m_path;
    std::wstring m_fullName;
};

/**
 * @brief A file path and its absolute form. The file need not exist.
 */
class FileInfo {
public:
    FileInfo() = default;
    explicit FileInfo(std::wstring_view path);

    [[nodiscard]] const std::wstring& OriginalPath() const noexcept { return m_path; }
    [[nodiscard]] const std::wstring& FullName() const noexcept { return m_fullName; }
    [[nodiscard]] std::wstring Name() const;
    [[nodiscard]] std::wstring DirectoryName() const;

    /// True iff the path names an existing non-directory
    [[nodiscard]] bool Exists() const;

private:
    std::wstring m_path;
    std::wstring m_fullName;
};

/**
 * @brief Owning wrapper over an open file HANDLE.
 *
 * Move-only. The handle is closed on destruction or Close(); a closed
 * stream is reported as disposed by the ACL facade.
 */
class FileStream {
public:
    FileStream() noexcept = default;
    FileStream(HANDLE handle, std::wstring path, FileAccess access, int bufferSize) noexcept;
    ~FileStream() noexcept;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;

    /**
     * @brief Open an existing (or new, per mode) file without a security descriptor.
     *        The stream takes the process-wide default buffer size from GetLimits().
     *
     * Append requires write access and positions the stream at the end.
     */
    [[nodiscard]] static bool Open(std::wstring_view path, FileMode mode, FileAccess access, FileShare share,
                                   FileStream& out, Error* err = nullptr) noexcept;

    /**
     * @brief Lowest-level open used by Open() and the ACL facade.
     *
     * Failures are mapped through ErrorKindFromWin32 with the Win32 code kept.
     * @param seekToEnd Position at end of file after opening (FileMode::Append)
     */
    [[nodiscard]] static bool OpenNative(std::wstring_view path,
                                         DWORD desiredAccess,
                                         DWORD shareMode,
                                         DWORD creationDisposition,
                                         DWORD flagsAndAttributes,
                                         SECURITY_ATTRIBUTES* securityAttributes,
                                         bool seekToEnd,
                                         FileAccess access,
                                         int bufferSize,
                                         FileStream& out,
                                         Error* err = nullptr) noexcept;

    /**
     * @brief CreateFileW disposition for a mode. Append maps to OPEN_ALWAYS.
     * @return 0 for a value outside the enumeration
     */
    [[nodiscard]] static DWORD CreationDisposition(FileMode mode) noexcept;

    /**
     * @brief Write raw bytes at the current position.
     */
    [[nodiscard]] bool Write(const void* data, DWORD size, Error* err = nullptr) noexcept;

    /**
     * @brief Size of the file in bytes.
     */
    [[nodiscard]] bool Length(uint64_t& out, Error* err = nullptr) const noexcept;

    /**
     * @brief Current file pointer.
     */
    [[nodiscard]] bool Position(uint64_t& out, Error* err = nullptr) const noexcept;

    /// Closes the handle; failures are logged. Safe to call twice.
    void Close() noexcept;

    [[nodiscard]] bool IsClosed() const noexcept { return m_handle == INVALID_HANDLE_VALUE; }
    [[nodiscard]] HANDLE Handle() const noexcept { return m_handle; }
    [[nodiscard]] const std::wstring& Name() const noexcept { return m_path; }
    [[nodiscard]] FileAccess Access() const noexcept { return m_access; }
    [[nodiscard]] bool CanRead() const noexcept;
    [[nodiscard]] bool CanWrite() const noexcept;
    [[nodiscard]] int BufferSize() const noexcept { return m_bufferSize; }

private:
    HANDLE m_handle = INVALID_HANDLE_VALUE;
    std::wstring m_path;
    FileAccess m_access = FileAccess::None;
    int m_bufferSize = 0;
};

}  // namespace Security
}  // namespace AclKit
