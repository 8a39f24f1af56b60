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
 * ============================================================================
 * AclKit Security - SHARED TYPES
 * ============================================================================
 *
 * @file SecurityTypes.hpp
 * @brief Access-control enumerations, the facade error structure and small
 *        RAII holders shared by the Security module.
 *
 * All flag values are bit-exact with the Win32 definitions so they can be
 * passed to the platform without translation.
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <cstdint>
#include <string>
#include <string_view>
#include <new>

// ============================================================================
// WINDOWS SDK INCLUDES
// ============================================================================

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
namespace Security {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace SecurityConstants {

    /// Default stream buffer size used when the caller supplies none
    inline constexpr int DEFAULT_BUFFER_SIZE = 4096;

    /// Default upper bound for native security descriptors read back (64KB)
    inline constexpr uint32_t DEFAULT_MAX_SECURITY_DESCRIPTOR_BYTES = 64 * 1024;

    /// Largest ACL the platform accepts
    inline constexpr uint32_t MAX_ACL_BYTES = 0xFFFC;

}  // namespace SecurityConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief File and directory access rights (Win32 access mask bits).
 */
enum class FileSystemRights : uint32_t {
    None                         = 0x00000000,
    ReadData                     = 0x00000001,
    ListDirectory                = ReadData,
    WriteData                    = 0x00000002,
    CreateFiles                  = WriteData,
    AppendData                   = 0x00000004,
    CreateDirectories            = AppendData,
    ReadExtendedAttributes       = 0x00000008,
    WriteExtendedAttributes      = 0x00000010,
    ExecuteFile                  = 0x00000020,
    Traverse                     = ExecuteFile,
    DeleteSubdirectoriesAndFiles = 0x00000040,
    ReadAttributes               = 0x00000080,
    WriteAttributes              = 0x00000100,
    Delete                       = 0x00010000,
    ReadPermissions              = 0x00020000,
    ChangePermissions            = 0x00040000,
    TakeOwnership                = 0x00080000,
    Synchronize                  = 0x00100000,

    Read           = ReadData | ReadExtendedAttributes | ReadAttributes | ReadPermissions,
    Write          = WriteData | AppendData | WriteExtendedAttributes | WriteAttributes,
    ReadAndExecute = Read | ExecuteFile,
    Modify         = ReadAndExecute | Write | Delete,
    FullControl    = 0x001F01FF
};

inline constexpr FileSystemRights operator|(FileSystemRights a, FileSystemRights b) noexcept {
    return static_cast<FileSystemRights>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr FileSystemRights operator&(FileSystemRights a, FileSystemRights b) noexcept {
    return static_cast<FileSystemRights>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr FileSystemRights operator~(FileSystemRights a) noexcept {
    return static_cast<FileSystemRights>(~static_cast<uint32_t>(a));
}

enum class AccessControlType : uint8_t {
    Allow = 0,
    Deny  = 1
};

enum class InheritanceFlags : uint8_t {
    None             = 0x00,
    ContainerInherit = 0x01,
    ObjectInherit    = 0x02
};

inline constexpr InheritanceFlags operator|(InheritanceFlags a, InheritanceFlags b) noexcept {
    return static_cast<InheritanceFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr InheritanceFlags operator&(InheritanceFlags a, InheritanceFlags b) noexcept {
    return static_cast<InheritanceFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

enum class PropagationFlags : uint8_t {
    None               = 0x00,
    NoPropagateInherit = 0x01,
    InheritOnly        = 0x02
};

inline constexpr PropagationFlags operator|(PropagationFlags a, PropagationFlags b) noexcept {
    return static_cast<PropagationFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline constexpr PropagationFlags operator&(PropagationFlags a, PropagationFlags b) noexcept {
    return static_cast<PropagationFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

/**
 * @brief Sections of a security descriptor.
 */
enum class AccessControlSections : uint32_t {
    None   = 0x00,
    Audit  = 0x01,
    Access = 0x02,
    Owner  = 0x04,
    Group  = 0x08,
    All    = 0x0F
};

inline constexpr AccessControlSections operator|(AccessControlSections a, AccessControlSections b) noexcept {
    return static_cast<AccessControlSections>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr AccessControlSections operator&(AccessControlSections a, AccessControlSections b) noexcept {
    return static_cast<AccessControlSections>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr bool HasSection(AccessControlSections value, AccessControlSections section) noexcept {
    return (static_cast<uint32_t>(value) & static_cast<uint32_t>(section)) != 0;
}

/**
 * @brief Kind of value stored in a rule's rights field.
 *
 * Both FileSecurity and DirectorySecurity report FileSystemRights.
 */
enum class AccessRightType : uint8_t {
    FileSystemRights = 0
};

enum class FileMode : int32_t {
    CreateNew    = 1,
    Create       = 2,
    Open         = 3,
    OpenOrCreate = 4,
    Truncate     = 5,
    Append       = 6
};

enum class FileShare : int32_t {
    None        = 0,
    Read        = 1,
    Write       = 2,
    ReadWrite   = 3,
    Delete      = 4,
    Inheritable = 16
};

inline constexpr FileShare operator|(FileShare a, FileShare b) noexcept {
    return static_cast<FileShare>(static_cast<int32_t>(a) | static_cast<int32_t>(b));
}

inline constexpr FileShare operator&(FileShare a, FileShare b) noexcept {
    return static_cast<FileShare>(static_cast<int32_t>(a) & static_cast<int32_t>(b));
}

/**
 * @brief Creation options, mapped onto FILE_FLAG_* values.
 */
enum class FileOptions : uint32_t {
    None           = 0,
    WriteThrough   = 0x80000000,   // FILE_FLAG_WRITE_THROUGH
    Asynchronous   = 0x40000000,   // FILE_FLAG_OVERLAPPED
    RandomAccess   = 0x10000000,   // FILE_FLAG_RANDOM_ACCESS
    DeleteOnClose  = 0x04000000,   // FILE_FLAG_DELETE_ON_CLOSE
    SequentialScan = 0x08000000,   // FILE_FLAG_SEQUENTIAL_SCAN
    Encrypted      = 0x00004000    // FILE_ATTRIBUTE_ENCRYPTED
};

inline constexpr FileOptions operator|(FileOptions a, FileOptions b) noexcept {
    return static_cast<FileOptions>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr FileOptions operator&(FileOptions a, FileOptions b) noexcept {
    return static_cast<FileOptions>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

/**
 * @brief Data access granted on an open stream, derived from the requested rights.
 */
enum class FileAccess : uint8_t {
    None      = 0,
    Read      = 1,
    Write     = 2,
    ReadWrite = 3
};

// ============================================================================
// ERROR REPORTING
// ============================================================================

enum class ErrorKind : uint8_t {
    None = 0,
    ArgumentNull,
    ArgumentOutOfRange,
    Argument,
    DirectoryNotFound,
    FileNotFound,
    UnauthorizedAccess,
    ObjectDisposed,
    IO,
    Platform
};

[[nodiscard]] const wchar_t* ErrorKindToString(ErrorKind kind) noexcept;

/**
 * @brief Error information for Security operations.
 *
 * `win32` is 0 for pure validation failures. `paramName` names the offending
 * argument for the Argument* kinds.
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    DWORD win32 = 0;
    std::wstring paramName;
    std::wstring message;

    [[nodiscard]] bool hasError() const noexcept { return kind != ErrorKind::None; }

    void clear() noexcept {
        kind = ErrorKind::None;
        win32 = 0;
        paramName.clear();
        message.clear();
    }
};

/**
 * @brief Classify a Win32 failure of a filesystem call.
 * @param directoryTarget The failing call addressed a directory
 */
[[nodiscard]] ErrorKind ErrorKindFromWin32(DWORD code, bool directoryTarget) noexcept;

/**
 * @brief Fill an optional Error. Allocation failures keep kind and code.
 */
inline void SetError(Error* err, ErrorKind kind, DWORD win32,
                     std::wstring_view message, std::wstring_view paramName = {}) noexcept {
    if (!err) return;
    err->kind = kind;
    err->win32 = win32;
    try {
        err->message = message;
        err->paramName = paramName;
    }
    catch (const std::bad_alloc&) {
        err->message.clear();
        err->paramName.clear();
    }
}

// ============================================================================
// RAII HOLDERS
// ============================================================================

/**
 * @brief Owner of memory the platform allocated with LocalAlloc.
 */
template <typename T>
class LocalMemory {
public:
    LocalMemory() noexcept = default;
    ~LocalMemory() noexcept { Reset(); }

    LocalMemory(const LocalMemory&) = delete;
    LocalMemory& operator=(const LocalMemory&) = delete;

    [[nodiscard]] T Get() const noexcept { return m_ptr; }

    /// Slot for an out-parameter; frees the current block first.
    [[nodiscard]] T* Put() noexcept {
        Reset();
        return &m_ptr;
    }

    void Reset() noexcept {
        if (m_ptr) {
            ::LocalFree(reinterpret_cast<HLOCAL>(m_ptr));
            m_ptr = nullptr;
        }
    }

    explicit operator bool() const noexcept { return m_ptr != nullptr; }

private:
    T m_ptr = nullptr;
};

// ============================================================================
// LIMITS
// ============================================================================

/**
 * @brief Process-wide facade limits, normally applied by Config::Settings.
 */
struct AclLimits {
    /// Buffer size for callers that do not pass one
    int defaultBufferSize = SecurityConstants::DEFAULT_BUFFER_SIZE;

    /// Native descriptors larger than this are rejected on read
    uint32_t maxSecurityDescriptorBytes = SecurityConstants::DEFAULT_MAX_SECURITY_DESCRIPTOR_BYTES;
};

void SetLimits(const AclLimits& limits) noexcept;

[[nodiscard]] AclLimits GetLimits() noexcept;

}  // namespace Security
}  // namespace AclKit
