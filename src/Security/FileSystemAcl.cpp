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
 * AclKit Security - FILE SYSTEM ACL FACADE
 * ============================================================================
 *
 * @file FileSystemAcl.cpp
 * @brief Implementation of the ACL facade over the Win32 security APIs.
 *
 * IMPLEMENTATION NOTES:
 * =====================
 * - Paths go through GetNamedSecurityInfoW / SetNamedSecurityInfoW
 * - Streams go through GetSecurityInfo / SetSecurityInfo on the open handle
 * - Creation passes a self-relative descriptor in SECURITY_ATTRIBUTES; an
 *   unmodified descriptor passes none so the object inherits from its parent
 * ============================================================================
 */

#include "pch.h"
#include "FileSystemAcl.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <aclapi.h>

#ifdef _WIN32
#  pragma comment(lib, "Advapi32.lib")
#endif

namespace AclKit {
namespace Security {

namespace {

    constexpr const wchar_t* kCategory = L"FileSystemAcl";

    [[nodiscard]] SECURITY_INFORMATION ToSecurityInformation(AccessControlSections sections) noexcept {
        SECURITY_INFORMATION info = 0;
        if (HasSection(sections, AccessControlSections::Owner))  info |= OWNER_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Group))  info |= GROUP_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Access)) info |= DACL_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Audit))  info |= SACL_SECURITY_INFORMATION;
        return info;
    }

    /**
     * @brief Load a descriptor the platform returned into `out`, enforcing the size limit.
     */
    bool LoadDescriptor(PSECURITY_DESCRIPTOR sd, FileSystemSecurity& out, Error* err) noexcept {
        const DWORD length = ::GetSecurityDescriptorLength(sd);
        const uint32_t limit = GetLimits().maxSecurityDescriptorBytes;
        if (length > limit) {
            SetError(err, ErrorKind::IO, ERROR_INVALID_SECURITY_DESCR, L"Security descriptor exceeds the configured limit");
            AK_LOG_ERROR(kCategory, L"descriptor of %lu bytes exceeds limit %u", length, limit);
            return false;
        }
        return out.FromNative(sd, err);
    }

    /**
     * @brief Named-object read shared by the directory and file overloads.
     * @param fullPath Absolute path of the target
     */
    bool GetNamed(const std::wstring& fullPath, AccessControlSections sections, bool isDirectory,
                  FileSystemSecurity& out, Error* err) noexcept {
        const SECURITY_INFORMATION info = ToSecurityInformation(sections);

        if (info == 0) {
            // Nothing to read; the target must still exist
            const DWORD attributes = ::GetFileAttributesW(fullPath.c_str());
            if (attributes == INVALID_FILE_ATTRIBUTES) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKindFromWin32(le, isDirectory), le, L"GetFileAttributesW failed");
                return false;
            }
            std::vector<uint8_t> empty;
            FileSecurity blank;
            if (!blank.ToNative(AccessControlSections::None, empty, err)) {
                return false;
            }
            return out.FromNative(reinterpret_cast<PSECURITY_DESCRIPTOR>(empty.data()), err);
        }

        LocalMemory<PSECURITY_DESCRIPTOR> sd;
        const DWORD rc = ::GetNamedSecurityInfoW(fullPath.c_str(), SE_FILE_OBJECT, info,
                                                 nullptr, nullptr, nullptr, nullptr, sd.Put());
        if (rc != ERROR_SUCCESS) {
            SetError(err, ErrorKindFromWin32(rc, isDirectory), rc, L"GetNamedSecurityInfoW failed");
            if (rc == ERROR_FILE_NOT_FOUND || rc == ERROR_PATH_NOT_FOUND) {
                AK_LOG_DEBUG(kCategory, L"GetNamedSecurityInfoW: %ls not found", fullPath.c_str());
            }
            else {
                AK_LOG_WIN_ERROR(kCategory, rc, L"GetNamedSecurityInfoW failed: %ls", fullPath.c_str());
            }
            return false;
        }
        return LoadDescriptor(sd.Get(), out, err);
    }

    /**
     * @brief Owner, group and DACL pointers into a self-relative descriptor.
     */
    struct DescriptorParts {
        PSID owner = nullptr;
        PSID group = nullptr;
        PACL dacl = nullptr;
    };

    bool SplitDescriptor(std::vector<uint8_t>& buffer, DescriptorParts& parts, Error* err) noexcept {
        auto* sd = reinterpret_cast<PSECURITY_DESCRIPTOR>(buffer.data());
        BOOL defaulted = FALSE;
        BOOL present = FALSE;
        if (!::GetSecurityDescriptorOwner(sd, &parts.owner, &defaulted) ||
            !::GetSecurityDescriptorGroup(sd, &parts.group, &defaulted) ||
            !::GetSecurityDescriptorDacl(sd, &present, &parts.dacl, &defaulted)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"Cannot read descriptor parts");
            return false;
        }
        if (!present) {
            parts.dacl = nullptr;
        }
        return true;
    }

    /**
     * @brief Named-object write shared by the directory and file overloads.
     */
    bool SetNamed(const std::wstring& fullPath, const FileSystemSecurity& security, bool isDirectory, Error* err) noexcept {
        const SECURITY_INFORMATION info = security.ModifiedSecurityInformation();
        if (info == 0) {
            AK_LOG_DEBUG(kCategory, L"nothing modified, %ls left unchanged", fullPath.c_str());
            return true;
        }

        std::vector<uint8_t> buffer;
        DescriptorParts parts;
        if (!security.ToNative(security.ModifiedSections(), buffer, err) || !SplitDescriptor(buffer, parts, err)) {
            return false;
        }

        try {
            std::wstring path(fullPath);
            const DWORD rc = ::SetNamedSecurityInfoW(path.data(), SE_FILE_OBJECT, info,
                                                     parts.owner, parts.group, parts.dacl, nullptr);
            if (rc != ERROR_SUCCESS) {
                SetError(err, ErrorKindFromWin32(rc, isDirectory), rc, L"SetNamedSecurityInfoW failed");
                AK_LOG_WIN_ERROR(kCategory, rc, L"SetNamedSecurityInfoW failed: %ls", fullPath.c_str());
                return false;
            }
            return true;
        }
        catch (const std::bad_alloc&) {
            SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
            return false;
        }
    }

    /**
     * @brief SECURITY_ATTRIBUTES for a create call. `buffer` must outlive the attributes.
     */
    bool PrepareSecurityAttributes(const FileSystemSecurity& security, bool inheritHandle,
                                   std::vector<uint8_t>& buffer, SECURITY_ATTRIBUTES& sa, Error* err) noexcept {
        sa = SECURITY_ATTRIBUTES{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = inheritHandle ? TRUE : FALSE;
        sa.lpSecurityDescriptor = nullptr;

        if (!security.IsModified()) {
            return true;
        }
        if (!security.ToNative(security.ModifiedSections(), buffer, err)) {
            return false;
        }
        sa.lpSecurityDescriptor = buffer.data();
        return true;
    }

    /**
     * @brief Leaf directory creation with the idempotent-existing behaviour.
     */
    bool CreateDirectoryCore(const std::wstring& fullPath, const DirectorySecurity& security, Error* err) noexcept {
        if (Utils::FileUtils::IsDirectory(fullPath)) {
            AK_LOG_DEBUG(kCategory, L"%ls already exists, supplied descriptor ignored", fullPath.c_str());
            return true;
        }
        if (Utils::FileUtils::Exists(fullPath)) {
            SetError(err, ErrorKind::IO, ERROR_ALREADY_EXISTS, L"A file with the same name already exists");
            return false;
        }

        std::vector<uint8_t> buffer;
        SECURITY_ATTRIBUTES sa{};
        if (!PrepareSecurityAttributes(security, false, buffer, sa, err)) {
            return false;
        }

        if (::CreateDirectoryW(fullPath.c_str(), &sa)) {
            AK_LOG_DEBUG(kCategory, L"created directory %ls", fullPath.c_str());
            return true;
        }

        const DWORD le = ::GetLastError();
        if (le == ERROR_ALREADY_EXISTS && Utils::FileUtils::IsDirectory(fullPath)) {
            // Lost a race with another creator; same outcome as finding it up front
            AK_LOG_DEBUG(kCategory, L"%ls appeared concurrently, supplied descriptor ignored", fullPath.c_str());
            return true;
        }
        if (le == ERROR_PATH_NOT_FOUND) {
            SetError(err, ErrorKind::UnauthorizedAccess, le, L"Parent directory does not exist");
            AK_LOG_DEBUG(kCategory, L"cannot create %ls: parent missing", fullPath.c_str());
            return false;
        }

        SetError(err, le == ERROR_ALREADY_EXISTS ? ErrorKind::IO : ErrorKindFromWin32(le, true), le,
                 L"CreateDirectoryW failed");
        AK_LOG_WIN_ERROR(kCategory, le, L"CreateDirectoryW failed: %ls", fullPath.c_str());
        return false;
    }

    [[nodiscard]] bool IsWriteMode(FileMode mode) noexcept {
        return mode == FileMode::Truncate || mode == FileMode::CreateNew ||
               mode == FileMode::Create || mode == FileMode::Append;
    }

    [[nodiscard]] FileAccess AccessFromRights(FileSystemRights rights) noexcept {
        uint8_t access = 0;
        if ((rights & FileSystemRights::ReadData) != FileSystemRights::None) {
            access |= static_cast<uint8_t>(FileAccess::Read);
        }
        if ((rights & FileSystemRights::Write) != FileSystemRights::None) {
            access |= static_cast<uint8_t>(FileAccess::Write);
        }
        return static_cast<FileAccess>(access);
    }

}  // namespace

// ============================================================================
// GET
// ============================================================================

bool GetAccessControl(const DirectoryInfo* directoryInfo, DirectorySecurity& out, Error* err) noexcept {
    return GetAccessControl(directoryInfo, DEFAULT_GET_SECTIONS, out, err);
}

bool GetAccessControl(const DirectoryInfo* directoryInfo, AccessControlSections includeSections,
                      DirectorySecurity& out, Error* err) noexcept {
    if (!directoryInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directoryInfo");
        return false;
    }
    if (directoryInfo->FullName().empty()) {
        SetError(err, ErrorKind::Argument, 0, L"Empty path", L"directoryInfo");
        return false;
    }
    return GetNamed(directoryInfo->FullName(), includeSections, true, out, err);
}

bool GetAccessControl(const FileInfo* fileInfo, FileSecurity& out, Error* err) noexcept {
    return GetAccessControl(fileInfo, DEFAULT_GET_SECTIONS, out, err);
}

bool GetAccessControl(const FileInfo* fileInfo, AccessControlSections includeSections,
                      FileSecurity& out, Error* err) noexcept {
    if (!fileInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileInfo");
        return false;
    }
    if (fileInfo->FullName().empty()) {
        SetError(err, ErrorKind::Argument, 0, L"Empty path", L"fileInfo");
        return false;
    }
    return GetNamed(fileInfo->FullName(), includeSections, false, out, err);
}

bool GetAccessControl(const FileStream* fileStream, FileSecurity& out, Error* err) noexcept {
    if (!fileStream) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileStream");
        return false;
    }
    if (fileStream->IsClosed()) {
        SetError(err, ErrorKind::ObjectDisposed, ERROR_INVALID_HANDLE, L"Cannot access a closed file", L"fileStream");
        return false;
    }

    LocalMemory<PSECURITY_DESCRIPTOR> sd;
    const DWORD rc = ::GetSecurityInfo(fileStream->Handle(), SE_FILE_OBJECT, ToSecurityInformation(DEFAULT_GET_SECTIONS),
                                       nullptr, nullptr, nullptr, nullptr, sd.Put());
    if (rc != ERROR_SUCCESS) {
        SetError(err, ErrorKindFromWin32(rc, false), rc, L"GetSecurityInfo failed");
        AK_LOG_WIN_ERROR(kCategory, rc, L"GetSecurityInfo failed: %ls", fileStream->Name().c_str());
        return false;
    }
    return LoadDescriptor(sd.Get(), out, err);
}

// ============================================================================
// SET
// ============================================================================

bool SetAccessControl(const DirectoryInfo* directoryInfo, const DirectorySecurity* directorySecurity, Error* err) noexcept {
    if (!directoryInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directoryInfo");
        return false;
    }
    if (!directorySecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directorySecurity");
        return false;
    }
    return SetNamed(directoryInfo->FullName(), *directorySecurity, true, err);
}

bool SetAccessControl(const FileInfo* fileInfo, const FileSecurity* fileSecurity, Error* err) noexcept {
    if (!fileInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileInfo");
        return false;
    }
    if (!fileSecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileSecurity");
        return false;
    }
    return SetNamed(fileInfo->FullName(), *fileSecurity, false, err);
}

bool SetAccessControl(const FileStream* fileStream, const FileSecurity* fileSecurity, Error* err) noexcept {
    if (!fileStream) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileStream");
        return false;
    }
    if (!fileSecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileSecurity");
        return false;
    }
    if (fileStream->IsClosed()) {
        SetError(err, ErrorKind::ObjectDisposed, ERROR_INVALID_HANDLE, L"Cannot access a closed file", L"fileStream");
        return false;
    }

    const SECURITY_INFORMATION info = fileSecurity->ModifiedSecurityInformation();
    if (info == 0) {
        AK_LOG_DEBUG(kCategory, L"nothing modified, %ls left unchanged", fileStream->Name().c_str());
        return true;
    }

    std::vector<uint8_t> buffer;
    DescriptorParts parts;
    if (!fileSecurity->ToNative(fileSecurity->ModifiedSections(), buffer, err) || !SplitDescriptor(buffer, parts, err)) {
        return false;
    }

    const DWORD rc = ::SetSecurityInfo(fileStream->Handle(), SE_FILE_OBJECT, info,
                                       parts.owner, parts.group, parts.dacl, nullptr);
    if (rc != ERROR_SUCCESS) {
        SetError(err, ErrorKindFromWin32(rc, false), rc, L"SetSecurityInfo failed");
        AK_LOG_WIN_ERROR(kCategory, rc, L"SetSecurityInfo failed: %ls", fileStream->Name().c_str());
        return false;
    }
    return true;
}

// ============================================================================
// CREATE
// ============================================================================

bool Create(const DirectoryInfo* directoryInfo, const DirectorySecurity* directorySecurity, Error* err) noexcept {
    if (!directoryInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directoryInfo");
        return false;
    }
    if (!directorySecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directorySecurity");
        return false;
    }
    if (directoryInfo->FullName().empty()) {
        SetError(err, ErrorKind::Argument, 0, L"Empty path", L"directoryInfo");
        return false;
    }
    return CreateDirectoryCore(directoryInfo->FullName(), *directorySecurity, err);
}

bool CreateDirectory(const DirectorySecurity* directorySecurity, const wchar_t* path,
                     DirectoryInfo& out, Error* err) noexcept {
    if (!directorySecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"directorySecurity");
        return false;
    }
    if (!path) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"path");
        return false;
    }
    if (*path == L'\0') {
        SetError(err, ErrorKind::Argument, 0, L"Path cannot be empty", L"path");
        return false;
    }

    try {
        DirectoryInfo info(path);
        if (!CreateDirectoryCore(info.FullName(), *directorySecurity, err)) {
            return false;
        }
        out = std::move(info);
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

bool Create(const FileInfo* fileInfo,
            FileMode mode,
            FileSystemRights rights,
            FileShare share,
            int bufferSize,
            FileOptions options,
            const FileSecurity* fileSecurity,
            FileStream& out,
            Error* err) noexcept {
    if (!fileInfo) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileInfo");
        return false;
    }
    if (!fileSecurity) {
        SetError(err, ErrorKind::ArgumentNull, 0, L"Value cannot be null", L"fileSecurity");
        return false;
    }

    const int32_t modeValue = static_cast<int32_t>(mode);
    if (modeValue < static_cast<int32_t>(FileMode::CreateNew) || modeValue > static_cast<int32_t>(FileMode::Append)) {
        SetError(err, ErrorKind::ArgumentOutOfRange, 0, L"Enum value was out of legal range", L"mode");
        return false;
    }

    const int32_t shareValue = static_cast<int32_t>(share) & ~static_cast<int32_t>(FileShare::Inheritable);
    if (shareValue < static_cast<int32_t>(FileShare::None) ||
        shareValue > static_cast<int32_t>(FileShare::ReadWrite | FileShare::Delete)) {
        SetError(err, ErrorKind::ArgumentOutOfRange, 0, L"Enum value was out of legal range", L"share");
        return false;
    }

    if (bufferSize <= 0) {
        SetError(err, ErrorKind::ArgumentOutOfRange, 0, L"Positive number required", L"bufferSize");
        return false;
    }

    if ((rights & FileSystemRights::Write) == FileSystemRights::None && IsWriteMode(mode)) {
        SetError(err, ErrorKind::Argument, 0, L"File mode requires write rights", L"rights");
        return false;
    }

    if (fileInfo->FullName().empty()) {
        SetError(err, ErrorKind::Argument, 0, L"Empty path", L"fileInfo");
        return false;
    }

    std::vector<uint8_t> buffer;
    SECURITY_ATTRIBUTES sa{};
    const bool inheritHandle = (share & FileShare::Inheritable) == FileShare::Inheritable;
    if (!PrepareSecurityAttributes(*fileSecurity, inheritHandle, buffer, sa, err)) {
        return false;
    }

    const DWORD desiredAccess = static_cast<DWORD>(rights | FileSystemRights::Synchronize);
    const DWORD flags = static_cast<DWORD>(options) | FILE_ATTRIBUTE_NORMAL | SECURITY_SQOS_PRESENT | SECURITY_ANONYMOUS;
    const bool append = mode == FileMode::Append;

    if (!FileStream::OpenNative(fileInfo->FullName(),
                                desiredAccess,
                                static_cast<DWORD>(shareValue),
                                FileStream::CreationDisposition(mode),
                                flags,
                                &sa,
                                append,
                                AccessFromRights(rights),
                                bufferSize,
                                out,
                                err)) {
        return false;
    }

    AK_LOG_DEBUG(kCategory, L"opened %ls (mode=%d, rights=0x%08X)", fileInfo->FullName().c_str(),
                 modeValue, static_cast<unsigned>(desiredAccess));
    return true;
}

}  // namespace Security
}  // namespace AclKit
