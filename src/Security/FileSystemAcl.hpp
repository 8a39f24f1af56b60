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
 * @file FileSystemAcl.hpp
 * @brief Read, write and create-with security descriptors on directories,
 *        files and open file streams.
 *
 * Every function validates its arguments in a fixed order, reports the first
 * failure through the optional Error and never throws. Native failures keep
 * their Win32 code and are logged under the "FileSystemAcl" category.
 *
 * @code
 *   DirectorySecurity security;
 *   security.AddAccessRule(FileSystemAccessRule(
 *       SecurityIdentifier::WellKnown(WellKnownSid::BuiltinUsers),
 *       FileSystemRights::ReadAndExecute, AccessControlType::Allow));
 *
 *   DirectoryInfo created;
 *   Error err;
 *   if (!CreateDirectory(&security, L"C:\\data\\incoming", created, &err)) {
 *       // err.kind, err.win32, err.paramName
 *   }
 * @endcode
 *
 * @warning Creating a directory that already exists succeeds and leaves its
 *          existing descriptor untouched; the supplied descriptor is ignored.
 * ============================================================================
 */

#pragma once

#include <cstdint>

#include "SecurityTypes.hpp"
#include "FileSystemSecurity.hpp"
#include "FileSystemTargets.hpp"

namespace AclKit {
namespace Security {

/// Sections read when the caller does not name any
inline constexpr AccessControlSections DEFAULT_GET_SECTIONS =
    AccessControlSections::Access | AccessControlSections::Owner | AccessControlSections::Group;

// ============================================================================
// GET
// ============================================================================

[[nodiscard]] bool GetAccessControl(const DirectoryInfo* directoryInfo, DirectorySecurity& out, Error* err = nullptr) noexcept;

[[nodiscard]] bool GetAccessControl(const DirectoryInfo* directoryInfo, AccessControlSections includeSections,
                                    DirectorySecurity& out, Error* err = nullptr) noexcept;

[[nodiscard]] bool GetAccessControl(const FileInfo* fileInfo, FileSecurity& out, Error* err = nullptr) noexcept;

[[nodiscard]] bool GetAccessControl(const FileInfo* fileInfo, AccessControlSections includeSections,
                                    FileSecurity& out, Error* err = nullptr) noexcept;

/**
 * @brief Read the descriptor through an open handle. A closed stream fails with ObjectDisposed.
 */
[[nodiscard]] bool GetAccessControl(const FileStream* fileStream, FileSecurity& out, Error* err = nullptr) noexcept;

// ============================================================================
// SET
// ============================================================================

/**
 * @brief Persist the modified sections of a descriptor.
 *
 * A descriptor with no modified section is a successful no-op.
 */
[[nodiscard]] bool SetAccessControl(const DirectoryInfo* directoryInfo, const DirectorySecurity* directorySecurity,
                                    Error* err = nullptr) noexcept;

[[nodiscard]] bool SetAccessControl(const FileInfo* fileInfo, const FileSecurity* fileSecurity,
                                    Error* err = nullptr) noexcept;

[[nodiscard]] bool SetAccessControl(const FileStream* fileStream, const FileSecurity* fileSecurity,
                                    Error* err = nullptr) noexcept;

// ============================================================================
// CREATE
// ============================================================================

/**
 * @brief Create the leaf directory with an initial descriptor.
 *
 * Parents are not created: a missing parent fails with UnauthorizedAccess
 * (win32 = ERROR_PATH_NOT_FOUND).
 */
[[nodiscard]] bool Create(const DirectoryInfo* directoryInfo, const DirectorySecurity* directorySecurity,
                          Error* err = nullptr) noexcept;

/**
 * @brief Create a directory at `path` and describe the result in `out`.
 *
 * Same semantics as Create(const DirectoryInfo*, ...). `out` describes the
 * existing directory when the path was already a directory.
 *
 * @note With UNICODE defined, the windows.h `CreateDirectory` macro renames
 *       this function to `AclKit::Security::CreateDirectoryW` in every
 *       translation unit that includes <Windows.h>. Debuggers and linker maps
 *       show that name. Unqualified calls still resolve here because the
 *       parameter list differs from ::CreateDirectoryW.
 */
[[nodiscard]] bool CreateDirectory(const DirectorySecurity* directorySecurity, const wchar_t* path,
                                   DirectoryInfo& out, Error* err = nullptr) noexcept;

/**
 * @brief Create or open a file with an initial descriptor.
 *
 * @param rights      Requested access; Synchronize is always added
 * @param share       FileShare value; Inheritable makes the handle inheritable
 * @param bufferSize  Must be positive; recorded on the stream
 * @param out         Receives the open stream (positioned at end for Append)
 *
 * The descriptor only takes effect when the file is created. Opening an
 * existing file leaves its descriptor untouched.
 */
[[nodiscard]] bool Create(const FileInfo* fileInfo,
                          FileMode mode,
                          FileSystemRights rights,
                          FileShare share,
                          int bufferSize,
                          FileOptions options,
                          const FileSecurity* fileSecurity,
                          FileStream& out,
                          Error* err = nullptr) noexcept;

}  // namespace Security
}  // namespace AclKit
