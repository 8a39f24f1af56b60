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
#include "SecurityTypes.hpp"

namespace AclKit {
namespace Security {

namespace {

    std::atomic<int> g_defaultBufferSize{ SecurityConstants::DEFAULT_BUFFER_SIZE };
    std::atomic<uint32_t> g_maxDescriptorBytes{ SecurityConstants::DEFAULT_MAX_SECURITY_DESCRIPTOR_BYTES };

}  // namespace

const wchar_t* ErrorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:               return L"None";
    case ErrorKind::ArgumentNull:       return L"ArgumentNull";
    case ErrorKind::ArgumentOutOfRange: return L"ArgumentOutOfRange";
    case ErrorKind::Argument:           return L"Argument";
    case ErrorKind::DirectoryNotFound:  return L"DirectoryNotFound";
    case ErrorKind::FileNotFound:       return L"FileNotFound";
    case ErrorKind::UnauthorizedAccess: return L"UnauthorizedAccess";
    case ErrorKind::ObjectDisposed:     return L"ObjectDisposed";
    case ErrorKind::IO:                 return L"IO";
    case ErrorKind::Platform:           return L"Platform";
    }
    return L"Unknown";
}

ErrorKind ErrorKindFromWin32(DWORD code, bool directoryTarget) noexcept {
    switch (code) {
    case ERROR_SUCCESS:
        return ErrorKind::None;
    case ERROR_FILE_NOT_FOUND:
        return directoryTarget ? ErrorKind::DirectoryNotFound : ErrorKind::FileNotFound;
    case ERROR_PATH_NOT_FOUND:
    case ERROR_INVALID_DRIVE:
        return ErrorKind::DirectoryNotFound;
    case ERROR_ACCESS_DENIED:
    case ERROR_PRIVILEGE_NOT_HELD:
        return ErrorKind::UnauthorizedAccess;
    case ERROR_INVALID_HANDLE:
        return ErrorKind::ObjectDisposed;
    case ERROR_NOT_ENOUGH_MEMORY:
    case ERROR_OUTOFMEMORY:
        return ErrorKind::Platform;
    default:
        // Sharing violations, existing files and the rest surface as I/O failures
        return ErrorKind::IO;
    }
}

void SetLimits(const AclLimits& limits) noexcept {
    g_defaultBufferSize.store(limits.defaultBufferSize, std::memory_order_relaxed);
    g_maxDescriptorBytes.store(limits.maxSecurityDescriptorBytes, std::memory_order_relaxed);
}

AclLimits GetLimits() noexcept {
    AclLimits limits;
    limits.defaultBufferSize = g_defaultBufferSize.load(std::memory_order_relaxed);
    limits.maxSecurityDescriptorBytes = g_maxDescriptorBytes.load(std::memory_order_relaxed);
    return limits;
}

}  // namespace Security
}  // namespace AclKit
