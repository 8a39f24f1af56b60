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
#include "RegistryUtils.hpp"

#ifdef _WIN32
#  pragma comment(lib, "Advapi32.lib")
#endif

namespace AclKit {
    namespace Utils {
        namespace RegistryUtils {

            namespace {
                /// Largest string value accepted by ReadString (1MB)
                constexpr DWORD kMaxRegistryStringBytes = 1024 * 1024;

                /// Largest security descriptor accepted by GetKeySecurity
                constexpr DWORD kMaxSecurityDescriptorSize = 64 * 1024;

                void SetError(Error* err, DWORD code, const wchar_t* msg,
                              std::wstring_view key = {}, std::wstring_view value = {}) noexcept {
                    if (!err) return;
                    err->win32 = code;
                    try {
                        err->message = msg;
                        err->keyPath = key;
                        err->valueName = value;
                    }
                    catch (const std::bad_alloc&) {
                        // Code is what callers branch on
                    }
                }
            }

            // ============================================================================
            // RegistryHandle
            // ============================================================================

            RegistryHandle::RegistryHandle(HKEY handle, bool ownsHandle) noexcept
                : m_key(handle), m_owns(ownsHandle) {
            }

            RegistryHandle::~RegistryHandle() noexcept {
                const ReleaseResult result = Release();
                if (!result.succeeded()) {
                    AK_LOG_WARN(L"RegistryUtils", L"RegCloseKey failed during cleanup (status=%ld)", result.status);
                }
            }

            RegistryHandle::RegistryHandle(RegistryHandle&& other) noexcept
                : m_key(other.m_key), m_owns(other.m_owns), m_closed(other.m_closed) {
                other.m_key = nullptr;
                other.m_owns = true;
                other.m_closed = false;
            }

            RegistryHandle& RegistryHandle::operator=(RegistryHandle&& other) noexcept {
                if (this != &other) {
                    const ReleaseResult result = Release();
                    if (!result.succeeded()) {
                        AK_LOG_WARN(L"RegistryUtils", L"RegCloseKey failed on reassignment (status=%ld)", result.status);
                    }
                    m_key = other.m_key;
                    m_owns = other.m_owns;
                    m_closed = other.m_closed;
                    other.m_key = nullptr;
                    other.m_owns = true;
                    other.m_closed = false;
                }
                return *this;
            }

            ReleaseResult RegistryHandle::Release() noexcept {
                ReleaseResult result;
                if (IsInvalid()) {
                    m_key = nullptr;
                    return result;
                }

                if (m_owns) {
                    result.status = ::RegCloseKey(m_key);
                    result.closed = true;
                }

                // Never retried, even on failure
                m_key = nullptr;
                m_closed = true;
                return result;
            }

            HKEY RegistryHandle::Detach() noexcept {
                HKEY detached = m_key;
                m_key = nullptr;
                if (detached != nullptr) {
                    m_closed = true;
                }
                return detached;
            }

            HKEY* RegistryHandle::Put() noexcept {
                const ReleaseResult result = Release();
                if (!result.succeeded()) {
                    AK_LOG_WARN(L"RegistryUtils", L"RegCloseKey failed before reuse (status=%ld)", result.status);
                }
                m_owns = true;
                m_closed = false;
                return &m_key;
            }

            bool RegistryHandle::IsInvalid() const noexcept {
                return m_key == nullptr || m_key == reinterpret_cast<HKEY>(INVALID_HANDLE_VALUE);
            }

            // ============================================================================
            // RegistryKey - lifetime
            // ============================================================================

            bool RegistryKey::Open(HKEY hKeyParent, std::wstring_view subKey, REGSAM access, Error* err) noexcept {
                (void)Close();

                if (!hKeyParent) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid parent key handle");
                    return false;
                }

                try {
                    m_path = subKey;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed for subkey path");
                    return false;
                }

                const LSTATUS st = ::RegOpenKeyExW(hKeyParent, m_path.c_str(), 0, access, m_handle.Put());
                if (st != ERROR_SUCCESS) {
                    SetError(err, static_cast<DWORD>(st), L"RegOpenKeyExW failed", m_path);
                    if (st != ERROR_FILE_NOT_FOUND) {
                        AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegOpenKeyExW failed: %ls", m_path.c_str());
                    }
                    (void)m_handle.Detach();
                    return false;
                }
                return true;
            }

            bool RegistryKey::Create(HKEY hKeyParent, std::wstring_view subKey, REGSAM access, DWORD* disposition, Error* err) noexcept {
                (void)Close();

                if (!hKeyParent) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid parent key handle");
                    return false;
                }

                try {
                    m_path = subKey;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed for subkey path");
                    return false;
                }

                DWORD disp = 0;
                const LSTATUS st = ::RegCreateKeyExW(
                    hKeyParent,
                    m_path.c_str(),
                    0,                          // Reserved
                    nullptr,                    // Class
                    REG_OPTION_NON_VOLATILE,
                    access,
                    nullptr,                    // Security attributes
                    m_handle.Put(),
                    &disp
                );

                if (st != ERROR_SUCCESS) {
                    SetError(err, static_cast<DWORD>(st), L"RegCreateKeyExW failed", m_path);
                    AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegCreateKeyExW failed: %ls", m_path.c_str());
                    (void)m_handle.Detach();
                    return false;
                }

                if (disposition) {
                    *disposition = disp;
                }
                return true;
            }

            ReleaseResult RegistryKey::Close() noexcept {
                const ReleaseResult result = m_handle.Release();
                if (!result.succeeded()) {
                    AK_LOG_WIN_ERROR(L"RegistryUtils", result.status, L"RegCloseKey failed: %ls", m_path.c_str());
                }
                return result;
            }

            // ============================================================================
            // RegistryKey - values
            // ============================================================================

            bool RegistryKey::ReadString(std::wstring_view valueName, std::wstring& out, Error* err) const noexcept {
                out.clear();
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }

                try {
                    const std::wstring name(valueName);

                    DWORD type = 0;
                    DWORD bytes = 0;
                    LSTATUS st = ::RegQueryValueExW(m_handle.Get(), name.c_str(), nullptr, &type, nullptr, &bytes);
                    if (st != ERROR_SUCCESS) {
                        SetError(err, static_cast<DWORD>(st), L"RegQueryValueExW size query failed", m_path, name);
                        return false;
                    }
                    if (type != REG_SZ && type != REG_EXPAND_SZ) {
                        SetError(err, ERROR_DATATYPE_MISMATCH, L"Value is not a string", m_path, name);
                        return false;
                    }
                    if (bytes > kMaxRegistryStringBytes) {
                        SetError(err, ERROR_INVALID_DATA, L"String value too large", m_path, name);
                        return false;
                    }

                    // Stored strings are not guaranteed to be null-terminated
                    std::wstring buffer(bytes / sizeof(wchar_t) + 1, L'\0');
                    DWORD actual = static_cast<DWORD>(buffer.size() * sizeof(wchar_t));
                    st = ::RegQueryValueExW(m_handle.Get(), name.c_str(), nullptr, &type,
                                            reinterpret_cast<LPBYTE>(buffer.data()), &actual);
                    if (st != ERROR_SUCCESS) {
                        SetError(err, static_cast<DWORD>(st), L"RegQueryValueExW failed", m_path, name);
                        return false;
                    }

                    buffer.resize(actual / sizeof(wchar_t));
                    while (!buffer.empty() && buffer.back() == L'\0') {
                        buffer.pop_back();
                    }
                    out = std::move(buffer);
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }
            }

            bool RegistryKey::ReadDWord(std::wstring_view valueName, DWORD& out, Error* err) const noexcept {
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }

                try {
                    const std::wstring name(valueName);
                    DWORD type = 0;
                    DWORD value = 0;
                    DWORD bytes = sizeof(value);
                    const LSTATUS st = ::RegQueryValueExW(m_handle.Get(), name.c_str(), nullptr, &type,
                                                          reinterpret_cast<LPBYTE>(&value), &bytes);
                    if (st != ERROR_SUCCESS) {
                        SetError(err, static_cast<DWORD>(st), L"RegQueryValueExW failed", m_path, name);
                        return false;
                    }
                    if (type != REG_DWORD || bytes != sizeof(DWORD)) {
                        SetError(err, ERROR_DATATYPE_MISMATCH, L"Value is not a DWORD", m_path, name);
                        return false;
                    }
                    out = value;
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }
            }

            bool RegistryKey::WriteString(std::wstring_view valueName, std::wstring_view value, Error* err) noexcept {
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }

                try {
                    const std::wstring name(valueName);
                    const std::wstring data(value);
                    const size_t bytes = (data.size() + 1) * sizeof(wchar_t);
                    if (bytes > kMaxRegistryStringBytes) {
                        SetError(err, ERROR_INVALID_DATA, L"String value too large", m_path, name);
                        return false;
                    }

                    const LSTATUS st = ::RegSetValueExW(m_handle.Get(), name.c_str(), 0, REG_SZ,
                                                        reinterpret_cast<const BYTE*>(data.c_str()), static_cast<DWORD>(bytes));
                    if (st != ERROR_SUCCESS) {
                        SetError(err, static_cast<DWORD>(st), L"RegSetValueExW failed", m_path, name);
                        AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegSetValueExW failed: %ls\\%ls", m_path.c_str(), name.c_str());
                        return false;
                    }
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }
            }

            bool RegistryKey::WriteDWord(std::wstring_view valueName, DWORD value, Error* err) noexcept {
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }

                try {
                    const std::wstring name(valueName);
                    const LSTATUS st = ::RegSetValueExW(m_handle.Get(), name.c_str(), 0, REG_DWORD,
                                                        reinterpret_cast<const BYTE*>(&value), sizeof(value));
                    if (st != ERROR_SUCCESS) {
                        SetError(err, static_cast<DWORD>(st), L"RegSetValueExW failed", m_path, name);
                        AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegSetValueExW failed: %ls\\%ls", m_path.c_str(), name.c_str());
                        return false;
                    }
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }
            }

            bool RegistryKey::DeleteSubKeyTree(std::wstring_view subKey, Error* err) noexcept {
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }
                if (subKey.empty()) {
                    // RegDeleteTreeW with an empty name would wipe this key's children
                    SetError(err, ERROR_INVALID_PARAMETER, L"Empty subkey name");
                    return false;
                }

                try {
                    const std::wstring sk(subKey);
                    const LSTATUS st = ::RegDeleteTreeW(m_handle.Get(), sk.c_str());
                    if (st != ERROR_SUCCESS && st != ERROR_FILE_NOT_FOUND) {
                        SetError(err, static_cast<DWORD>(st), L"RegDeleteTreeW failed", sk);
                        AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegDeleteTreeW failed: %ls", sk.c_str());
                        return false;
                    }
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }
            }

            // ============================================================================
            // RegistryKey - security
            // ============================================================================

            bool RegistryKey::GetKeySecurity(SECURITY_INFORMATION secInfo, std::vector<uint8_t>& sd, Error* err) const noexcept {
                sd.clear();
                if (!IsValid()) {
                    SetError(err, ERROR_INVALID_HANDLE, L"Invalid key handle");
                    return false;
                }

                DWORD size = 0;
                LSTATUS st = ::RegGetKeySecurity(m_handle.Get(), secInfo, nullptr, &size);
                if (st != ERROR_INSUFFICIENT_BUFFER) {
                    SetError(err, static_cast<DWORD>(st == ERROR_SUCCESS ? ERROR_INVALID_DATA : st),
                             L"RegGetKeySecurity size query failed", m_path);
                    return false;
                }
                if (size == 0 || size > kMaxSecurityDescriptorSize) {
                    SetError(err, ERROR_INVALID_DATA, L"Unexpected security descriptor size", m_path);
                    AK_LOG_ERROR(L"RegistryUtils", L"GetKeySecurity: size %lu outside (0, %lu]", size, kMaxSecurityDescriptorSize);
                    return false;
                }

                try {
                    sd.resize(size);
                }
                catch (const std::bad_alloc&) {
                    SetError(err, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
                    return false;
                }

                DWORD actualSize = size;
                st = ::RegGetKeySecurity(m_handle.Get(), secInfo, reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data()), &actualSize);
                if (st != ERROR_SUCCESS) {
                    SetError(err, static_cast<DWORD>(st), L"RegGetKeySecurity failed", m_path);
                    AK_LOG_WIN_ERROR(L"RegistryUtils", st, L"RegGetKeySecurity failed: %ls", m_path.c_str());
                    sd.clear();
                    return false;
                }
                if (actualSize > 0 && actualSize < size) {
                    sd.resize(actualSize);
                }
                return true;
            }

        }// namespace RegistryUtils
    }// namespace Utils
}// namespace AclKit
