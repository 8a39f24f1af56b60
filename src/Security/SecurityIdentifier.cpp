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
#include "SecurityIdentifier.hpp"
#include "../Utils/Logger.hpp"

#include <sddl.h>

namespace AclKit {
namespace Security {

namespace {

    [[nodiscard]] WELL_KNOWN_SID_TYPE ToNativeType(WellKnownSid kind) noexcept {
        switch (kind) {
        case WellKnownSid::BuiltinUsers:          return WinBuiltinUsersSid;
        case WellKnownSid::BuiltinAdministrators: return WinBuiltinAdministratorsSid;
        case WellKnownSid::LocalSystem:           return WinLocalSystemSid;
        case WellKnownSid::World:                 return WinWorldSid;
        case WellKnownSid::AuthenticatedUsers:    return WinAuthenticatedUserSid;
        case WellKnownSid::CreatorOwner:          return WinCreatorOwnerSid;
        }
        return WinNullSid;
    }

}  // namespace

bool SecurityIdentifier::FromWellKnown(WellKnownSid kind, SecurityIdentifier& out, Error* err) noexcept {
    out.m_sid.clear();

    BYTE buffer[SECURITY_MAX_SID_SIZE]{};
    DWORD size = sizeof(buffer);
    if (!::CreateWellKnownSid(ToNativeType(kind), nullptr, buffer, &size)) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::Platform, le, L"CreateWellKnownSid failed");
        AK_LOG_WIN_ERROR(L"Security", le, L"CreateWellKnownSid failed (kind=%u)", static_cast<unsigned>(kind));
        return false;
    }
    return FromNative(reinterpret_cast<PSID>(buffer), out, err);
}

bool SecurityIdentifier::FromString(std::wstring_view text, SecurityIdentifier& out, Error* err) noexcept {
    out.m_sid.clear();
    if (text.empty()) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_SID, L"Empty SID string", L"text");
        return false;
    }

    try {
        const std::wstring str(text);
        LocalMemory<PSID> sid;
        if (!::ConvertStringSidToSidW(str.c_str(), sid.Put())) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Argument, le, L"ConvertStringSidToSidW failed", L"text");
            return false;
        }
        return FromNative(sid.Get(), out, err);
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

bool SecurityIdentifier::FromNative(PSID sid, SecurityIdentifier& out, Error* err) noexcept {
    out.m_sid.clear();
    if (!sid || !::IsValidSid(sid)) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_SID, L"Invalid SID", L"sid");
        return false;
    }

    const DWORD length = ::GetLengthSid(sid);
    try {
        const auto* bytes = static_cast<const uint8_t*>(sid);
        out.m_sid.assign(bytes, bytes + length);
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

SecurityIdentifier SecurityIdentifier::WellKnown(WellKnownSid kind) noexcept {
    SecurityIdentifier sid;
    (void)FromWellKnown(kind, sid);
    return sid;
}

std::wstring SecurityIdentifier::ToString() const {
    if (!IsValid()) {
        return {};
    }

    LocalMemory<LPWSTR> text;
    if (!::ConvertSidToStringSidW(Native(), text.Put())) {
        AK_LOG_LAST_ERROR(L"Security", L"ConvertSidToStringSidW failed");
        return {};
    }
    return std::wstring(text.Get());
}

bool SecurityIdentifier::IsValid() const noexcept {
    return !m_sid.empty() && ::IsValidSid(Native());
}

PSID SecurityIdentifier::Native() const noexcept {
    if (m_sid.empty()) {
        return nullptr;
    }
    // The platform takes PSID by non-const pointer but does not write through it
    return const_cast<uint8_t*>(m_sid.data());
}

}  // namespace Security
}  // namespace AclKit
