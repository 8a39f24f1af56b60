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
#include "FileSystemSecurity.hpp"
#include "../Utils/Logger.hpp"

#include <sddl.h>

namespace AclKit {
namespace Security {

namespace {

    /// ACCESS_ALLOWED_ACE and ACCESS_DENIED_ACE share this layout
    constexpr DWORD kAceBaseSize = sizeof(ACCESS_ALLOWED_ACE) - sizeof(DWORD);

    [[nodiscard]] SECURITY_INFORMATION ToSecurityInformation(AccessControlSections sections) noexcept {
        SECURITY_INFORMATION info = 0;
        if (HasSection(sections, AccessControlSections::Owner))  info |= OWNER_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Group))  info |= GROUP_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Access)) info |= DACL_SECURITY_INFORMATION;
        if (HasSection(sections, AccessControlSections::Audit))  info |= SACL_SECURITY_INFORMATION;
        return info;
    }

    bool AddNativeAce(PACL acl, const FileSystemAccessRule& rule, Error* err) noexcept {
        const BOOL ok = (rule.Type() == AccessControlType::Allow)
            ? ::AddAccessAllowedAceEx(acl, ACL_REVISION, rule.NativeAceFlags(), rule.AccessMask(), rule.IdentityReference().Native())
            : ::AddAccessDeniedAceEx(acl, ACL_REVISION, rule.NativeAceFlags(), rule.AccessMask(), rule.IdentityReference().Native());
        if (!ok) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"AddAccess*AceEx failed");
            AK_LOG_WIN_ERROR(L"Security", le, L"cannot add ACE for %ls", rule.IdentityReference().ToString().c_str());
            return false;
        }
        return true;
    }

}  // namespace

// ============================================================================
// ACCESS RULES
// ============================================================================

bool FileSystemSecurity::AddAccessRule(const FileSystemAccessRule& rule, Error* err) noexcept {
    if (!rule.IdentityReference().IsValid()) {
        SetError(err, ErrorKind::Argument, 0, L"Rule identity is not a valid SID", L"rule");
        return false;
    }

    const bool hasInheritance = rule.Inheritance() != InheritanceFlags::None;
    const bool hasPropagation = rule.Propagation() != PropagationFlags::None;
    if (m_isContainer) {
        if (!hasInheritance && hasPropagation) {
            SetError(err, ErrorKind::Argument, 0, L"Propagation flags require inheritance flags", L"propagationFlags");
            return false;
        }
    }
    else if (hasInheritance) {
        SetError(err, ErrorKind::Argument, 0, L"Inheritance flags are not valid on a file", L"inheritanceFlags");
        return false;
    }
    else if (hasPropagation) {
        SetError(err, ErrorKind::Argument, 0, L"Propagation flags are not valid on a file", L"propagationFlags");
        return false;
    }

    try {
        m_rules.push_back(rule);
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
    MarkModified(AccessControlSections::Access);
    return true;
}

size_t FileSystemSecurity::RemoveAccessRule(const FileSystemAccessRule& rule) noexcept {
    const auto first = std::remove_if(m_rules.begin(), m_rules.end(), [&rule](const FileSystemAccessRule& r) {
        return !r.IsInherited() && r.Matches(rule);
    });
    const size_t removed = static_cast<size_t>(std::distance(first, m_rules.end()));
    m_rules.erase(first, m_rules.end());
    if (removed > 0) {
        MarkModified(AccessControlSections::Access);
    }
    return removed;
}

size_t FileSystemSecurity::RemoveAccessRuleAll(const SecurityIdentifier& identity) noexcept {
    const auto first = std::remove_if(m_rules.begin(), m_rules.end(), [&identity](const FileSystemAccessRule& r) {
        return !r.IsInherited() && r.IdentityReference() == identity;
    });
    const size_t removed = static_cast<size_t>(std::distance(first, m_rules.end()));
    m_rules.erase(first, m_rules.end());
    MarkModified(AccessControlSections::Access);
    return removed;
}

std::vector<FileSystemAccessRule> FileSystemSecurity::GetAccessRules(bool includeExplicit, bool includeInherited) const {
    std::vector<FileSystemAccessRule> result;
    for (const auto& rule : m_rules) {
        if (rule.IsInherited() ? includeInherited : includeExplicit) {
            result.push_back(rule);
        }
    }
    return result;
}

void FileSystemSecurity::SetAccessRuleProtection(bool isProtected, bool preserveInheritance) {
    if (isProtected && !preserveInheritance) {
        m_rules.erase(std::remove_if(m_rules.begin(), m_rules.end(),
                                     [](const FileSystemAccessRule& r) { return r.IsInherited(); }),
                      m_rules.end());
    }
    else if (isProtected) {
        for (auto& rule : m_rules) {
            if (rule.IsInherited()) {
                rule = FileSystemAccessRule::FromNativeAce(rule.IdentityReference(), rule.AccessMask(),
                                                           static_cast<BYTE>(rule.NativeAceFlags() & ~INHERITED_ACE),
                                                           rule.Type());
            }
        }
    }
    m_protected = isProtected;
    MarkModified(AccessControlSections::Access);
}

// ============================================================================
// OWNER / GROUP
// ============================================================================

bool FileSystemSecurity::SetOwner(const SecurityIdentifier& owner, Error* err) noexcept {
    if (!owner.IsValid()) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_SID, L"Owner is not a valid SID", L"owner");
        return false;
    }
    try {
        m_owner = owner;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
    MarkModified(AccessControlSections::Owner);
    return true;
}

bool FileSystemSecurity::SetGroup(const SecurityIdentifier& group, Error* err) noexcept {
    if (!group.IsValid()) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_SID, L"Group is not a valid SID", L"group");
        return false;
    }
    try {
        m_group = group;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
    MarkModified(AccessControlSections::Group);
    return true;
}

SECURITY_INFORMATION FileSystemSecurity::ModifiedSecurityInformation() const noexcept {
    SECURITY_INFORMATION info = ToSecurityInformation(m_modified & (AccessControlSections::Access |
                                                                    AccessControlSections::Owner |
                                                                    AccessControlSections::Group));
    if (info & DACL_SECURITY_INFORMATION) {
        info |= m_protected ? PROTECTED_DACL_SECURITY_INFORMATION : UNPROTECTED_DACL_SECURITY_INFORMATION;
    }
    return info;
}

// ============================================================================
// NATIVE CONVERSION
// ============================================================================

bool FileSystemSecurity::ToNative(AccessControlSections sections, std::vector<uint8_t>& sd, Error* err) const noexcept {
    sd.clear();

    SECURITY_DESCRIPTOR absolute{};
    if (!::InitializeSecurityDescriptor(&absolute, SECURITY_DESCRIPTOR_REVISION)) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::Platform, le, L"InitializeSecurityDescriptor failed");
        return false;
    }

    if (HasSection(sections, AccessControlSections::Owner) && m_owner) {
        if (!::SetSecurityDescriptorOwner(&absolute, m_owner->Native(), FALSE)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"SetSecurityDescriptorOwner failed");
            return false;
        }
    }

    if (HasSection(sections, AccessControlSections::Group) && m_group) {
        if (!::SetSecurityDescriptorGroup(&absolute, m_group->Native(), FALSE)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"SetSecurityDescriptorGroup failed");
            return false;
        }
    }

    try {
        // Must outlive MakeSelfRelativeSD; the absolute descriptor points into it
        std::vector<uint8_t> aclBuffer;

        if (HasSection(sections, AccessControlSections::Access)) {
            DWORD aclSize = sizeof(ACL);
            for (const auto& rule : m_rules) {
                aclSize += kAceBaseSize + rule.IdentityReference().Length();
            }
            aclSize = (aclSize + sizeof(DWORD) - 1) & ~static_cast<DWORD>(sizeof(DWORD) - 1);
            if (aclSize > SecurityConstants::MAX_ACL_BYTES) {
                SetError(err, ErrorKind::Argument, ERROR_INVALID_ACL, L"Too many access rules for one ACL");
                return false;
            }

            aclBuffer.resize(aclSize);
            PACL acl = reinterpret_cast<PACL>(aclBuffer.data());
            if (!::InitializeAcl(acl, aclSize, ACL_REVISION)) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKind::Platform, le, L"InitializeAcl failed");
                return false;
            }

            // Canonical order: explicit deny, explicit allow, inherited
            for (const auto& rule : m_rules) {
                if (!rule.IsInherited() && rule.Type() == AccessControlType::Deny && !AddNativeAce(acl, rule, err)) {
                    return false;
                }
            }
            for (const auto& rule : m_rules) {
                if (!rule.IsInherited() && rule.Type() == AccessControlType::Allow && !AddNativeAce(acl, rule, err)) {
                    return false;
                }
            }
            for (const auto& rule : m_rules) {
                if (rule.IsInherited() && !AddNativeAce(acl, rule, err)) {
                    return false;
                }
            }

            if (!::SetSecurityDescriptorDacl(&absolute, TRUE, acl, FALSE)) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKind::Platform, le, L"SetSecurityDescriptorDacl failed");
                return false;
            }
            if (m_protected &&
                !::SetSecurityDescriptorControl(&absolute, SE_DACL_PROTECTED, SE_DACL_PROTECTED)) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKind::Platform, le, L"SetSecurityDescriptorControl failed");
                return false;
            }
        }

        DWORD length = 0;
        if (::MakeSelfRelativeSD(&absolute, nullptr, &length) || ::GetLastError() != ERROR_INSUFFICIENT_BUFFER) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le == ERROR_SUCCESS ? ERROR_INVALID_SECURITY_DESCR : le,
                     L"MakeSelfRelativeSD size query failed");
            return false;
        }

        sd.resize(length);
        if (!::MakeSelfRelativeSD(&absolute, reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data()), &length)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"MakeSelfRelativeSD failed");
            AK_LOG_WIN_ERROR(L"Security", le, L"MakeSelfRelativeSD failed");
            sd.clear();
            return false;
        }
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        sd.clear();
        return false;
    }
}

bool FileSystemSecurity::FromNative(PSECURITY_DESCRIPTOR sd, Error* err) noexcept {
    if (!sd || !::IsValidSecurityDescriptor(sd)) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_SECURITY_DESCR, L"Invalid security descriptor", L"securityDescriptor");
        return false;
    }

    try {
        std::optional<SecurityIdentifier> owner;
        std::optional<SecurityIdentifier> group;
        std::vector<FileSystemAccessRule> rules;

        PSID sid = nullptr;
        BOOL defaulted = FALSE;
        if (::GetSecurityDescriptorOwner(sd, &sid, &defaulted) && sid) {
            SecurityIdentifier id;
            if (!SecurityIdentifier::FromNative(sid, id, err)) return false;
            owner = std::move(id);
        }

        sid = nullptr;
        if (::GetSecurityDescriptorGroup(sd, &sid, &defaulted) && sid) {
            SecurityIdentifier id;
            if (!SecurityIdentifier::FromNative(sid, id, err)) return false;
            group = std::move(id);
        }

        SECURITY_DESCRIPTOR_CONTROL control = 0;
        DWORD revision = 0;
        if (!::GetSecurityDescriptorControl(sd, &control, &revision)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"GetSecurityDescriptorControl failed");
            return false;
        }

        BOOL daclPresent = FALSE;
        PACL dacl = nullptr;
        if (!::GetSecurityDescriptorDacl(sd, &daclPresent, &dacl, &defaulted)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Platform, le, L"GetSecurityDescriptorDacl failed");
            return false;
        }

        if (daclPresent && dacl == nullptr) {
            // A NULL DACL grants everyone full access
            SecurityIdentifier world;
            if (!SecurityIdentifier::FromWellKnown(WellKnownSid::World, world, err)) return false;
            const InheritanceFlags inheritance = m_isContainer
                ? (InheritanceFlags::ContainerInherit | InheritanceFlags::ObjectInherit)
                : InheritanceFlags::None;
            rules.emplace_back(std::move(world), FileSystemRights::FullControl, inheritance,
                               PropagationFlags::None, AccessControlType::Allow);
        }
        else if (daclPresent) {
            ACL_SIZE_INFORMATION info{};
            if (!::GetAclInformation(dacl, &info, sizeof(info), AclSizeInformation)) {
                const DWORD le = ::GetLastError();
                SetError(err, ErrorKind::Platform, le, L"GetAclInformation failed");
                return false;
            }

            rules.reserve(info.AceCount);
            for (DWORD i = 0; i < info.AceCount; ++i) {
                LPVOID ace = nullptr;
                if (!::GetAce(dacl, i, &ace)) {
                    const DWORD le = ::GetLastError();
                    SetError(err, ErrorKind::Platform, le, L"GetAce failed");
                    return false;
                }

                const auto* header = static_cast<const ACE_HEADER*>(ace);
                AccessControlType type;
                if (header->AceType == ACCESS_ALLOWED_ACE_TYPE) {
                    type = AccessControlType::Allow;
                }
                else if (header->AceType == ACCESS_DENIED_ACE_TYPE) {
                    type = AccessControlType::Deny;
                }
                else {
                    AK_LOG_DEBUG(L"Security", L"skipping ACE %lu of unsupported type %u", i, static_cast<unsigned>(header->AceType));
                    continue;
                }

                // Allowed and denied ACEs share the same layout
                auto* basic = static_cast<ACCESS_ALLOWED_ACE*>(ace);
                SecurityIdentifier identity;
                if (!SecurityIdentifier::FromNative(reinterpret_cast<PSID>(&basic->SidStart), identity, err)) {
                    return false;
                }
                rules.push_back(FileSystemAccessRule::FromNativeAce(std::move(identity), basic->Mask, header->AceFlags, type));
            }
        }

        m_owner = std::move(owner);
        m_group = std::move(group);
        m_rules = std::move(rules);
        m_protected = (control & SE_DACL_PROTECTED) != 0;
        m_modified = AccessControlSections::None;
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

// ============================================================================
// SDDL
// ============================================================================

bool FileSystemSecurity::ToSddl(AccessControlSections sections, std::wstring& out, Error* err) const noexcept {
    out.clear();

    std::vector<uint8_t> sd;
    if (!ToNative(sections, sd, err)) {
        return false;
    }

    LocalMemory<LPWSTR> text;
    if (!::ConvertSecurityDescriptorToStringSecurityDescriptorW(
            reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data()),
            SDDL_REVISION_1,
            ToSecurityInformation(sections),
            text.Put(),
            nullptr)) {
        const DWORD le = ::GetLastError();
        SetError(err, ErrorKind::Platform, le, L"ConvertSecurityDescriptorToStringSecurityDescriptorW failed");
        AK_LOG_WIN_ERROR(L"Security", le, L"cannot convert descriptor to SDDL");
        return false;
    }

    try {
        out = text.Get();
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

bool FileSystemSecurity::FromSddl(std::wstring_view sddl, Error* err) noexcept {
    if (sddl.empty()) {
        SetError(err, ErrorKind::Argument, ERROR_INVALID_PARAMETER, L"Empty SDDL string", L"sddl");
        return false;
    }

    try {
        const std::wstring text(sddl);
        LocalMemory<PSECURITY_DESCRIPTOR> sd;
        if (!::ConvertStringSecurityDescriptorToSecurityDescriptorW(text.c_str(), SDDL_REVISION_1, sd.Put(), nullptr)) {
            const DWORD le = ::GetLastError();
            SetError(err, ErrorKind::Argument, le, L"ConvertStringSecurityDescriptorToSecurityDescriptorW failed", L"sddl");
            return false;
        }

        if (!FromNative(sd.Get(), err)) {
            return false;
        }

        BOOL present = FALSE;
        PACL dacl = nullptr;
        BOOL defaulted = FALSE;
        if (m_owner) MarkModified(AccessControlSections::Owner);
        if (m_group) MarkModified(AccessControlSections::Group);
        if (::GetSecurityDescriptorDacl(sd.Get(), &present, &dacl, &defaulted) && present) {
            MarkModified(AccessControlSections::Access);
        }
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, ErrorKind::Platform, ERROR_NOT_ENOUGH_MEMORY, L"Memory allocation failed");
        return false;
    }
}

}  // namespace Security
}  // namespace AclKit
