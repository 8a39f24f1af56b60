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
 * AclKit Security - FILE SYSTEM SECURITY DESCRIPTORS
 * ============================================================================
 *
 * @file FileSystemSecurity.hpp
 * @brief In-memory security descriptor for files and directories.
 *
 * A descriptor holds an ordered list of access rules plus an optional owner
 * and group. It is detached from any filesystem object until the ACL facade
 * applies it, and it remembers which sections were modified so that only
 * those sections are persisted.
 *
 * CONVERSIONS:
 * ============
 * - ToNative / FromNative: self-relative SECURITY_DESCRIPTOR buffers
 * - ToSddl / FromSddl: SDDL strings (diagnostics and test expectations)
 *
 * @note Not thread-safe. Instances are plain values owned by the caller.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "SecurityTypes.hpp"
#include "SecurityIdentifier.hpp"
#include "AccessRule.hpp"

namespace AclKit {
namespace Security {

class FileSystemSecurity {
public:
    virtual ~FileSystemSecurity() = default;

    FileSystemSecurity(const FileSystemSecurity&) = default;
    FileSystemSecurity& operator=(const FileSystemSecurity&) = default;
    FileSystemSecurity(FileSystemSecurity&&) noexcept = default;
    FileSystemSecurity& operator=(FileSystemSecurity&&) noexcept = default;

    /// Always FileSystemRights for file and directory descriptors.
    [[nodiscard]] AccessRightType GetAccessRightType() const noexcept { return AccessRightType::FileSystemRights; }

    [[nodiscard]] bool IsContainer() const noexcept { return m_isContainer; }

    // ========================================================================
    // ACCESS RULES
    // ========================================================================

    /**
     * @brief Append an explicit rule.
     *
     * Fails with ErrorKind::Argument when the identity is invalid or the
     * inheritance/propagation flags do not fit the object kind (files take
     * no inheritance, propagation needs inheritance).
     */
    [[nodiscard]] bool AddAccessRule(const FileSystemAccessRule& rule, Error* err = nullptr) noexcept;

    /**
     * @brief Remove explicit rules that match `rule` exactly.
     * @return Number of rules removed
     */
    size_t RemoveAccessRule(const FileSystemAccessRule& rule) noexcept;

    /**
     * @brief Remove every explicit rule for an identity.
     * @return Number of rules removed
     */
    size_t RemoveAccessRuleAll(const SecurityIdentifier& identity) noexcept;

    /**
     * @brief Rules filtered by origin, in descriptor order.
     */
    [[nodiscard]] std::vector<FileSystemAccessRule> GetAccessRules(bool includeExplicit, bool includeInherited) const;

    [[nodiscard]] const std::vector<FileSystemAccessRule>& Rules() const noexcept { return m_rules; }

    /**
     * @brief Block (or restore) inheritance of parent rules.
     * @param preserveInheritance When protecting, keep the inherited rules as explicit copies
     */
    void SetAccessRuleProtection(bool isProtected, bool preserveInheritance);

    [[nodiscard]] bool AreAccessRulesProtected() const noexcept { return m_protected; }

    // ========================================================================
    // OWNER / GROUP
    // ========================================================================

    [[nodiscard]] bool SetOwner(const SecurityIdentifier& owner, Error* err = nullptr) noexcept;
    [[nodiscard]] bool SetGroup(const SecurityIdentifier& group, Error* err = nullptr) noexcept;

    [[nodiscard]] const std::optional<SecurityIdentifier>& Owner() const noexcept { return m_owner; }
    [[nodiscard]] const std::optional<SecurityIdentifier>& Group() const noexcept { return m_group; }

    // ========================================================================
    // MODIFICATION TRACKING
    // ========================================================================

    [[nodiscard]] AccessControlSections ModifiedSections() const noexcept { return m_modified; }

    [[nodiscard]] bool IsModified() const noexcept { return m_modified != AccessControlSections::None; }

    /**
     * @brief SECURITY_INFORMATION flags covering the modified sections.
     * @return 0 when nothing has to be persisted
     */
    [[nodiscard]] SECURITY_INFORMATION ModifiedSecurityInformation() const noexcept;

    // ========================================================================
    // CONVERSIONS
    // ========================================================================

    /**
     * @brief Build a self-relative native descriptor.
     *
     * Only the requested sections are emitted. The DACL lists explicit deny
     * rules, then explicit allow rules, then inherited rules.
     */
    [[nodiscard]] bool ToNative(AccessControlSections sections, std::vector<uint8_t>& sd, Error* err = nullptr) const noexcept;

    /**
     * @brief Replace the content with a native descriptor. Clears the modified sections.
     */
    [[nodiscard]] bool FromNative(PSECURITY_DESCRIPTOR sd, Error* err = nullptr) noexcept;

    [[nodiscard]] bool ToSddl(AccessControlSections sections, std::wstring& out, Error* err = nullptr) const noexcept;

    /**
     * @brief Replace the content with an SDDL string. Every section the string
     *        carries is marked modified.
     */
    [[nodiscard]] bool FromSddl(std::wstring_view sddl, Error* err = nullptr) noexcept;

protected:
    explicit FileSystemSecurity(bool isContainer) noexcept : m_isContainer(isContainer) {}

private:
    void MarkModified(AccessControlSections section) noexcept { m_modified = m_modified | section; }

    bool m_isContainer = false;
    bool m_protected = false;
    std::vector<FileSystemAccessRule> m_rules;
    std::optional<SecurityIdentifier> m_owner;
    std::optional<SecurityIdentifier> m_group;
    AccessControlSections m_modified = AccessControlSections::None;
};

/**
 * @brief Descriptor for a file. Rules carry no inheritance flags.
 */
class FileSecurity final : public FileSystemSecurity {
public:
    FileSecurity() noexcept : FileSystemSecurity(false) {}
};

/**
 * @brief Descriptor for a directory.
 */
class DirectorySecurity final : public FileSystemSecurity {
public:
    DirectorySecurity() noexcept : FileSystemSecurity(true) {}
};

}  // namespace Security
}  // namespace AclKit
