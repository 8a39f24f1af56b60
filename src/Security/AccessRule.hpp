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
 * @file AccessRule.hpp
 * @brief One access-control entry of a file or directory DACL.
 */

#pragma once

#include <cstdint>

#include "SecurityTypes.hpp"
#include "SecurityIdentifier.hpp"

namespace AclKit {
namespace Security {

/**
 * @brief Access rule for files and directories.
 *
 * Rights are normalised on construction the way the platform stores file
 * rules: an Allow rule always carries Synchronize, a Deny rule loses it
 * unless it denies full control.
 */
class FileSystemAccessRule {
public:
    FileSystemAccessRule(SecurityIdentifier identity,
                         FileSystemRights rights,
                         AccessControlType type);

    FileSystemAccessRule(SecurityIdentifier identity,
                         FileSystemRights rights,
                         InheritanceFlags inheritance,
                         PropagationFlags propagation,
                         AccessControlType type);

    /**
     * @brief Rule read back from a native ACE; the mask is kept verbatim.
     */
    [[nodiscard]] static FileSystemAccessRule FromNativeAce(SecurityIdentifier identity,
                                                            ACCESS_MASK mask,
                                                            BYTE aceFlags,
                                                            AccessControlType type);

    [[nodiscard]] const SecurityIdentifier& IdentityReference() const noexcept { return m_identity; }
    [[nodiscard]] FileSystemRights Rights() const noexcept { return static_cast<FileSystemRights>(m_mask); }
    [[nodiscard]] ACCESS_MASK AccessMask() const noexcept { return m_mask; }
    [[nodiscard]] AccessControlType Type() const noexcept { return m_type; }
    [[nodiscard]] InheritanceFlags Inheritance() const noexcept { return m_inheritance; }
    [[nodiscard]] PropagationFlags Propagation() const noexcept { return m_propagation; }
    [[nodiscard]] bool IsInherited() const noexcept { return m_inherited; }

    /// ACE header flags (OBJECT_INHERIT_ACE and friends) for this rule
    [[nodiscard]] BYTE NativeAceFlags() const noexcept;

    /**
     * @brief Same identity, rights, type, inheritance and propagation.
     * The inherited marker is not compared.
     */
    [[nodiscard]] bool Matches(const FileSystemAccessRule& other) const noexcept;

    /**
     * @brief Access mask stored for the given requested rights and rule type.
     */
    [[nodiscard]] static ACCESS_MASK NormalizeRights(FileSystemRights rights, AccessControlType type) noexcept;

private:
    FileSystemAccessRule() = default;

    SecurityIdentifier m_identity;
    ACCESS_MASK m_mask = 0;
    AccessControlType m_type = AccessControlType::Allow;
    InheritanceFlags m_inheritance = InheritanceFlags::None;
    PropagationFlags m_propagation = PropagationFlags::None;
    bool m_inherited = false;
};

}  // namespace Security
}  // namespace AclKit
