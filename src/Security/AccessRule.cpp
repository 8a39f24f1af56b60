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
#include "AccessRule.hpp"

namespace AclKit {
namespace Security {

namespace {

    constexpr ACCESS_MASK kSynchronize = static_cast<ACCESS_MASK>(FileSystemRights::Synchronize);
    constexpr ACCESS_MASK kFullControl = static_cast<ACCESS_MASK>(FileSystemRights::FullControl);

    // Full control without DeleteSubdirectoriesAndFiles also keeps Synchronize on deny
    constexpr ACCESS_MASK kFullControlNoDeleteChild =
        kFullControl & ~static_cast<ACCESS_MASK>(FileSystemRights::DeleteSubdirectoriesAndFiles);

}  // namespace

FileSystemAccessRule::FileSystemAccessRule(SecurityIdentifier identity,
                                           FileSystemRights rights,
                                           AccessControlType type)
    : FileSystemAccessRule(std::move(identity), rights, InheritanceFlags::None, PropagationFlags::None, type) {
}

FileSystemAccessRule::FileSystemAccessRule(SecurityIdentifier identity,
                                           FileSystemRights rights,
                                           InheritanceFlags inheritance,
                                           PropagationFlags propagation,
                                           AccessControlType type)
    : m_identity(std::move(identity)),
      m_mask(NormalizeRights(rights, type)),
      m_type(type),
      m_inheritance(inheritance),
      m_propagation(propagation) {
}

FileSystemAccessRule FileSystemAccessRule::FromNativeAce(SecurityIdentifier identity,
                                                         ACCESS_MASK mask,
                                                         BYTE aceFlags,
                                                         AccessControlType type) {
    FileSystemAccessRule rule;
    rule.m_identity = std::move(identity);
    rule.m_mask = mask;
    rule.m_type = type;

    uint8_t inheritance = 0;
    if (aceFlags & CONTAINER_INHERIT_ACE) inheritance |= static_cast<uint8_t>(InheritanceFlags::ContainerInherit);
    if (aceFlags & OBJECT_INHERIT_ACE)    inheritance |= static_cast<uint8_t>(InheritanceFlags::ObjectInherit);
    rule.m_inheritance = static_cast<InheritanceFlags>(inheritance);

    uint8_t propagation = 0;
    if (aceFlags & NO_PROPAGATE_INHERIT_ACE) propagation |= static_cast<uint8_t>(PropagationFlags::NoPropagateInherit);
    if (aceFlags & INHERIT_ONLY_ACE)         propagation |= static_cast<uint8_t>(PropagationFlags::InheritOnly);
    rule.m_propagation = static_cast<PropagationFlags>(propagation);

    rule.m_inherited = (aceFlags & INHERITED_ACE) != 0;
    return rule;
}

BYTE FileSystemAccessRule::NativeAceFlags() const noexcept {
    BYTE flags = 0;
    if ((m_inheritance & InheritanceFlags::ContainerInherit) != InheritanceFlags::None) flags |= CONTAINER_INHERIT_ACE;
    if ((m_inheritance & InheritanceFlags::ObjectInherit) != InheritanceFlags::None)    flags |= OBJECT_INHERIT_ACE;
    if ((m_propagation & PropagationFlags::NoPropagateInherit) != PropagationFlags::None) flags |= NO_PROPAGATE_INHERIT_ACE;
    if ((m_propagation & PropagationFlags::InheritOnly) != PropagationFlags::None)      flags |= INHERIT_ONLY_ACE;
    if (m_inherited) flags |= INHERITED_ACE;
    return flags;
}

bool FileSystemAccessRule::Matches(const FileSystemAccessRule& other) const noexcept {
    return m_type == other.m_type &&
           m_mask == other.m_mask &&
           m_inheritance == other.m_inheritance &&
           m_propagation == other.m_propagation &&
           m_identity == other.m_identity;
}

ACCESS_MASK FileSystemAccessRule::NormalizeRights(FileSystemRights rights, AccessControlType type) noexcept {
    ACCESS_MASK mask = static_cast<ACCESS_MASK>(rights);
    if (type == AccessControlType::Allow) {
        mask |= kSynchronize;
    }
    else if (mask != kFullControl && mask != kFullControlNoDeleteChild) {
        mask &= ~kSynchronize;
    }
    return mask;
}

}  // namespace Security
}  // namespace AclKit
