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
#include <gtest/gtest.h>

#include <vector>

#include "../src/Security/FileSystemSecurity.hpp"
#include "TestHelpers.hpp"

using namespace AclKit::Security;
using AclKit::Tests::ExpectSameExplicitRules;
using AclKit::Tests::MakeDirectorySecurity;
using AclKit::Tests::MakeFileSecurity;

namespace {

    SecurityIdentifier Users() { return SecurityIdentifier::WellKnown(WellKnownSid::BuiltinUsers); }

}  // namespace

// ============================================================================
// Construction and modification tracking
// ============================================================================

TEST(FileSystemSecurityTest, FreshDescriptorIsUnmodified) {
    FileSecurity file;
    DirectorySecurity directory;

    EXPECT_FALSE(file.IsContainer());
    EXPECT_TRUE(directory.IsContainer());
    EXPECT_EQ(AccessRightType::FileSystemRights, file.GetAccessRightType());
    EXPECT_EQ(AccessRightType::FileSystemRights, directory.GetAccessRightType());

    EXPECT_FALSE(file.IsModified());
    EXPECT_EQ(0u, file.ModifiedSecurityInformation());
    EXPECT_TRUE(file.Rules().empty());
    EXPECT_FALSE(file.Owner().has_value());
}

TEST(FileSystemSecurityTest, AddAccessRuleMarksAccessModified) {
    FileSecurity security;
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read, AccessControlType::Allow)));

    EXPECT_EQ(AccessControlSections::Access, security.ModifiedSections());
    const SECURITY_INFORMATION info = security.ModifiedSecurityInformation();
    EXPECT_TRUE(info & DACL_SECURITY_INFORMATION);
    EXPECT_TRUE(info & UNPROTECTED_DACL_SECURITY_INFORMATION);
    EXPECT_FALSE(info & OWNER_SECURITY_INFORMATION);
}

TEST(FileSystemSecurityTest, ProtectionIsReportedInSecurityInformation) {
    DirectorySecurity security;
    security.SetAccessRuleProtection(true, false);
    EXPECT_TRUE(security.AreAccessRulesProtected());
    EXPECT_TRUE(security.ModifiedSecurityInformation() & PROTECTED_DACL_SECURITY_INFORMATION);
}

TEST(FileSystemSecurityTest, OwnerAndGroupTracking) {
    FileSecurity security;
    ASSERT_TRUE(security.SetOwner(SecurityIdentifier::WellKnown(WellKnownSid::BuiltinAdministrators)));
    ASSERT_TRUE(security.SetGroup(SecurityIdentifier::WellKnown(WellKnownSid::LocalSystem)));

    EXPECT_EQ(AccessControlSections::Owner | AccessControlSections::Group, security.ModifiedSections());
    EXPECT_EQ(static_cast<SECURITY_INFORMATION>(OWNER_SECURITY_INFORMATION | GROUP_SECURITY_INFORMATION),
              security.ModifiedSecurityInformation());

    Error err;
    EXPECT_FALSE(security.SetOwner(SecurityIdentifier(), &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
    EXPECT_EQ(L"owner", err.paramName);
}

// ============================================================================
// Rule validation
// ============================================================================

TEST(FileSystemSecurityTest, FileRejectsInheritanceFlags) {
    FileSecurity security;
    Error err;
    EXPECT_FALSE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read,
                                                             InheritanceFlags::ObjectInherit, PropagationFlags::None,
                                                             AccessControlType::Allow), &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
    EXPECT_EQ(L"inheritanceFlags", err.paramName);
    EXPECT_FALSE(security.IsModified());
}

TEST(FileSystemSecurityTest, FileRejectsPropagationFlags) {
    FileSecurity security;
    Error err;
    EXPECT_FALSE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read,
                                                             InheritanceFlags::None, PropagationFlags::InheritOnly,
                                                             AccessControlType::Allow), &err));
    EXPECT_EQ(L"propagationFlags", err.paramName);
}

TEST(FileSystemSecurityTest, DirectoryRequiresInheritanceForPropagation) {
    DirectorySecurity security;
    Error err;
    EXPECT_FALSE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read,
                                                             InheritanceFlags::None, PropagationFlags::NoPropagateInherit,
                                                             AccessControlType::Allow), &err));
    EXPECT_EQ(L"propagationFlags", err.paramName);

    EXPECT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read,
                                                            InheritanceFlags::ContainerInherit, PropagationFlags::NoPropagateInherit,
                                                            AccessControlType::Allow)));
}

TEST(FileSystemSecurityTest, RuleWithoutIdentityIsRejected) {
    DirectorySecurity security;
    Error err;
    EXPECT_FALSE(security.AddAccessRule(FileSystemAccessRule(SecurityIdentifier(), FileSystemRights::Read,
                                                             AccessControlType::Allow), &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
    EXPECT_EQ(L"rule", err.paramName);
}

// ============================================================================
// Removal
// ============================================================================

TEST(FileSystemSecurityTest, RemoveAccessRuleRemovesExactMatchesOnly) {
    FileSecurity security = MakeFileSecurity(FileSystemRights::Read, AccessControlType::Allow);
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Write, AccessControlType::Deny)));

    EXPECT_EQ(0u, security.RemoveAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Write, AccessControlType::Allow)));
    EXPECT_EQ(1u, security.RemoveAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Write, AccessControlType::Deny)));
    ASSERT_EQ(1u, security.Rules().size());
    EXPECT_EQ(AccessControlType::Allow, security.Rules().front().Type());
}

TEST(FileSystemSecurityTest, RemoveAccessRuleAllDropsEveryRuleOfIdentity) {
    DirectorySecurity security = MakeDirectorySecurity(FileSystemRights::Read, AccessControlType::Allow);
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Delete, AccessControlType::Deny)));
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(SecurityIdentifier::WellKnown(WellKnownSid::World),
                                                            FileSystemRights::Read, AccessControlType::Allow)));

    EXPECT_EQ(2u, security.RemoveAccessRuleAll(Users()));
    ASSERT_EQ(1u, security.Rules().size());
    EXPECT_EQ(SecurityIdentifier::WellKnown(WellKnownSid::World), security.Rules().front().IdentityReference());
}

// ============================================================================
// Native conversion
// ============================================================================

TEST(FileSystemSecurityTest, ToNativeProducesValidDescriptor) {
    FileSecurity security = MakeFileSecurity(FileSystemRights::FullControl, AccessControlType::Allow);
    std::vector<uint8_t> sd;
    ASSERT_TRUE(security.ToNative(AccessControlSections::Access, sd));
    ASSERT_FALSE(sd.empty());
    EXPECT_TRUE(::IsValidSecurityDescriptor(reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data())));

    FileSecurity copy;
    ASSERT_TRUE(copy.FromNative(reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data())));
    ExpectSameExplicitRules(security, copy);
    EXPECT_FALSE(copy.IsModified());
}

TEST(FileSystemSecurityTest, ToNativeOrdersDenyBeforeAllow) {
    DirectorySecurity security;
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Read, AccessControlType::Allow)));
    ASSERT_TRUE(security.AddAccessRule(FileSystemAccessRule(Users(), FileSystemRights::Delete, AccessControlType::Deny)));

    std::vector<uint8_t> sd;
    ASSERT_TRUE(security.ToNative(AccessControlSections::Access, sd));

    DirectorySecurity copy;
    ASSERT_TRUE(copy.FromNative(reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data())));
    ASSERT_EQ(2u, copy.Rules().size());
    EXPECT_EQ(AccessControlType::Deny, copy.Rules()[0].Type());
    EXPECT_EQ(AccessControlType::Allow, copy.Rules()[1].Type());
}

TEST(FileSystemSecurityTest, FromNativeRejectsInvalidInput) {
    FileSecurity security;
    Error err;
    EXPECT_FALSE(security.FromNative(nullptr, &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
}

// ============================================================================
// SDDL
// ============================================================================

TEST(FileSystemSecurityTest, SddlForProtectedDacl) {
    FileSecurity security;
    ASSERT_TRUE(security.FromSddl(L"D:P(A;;FA;;;BU)"));
    EXPECT_TRUE(security.AreAccessRulesProtected());
    EXPECT_EQ(AccessControlSections::Access, security.ModifiedSections());
    ExpectSameExplicitRules(MakeFileSecurity(FileSystemRights::FullControl, AccessControlType::Allow), security);

    std::wstring text;
    ASSERT_TRUE(security.ToSddl(AccessControlSections::Access, text));
    EXPECT_EQ(L"D:P(A;;FA;;;BU)", text);
}

TEST(FileSystemSecurityTest, SddlCarriesOwner) {
    DirectorySecurity security;
    ASSERT_TRUE(security.FromSddl(L"O:BAD:(A;OICI;FA;;;SY)"));
    ASSERT_TRUE(security.Owner().has_value());
    EXPECT_EQ(SecurityIdentifier::WellKnown(WellKnownSid::BuiltinAdministrators), *security.Owner());
    EXPECT_EQ(AccessControlSections::Owner | AccessControlSections::Access, security.ModifiedSections());

    ASSERT_EQ(1u, security.Rules().size());
    EXPECT_EQ(InheritanceFlags::ContainerInherit | InheritanceFlags::ObjectInherit, security.Rules()[0].Inheritance());
}

TEST(FileSystemSecurityTest, NullDaclReadsAsWorldFullControl) {
    DirectorySecurity security;
    ASSERT_TRUE(security.FromSddl(L"D:NO_ACCESS_CONTROL"));
    ASSERT_EQ(1u, security.Rules().size());

    const FileSystemAccessRule& rule = security.Rules()[0];
    EXPECT_EQ(SecurityIdentifier::WellKnown(WellKnownSid::World), rule.IdentityReference());
    EXPECT_EQ(0x001F01FFu, rule.AccessMask());
    EXPECT_EQ(AccessControlType::Allow, rule.Type());
}

TEST(FileSystemSecurityTest, MalformedSddlIsRejected) {
    FileSecurity security;
    Error err;
    EXPECT_FALSE(security.FromSddl(L"D:(Z;;;;;)", &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
    EXPECT_EQ(L"sddl", err.paramName);

    err.clear();
    EXPECT_FALSE(security.FromSddl(L"", &err));
    EXPECT_EQ(ErrorKind::Argument, err.kind);
}
