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

#include <climits>
#include <string>
#include <tuple>

#include "../src/Security/FileSystemAcl.hpp"
#include "TestHelpers.hpp"

using namespace AclKit::Security;
using AclKit::Tests::CreateEmptyFile;
using AclKit::Tests::ExpectSameExplicitRules;
using AclKit::Tests::kDefaultBufferSize;
using AclKit::Tests::MakeDirectorySecurity;
using AclKit::Tests::MakeFileSecurity;
using AclKit::Tests::TempDirectory;

namespace {

    void ExpectError(const Error& err, ErrorKind kind, const wchar_t* paramName) {
        EXPECT_EQ(kind, err.kind) << "got " << testing::PrintToString(std::wstring(ErrorKindToString(err.kind)));
        EXPECT_EQ(paramName, err.paramName);
    }

    /// Rights x type pairs exercised by the create-with-descriptor tests
    const std::tuple<FileSystemRights, AccessControlType> kRuleCombos[] = {
        { FileSystemRights::ReadAndExecute, AccessControlType::Allow },
        { FileSystemRights::ReadAndExecute, AccessControlType::Deny },
        { FileSystemRights::ExecuteFile,    AccessControlType::Allow },
        { FileSystemRights::ExecuteFile,    AccessControlType::Deny },
        { FileSystemRights::WriteData,      AccessControlType::Allow },
        { FileSystemRights::WriteData,      AccessControlType::Deny },
        { FileSystemRights::FullControl,    AccessControlType::Allow },
        { FileSystemRights::FullControl,    AccessControlType::Deny },
    };

}  // namespace

class FileSystemAclTest : public ::testing::Test {
protected:
    TempDirectory m_temp;
};

// ============================================================================
// Null arguments
// ============================================================================

TEST_F(FileSystemAclTest, GetNullArguments) {
    Error err;
    DirectorySecurity ds;
    FileSecurity fs;

    EXPECT_FALSE(GetAccessControl(static_cast<const DirectoryInfo*>(nullptr), ds, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directoryInfo");

    EXPECT_FALSE(GetAccessControl(static_cast<const DirectoryInfo*>(nullptr), AccessControlSections::Access, ds, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directoryInfo");

    EXPECT_FALSE(GetAccessControl(static_cast<const FileInfo*>(nullptr), fs, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileInfo");

    EXPECT_FALSE(GetAccessControl(static_cast<const FileInfo*>(nullptr), AccessControlSections::Access, fs, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileInfo");

    EXPECT_FALSE(GetAccessControl(static_cast<const FileStream*>(nullptr), fs, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileStream");
}

TEST_F(FileSystemAclTest, SetNullArguments) {
    Error err;
    const DirectoryInfo directoryInfo(m_temp.Path());
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const DirectorySecurity ds;
    const FileSecurity fs;

    EXPECT_FALSE(SetAccessControl(static_cast<const DirectoryInfo*>(nullptr), &ds, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directoryInfo");
    EXPECT_FALSE(SetAccessControl(&directoryInfo, static_cast<const DirectorySecurity*>(nullptr), &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directorySecurity");

    EXPECT_FALSE(SetAccessControl(static_cast<const FileInfo*>(nullptr), &fs, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileInfo");
    EXPECT_FALSE(SetAccessControl(&fileInfo, static_cast<const FileSecurity*>(nullptr), &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileSecurity");

    FileStream stream;
    EXPECT_FALSE(SetAccessControl(static_cast<const FileStream*>(nullptr), &fs, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileStream");
    EXPECT_FALSE(SetAccessControl(&stream, static_cast<const FileSecurity*>(nullptr), &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileSecurity");
}

TEST_F(FileSystemAclTest, CreateNullArguments) {
    Error err;
    const DirectoryInfo directoryInfo(m_temp.Child(L"dir"));
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const DirectorySecurity ds;
    const FileSecurity fs;
    FileStream stream;
    DirectoryInfo created;

    EXPECT_FALSE(Create(static_cast<const DirectoryInfo*>(nullptr), &ds, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directoryInfo");
    EXPECT_FALSE(Create(&directoryInfo, static_cast<const DirectorySecurity*>(nullptr), &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directorySecurity");

    EXPECT_FALSE(CreateDirectory(nullptr, m_temp.Child(L"dir").c_str(), created, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"directorySecurity");
    EXPECT_FALSE(CreateDirectory(&ds, nullptr, created, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"path");

    EXPECT_FALSE(Create(static_cast<const FileInfo*>(nullptr), FileMode::Create, FileSystemRights::WriteData,
                        FileShare::None, kDefaultBufferSize, FileOptions::None, &fs, stream, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileInfo");
    EXPECT_FALSE(Create(&fileInfo, FileMode::Create, FileSystemRights::WriteData, FileShare::None,
                        kDefaultBufferSize, FileOptions::None, nullptr, stream, &err));
    ExpectError(err, ErrorKind::ArgumentNull, L"fileSecurity");

    EXPECT_FALSE(fileInfo.Exists());
    EXPECT_TRUE(stream.IsClosed());
}

// ============================================================================
// Argument validation on file creation
// ============================================================================

class FileCreateModeTest : public FileSystemAclTest, public ::testing::WithParamInterface<int> {};

TEST_P(FileCreateModeTest, InvalidModeIsOutOfRange) {
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&fileInfo, static_cast<FileMode>(GetParam()), FileSystemRights::FullControl, FileShare::None,
                        kDefaultBufferSize, FileOptions::None, &security, stream, &err));
    ExpectError(err, ErrorKind::ArgumentOutOfRange, L"mode");
    EXPECT_FALSE(fileInfo.Exists());
}

INSTANTIATE_TEST_SUITE_P(Values, FileCreateModeTest, ::testing::Values(INT_MIN, 0, 7, INT_MAX));

class FileCreateShareTest : public FileSystemAclTest, public ::testing::WithParamInterface<int> {};

TEST_P(FileCreateShareTest, InvalidShareIsOutOfRange) {
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&fileInfo, FileMode::Create, FileSystemRights::FullControl, static_cast<FileShare>(GetParam()),
                        kDefaultBufferSize, FileOptions::None, &security, stream, &err));
    ExpectError(err, ErrorKind::ArgumentOutOfRange, L"share");
}

INSTANTIATE_TEST_SUITE_P(Values, FileCreateShareTest, ::testing::Values(-1, 8, INT_MAX));

class FileCreateBufferSizeTest : public FileSystemAclTest, public ::testing::WithParamInterface<int> {};

TEST_P(FileCreateBufferSizeTest, NonPositiveBufferSizeIsOutOfRange) {
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&fileInfo, FileMode::Create, FileSystemRights::FullControl, FileShare::None,
                        GetParam(), FileOptions::None, &security, stream, &err));
    ExpectError(err, ErrorKind::ArgumentOutOfRange, L"bufferSize");
}

INSTANTIATE_TEST_SUITE_P(Values, FileCreateBufferSizeTest, ::testing::Values(INT_MIN, -1, 0));

class FileCreateForbiddenComboTest
    : public FileSystemAclTest,
      public ::testing::WithParamInterface<std::tuple<FileMode, FileSystemRights>> {};

TEST_P(FileCreateForbiddenComboTest, ReadOnlyRightsWithWritingModeIsRejected) {
    const auto [mode, rights] = GetParam();
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&fileInfo, mode, rights, FileShare::None, kDefaultBufferSize, FileOptions::None,
                        &security, stream, &err));
    ExpectError(err, ErrorKind::Argument, L"rights");
    EXPECT_FALSE(fileInfo.Exists());
}

INSTANTIATE_TEST_SUITE_P(
    Combos,
    FileCreateForbiddenComboTest,
    ::testing::Combine(::testing::Values(FileMode::Truncate, FileMode::CreateNew, FileMode::Create, FileMode::Append),
                       ::testing::Values(FileSystemRights::Read, FileSystemRights::ReadData)));

TEST_F(FileSystemAclTest, ValidationOrderReportsFirstFailure) {
    const FileInfo fileInfo(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    // Mode is checked before share, share before buffer size, buffer size before rights
    EXPECT_FALSE(Create(&fileInfo, static_cast<FileMode>(0), FileSystemRights::Read, static_cast<FileShare>(-1),
                        0, FileOptions::None, &security, stream, &err));
    EXPECT_EQ(L"mode", err.paramName);

    EXPECT_FALSE(Create(&fileInfo, FileMode::Create, FileSystemRights::Read, static_cast<FileShare>(-1),
                        0, FileOptions::None, &security, stream, &err));
    EXPECT_EQ(L"share", err.paramName);

    EXPECT_FALSE(Create(&fileInfo, FileMode::Create, FileSystemRights::Read, FileShare::None,
                        0, FileOptions::None, &security, stream, &err));
    EXPECT_EQ(L"bufferSize", err.paramName);
}

// ============================================================================
// Get
// ============================================================================

TEST_F(FileSystemAclTest, GetDirectoryReturnsDescriptor) {
    const DirectoryInfo info(m_temp.Path());
    DirectorySecurity security;
    Error err;
    ASSERT_TRUE(GetAccessControl(&info, security, &err)) << "win32=" << err.win32;

    EXPECT_EQ(AccessRightType::FileSystemRights, security.GetAccessRightType());
    EXPECT_TRUE(security.Owner().has_value());
    EXPECT_FALSE(security.Rules().empty());
    EXPECT_FALSE(security.IsModified());
}

TEST_F(FileSystemAclTest, GetDirectoryWithEachSection) {
    const DirectoryInfo info(m_temp.Path());

    for (AccessControlSections sections : { AccessControlSections::None, AccessControlSections::Access,
                                            AccessControlSections::Owner, AccessControlSections::Group,
                                            AccessControlSections::Access | AccessControlSections::Owner }) {
        DirectorySecurity security;
        Error err;
        ASSERT_TRUE(GetAccessControl(&info, sections, security, &err))
            << "sections=" << static_cast<unsigned>(sections) << " win32=" << err.win32;
        EXPECT_EQ(HasSection(sections, AccessControlSections::Owner), security.Owner().has_value());
        if (sections == AccessControlSections::None) {
            EXPECT_TRUE(security.Rules().empty());
        }
    }
}

TEST_F(FileSystemAclTest, GetFileReturnsDescriptor) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);
    const FileInfo info(path);

    FileSecurity security;
    Error err;
    ASSERT_TRUE(GetAccessControl(&info, security, &err)) << "win32=" << err.win32;
    EXPECT_EQ(AccessRightType::FileSystemRights, security.GetAccessRightType());
    EXPECT_FALSE(security.Rules().empty());

    FileSecurity none;
    ASSERT_TRUE(GetAccessControl(&info, AccessControlSections::None, none, &err));
    EXPECT_TRUE(none.Rules().empty());
    EXPECT_FALSE(none.Owner().has_value());
}

TEST_F(FileSystemAclTest, GetThroughOpenStream) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);

    FileStream stream;
    Error err;
    ASSERT_TRUE(FileStream::Open(path, FileMode::Open, FileAccess::Read, FileShare::Read, stream, &err));

    FileSecurity security;
    ASSERT_TRUE(GetAccessControl(&stream, security, &err)) << "win32=" << err.win32;
    EXPECT_FALSE(security.Rules().empty());
}

TEST_F(FileSystemAclTest, GetMissingTargets) {
    Error err;

    const DirectoryInfo missingDir(m_temp.Child(L"missing"));
    DirectorySecurity ds;
    EXPECT_FALSE(GetAccessControl(&missingDir, ds, &err));
    EXPECT_EQ(ErrorKind::DirectoryNotFound, err.kind);

    const FileInfo missingFile(m_temp.Child(L"missing.txt"));
    FileSecurity fs;
    EXPECT_FALSE(GetAccessControl(&missingFile, fs, &err));
    EXPECT_EQ(ErrorKind::FileNotFound, err.kind);

    EXPECT_FALSE(GetAccessControl(&missingFile, AccessControlSections::None, fs, &err));
    EXPECT_EQ(ErrorKind::FileNotFound, err.kind);
}

TEST_F(FileSystemAclTest, ClosedStreamIsDisposed) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);

    FileStream stream;
    ASSERT_TRUE(FileStream::Open(path, FileMode::Open, FileAccess::Read, FileShare::Read, stream));
    stream.Close();

    Error err;
    FileSecurity security;
    EXPECT_FALSE(GetAccessControl(&stream, security, &err));
    EXPECT_EQ(ErrorKind::ObjectDisposed, err.kind);

    const FileSecurity modified = MakeFileSecurity(FileSystemRights::Read, AccessControlType::Allow);
    EXPECT_FALSE(SetAccessControl(&stream, &modified, &err));
    EXPECT_EQ(ErrorKind::ObjectDisposed, err.kind);
}

// ============================================================================
// Set
// ============================================================================

TEST_F(FileSystemAclTest, SetDirectoryPersistsRules) {
    const std::wstring path = m_temp.Child(L"dir");
    ASSERT_TRUE(AclKit::Utils::FileUtils::CreateDirectories(path));
    const DirectoryInfo info(path);

    const DirectorySecurity expected = MakeDirectorySecurity(FileSystemRights::ReadAndExecute, AccessControlType::Allow);
    Error err;
    ASSERT_TRUE(SetAccessControl(&info, &expected, &err)) << "win32=" << err.win32;

    DirectorySecurity actual;
    ASSERT_TRUE(GetAccessControl(&info, actual, &err));
    ExpectSameExplicitRules(expected, actual);
}

TEST_F(FileSystemAclTest, SetFilePersistsRules) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);
    const FileInfo info(path);

    const FileSecurity expected = MakeFileSecurity(FileSystemRights::Modify, AccessControlType::Allow);
    Error err;
    ASSERT_TRUE(SetAccessControl(&info, &expected, &err)) << "win32=" << err.win32;

    FileSecurity actual;
    ASSERT_TRUE(GetAccessControl(&info, actual, &err));
    ExpectSameExplicitRules(expected, actual);
}

TEST_F(FileSystemAclTest, SetWithUnmodifiedDescriptorIsNoOp) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);
    const FileInfo info(path);

    FileSecurity before;
    ASSERT_TRUE(GetAccessControl(&info, before));

    const FileSecurity untouched;
    Error err;
    EXPECT_TRUE(SetAccessControl(&info, &untouched, &err));

    FileSecurity after;
    ASSERT_TRUE(GetAccessControl(&info, after));
    ExpectSameExplicitRules(before, after);
}

TEST_F(FileSystemAclTest, SetThroughStreamOpenedForAppend) {
    const FileInfo info(m_temp.Child(L"file.txt"));
    const FileSecurity initial;

    FileStream stream;
    Error err;
    ASSERT_TRUE(Create(&info, FileMode::Append,
                       FileSystemRights::Write | FileSystemRights::ReadPermissions | FileSystemRights::ChangePermissions,
                       FileShare::None, kDefaultBufferSize, FileOptions::None, &initial, stream, &err))
        << "win32=" << err.win32;

    const FileSecurity expected = MakeFileSecurity(FileSystemRights::ReadAndExecute, AccessControlType::Allow);
    ASSERT_TRUE(SetAccessControl(&stream, &expected, &err)) << "win32=" << err.win32;

    FileSecurity actual;
    ASSERT_TRUE(GetAccessControl(&stream, actual, &err));
    ExpectSameExplicitRules(expected, actual);
}

// ============================================================================
// Create directory
// ============================================================================

TEST_F(FileSystemAclTest, CreateDirectoryWithDefaultDescriptor) {
    const DirectoryInfo info(m_temp.Child(L"dir"));
    const DirectorySecurity security;
    Error err;

    ASSERT_TRUE(Create(&info, &security, &err)) << "win32=" << err.win32;
    EXPECT_TRUE(info.Exists());

    // Nothing explicit was requested; everything comes from the parent
    DirectorySecurity actual;
    ASSERT_TRUE(GetAccessControl(&info, actual, &err));
    EXPECT_TRUE(actual.GetAccessRules(true, false).empty());
    EXPECT_FALSE(actual.GetAccessRules(false, true).empty());
}

TEST_F(FileSystemAclTest, CreateDirectoryWithRules) {
    int index = 0;
    for (const auto& [rights, type] : kRuleCombos) {
        const DirectoryInfo info(m_temp.Child(L"dir" + std::to_wstring(index++)));
        const DirectorySecurity expected = MakeDirectorySecurity(rights, type);
        Error err;

        ASSERT_TRUE(Create(&info, &expected, &err)) << "win32=" << err.win32;
        ASSERT_TRUE(info.Exists());

        DirectorySecurity actual;
        ASSERT_TRUE(GetAccessControl(&info, actual, &err)) << "win32=" << err.win32;
        ExpectSameExplicitRules(expected, actual);
    }
}

TEST_F(FileSystemAclTest, CreateDirectoryUnderMissingParent) {
    const DirectoryInfo info(m_temp.Child(L"missing\\child"));
    const DirectorySecurity security;
    Error err;

    EXPECT_FALSE(Create(&info, &security, &err));
    EXPECT_EQ(ErrorKind::UnauthorizedAccess, err.kind);
    EXPECT_EQ(static_cast<DWORD>(ERROR_PATH_NOT_FOUND), err.win32);
    EXPECT_FALSE(DirectoryInfo(m_temp.Child(L"missing")).Exists());
}

TEST_F(FileSystemAclTest, CreateDirectoryOverExistingFileFails) {
    const std::wstring path = m_temp.Child(L"occupied");
    CreateEmptyFile(path);

    const DirectoryInfo info(path);
    const DirectorySecurity security;
    Error err;
    EXPECT_FALSE(Create(&info, &security, &err));
    EXPECT_EQ(ErrorKind::IO, err.kind);
    EXPECT_EQ(static_cast<DWORD>(ERROR_ALREADY_EXISTS), err.win32);
}

TEST_F(FileSystemAclTest, CreateDirectoryByPath) {
    const std::wstring path = m_temp.Child(L"byPath");
    const DirectorySecurity expected = MakeDirectorySecurity(FileSystemRights::FullControl, AccessControlType::Allow);
    DirectoryInfo created;
    Error err;

    ASSERT_TRUE(CreateDirectory(&expected, path.c_str(), created, &err)) << "win32=" << err.win32;
    EXPECT_TRUE(created.Exists());
    EXPECT_EQ(L"byPath", created.Name());

    DirectorySecurity actual;
    ASSERT_TRUE(GetAccessControl(&created, actual, &err));
    ExpectSameExplicitRules(expected, actual);
}

TEST_F(FileSystemAclTest, CreateDirectoryEmptyPathIsInvalid) {
    const DirectorySecurity security;
    DirectoryInfo created;
    Error err;
    EXPECT_FALSE(CreateDirectory(&security, L"", created, &err));
    ExpectError(err, ErrorKind::Argument, L"path");
}

TEST_F(FileSystemAclTest, CreateExistingDirectoryKeepsOriginalDescriptor) {
    const std::wstring path = m_temp.Child(L"existing");
    const DirectorySecurity original = MakeDirectorySecurity(FileSystemRights::ReadAndExecute, AccessControlType::Allow);
    DirectoryInfo created;
    Error err;
    ASSERT_TRUE(CreateDirectory(&original, path.c_str(), created, &err)) << "win32=" << err.win32;

    // Second create with a different descriptor succeeds and changes nothing
    const DirectorySecurity replacement = MakeDirectorySecurity(FileSystemRights::ExecuteFile, AccessControlType::Deny);
    DirectoryInfo again;
    ASSERT_TRUE(CreateDirectory(&replacement, path.c_str(), again, &err)) << "win32=" << err.win32;
    EXPECT_EQ(created.FullName(), again.FullName());

    DirectorySecurity actual;
    ASSERT_TRUE(GetAccessControl(&again, actual, &err));
    ExpectSameExplicitRules(original, actual);
}

TEST_F(FileSystemAclTest, CreateExistingDirectoryIgnoresDenyAfterEmptyDescriptor) {
    const std::wstring path = m_temp.Child(L"createMe");
    const DirectorySecurity empty;
    DirectoryInfo created;
    Error err;
    ASSERT_TRUE(CreateDirectory(&empty, path.c_str(), created, &err)) << "win32=" << err.win32;

    const DirectorySecurity deny = MakeDirectorySecurity(FileSystemRights::ExecuteFile, AccessControlType::Deny);
    DirectoryInfo again;
    ASSERT_TRUE(CreateDirectory(&deny, path.c_str(), again, &err)) << "win32=" << err.win32;

    DirectorySecurity actual;
    ASSERT_TRUE(GetAccessControl(&again, actual, &err)) << "win32=" << err.win32;
    EXPECT_TRUE(actual.GetAccessRules(true, false).empty());
    for (const auto& rule : actual.GetAccessRules(true, true)) {
        EXPECT_NE(AccessControlType::Deny, rule.Type());
    }
}

// ============================================================================
// Create file
// ============================================================================

TEST_F(FileSystemAclTest, CreateFileWithDefaultDescriptor) {
    const FileInfo info(m_temp.Child(L"file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    ASSERT_TRUE(Create(&info, FileMode::Create, FileSystemRights::WriteData, FileShare::Read, kDefaultBufferSize,
                       FileOptions::None, &security, stream, &err)) << "win32=" << err.win32;
    EXPECT_FALSE(stream.IsClosed());
    EXPECT_TRUE(stream.CanWrite());
    EXPECT_FALSE(stream.CanRead());
    EXPECT_EQ(kDefaultBufferSize, stream.BufferSize());
    EXPECT_TRUE(info.Exists());
}

TEST_F(FileSystemAclTest, CreateFileWithRules) {
    int index = 0;
    for (const auto& [rights, type] : kRuleCombos) {
        const FileInfo info(m_temp.Child(L"file" + std::to_wstring(index++) + L".txt"));
        const FileSecurity expected = MakeFileSecurity(rights, type);
        FileStream stream;
        Error err;

        ASSERT_TRUE(Create(&info, FileMode::Create, FileSystemRights::WriteData, FileShare::Read, kDefaultBufferSize,
                           FileOptions::None, &expected, stream, &err)) << "win32=" << err.win32;
        stream.Close();
        ASSERT_TRUE(info.Exists());

        FileSecurity actual;
        ASSERT_TRUE(GetAccessControl(&info, actual, &err)) << "win32=" << err.win32;
        ExpectSameExplicitRules(expected, actual);
    }
}

TEST_F(FileSystemAclTest, CreateFileGrantingUsersFullControl) {
    const FileInfo info(m_temp.Child(L"file.txt"));
    const FileSecurity expected = MakeFileSecurity(FileSystemRights::FullControl, AccessControlType::Allow);
    FileStream stream;
    Error err;

    ASSERT_TRUE(Create(&info, FileMode::Create, FileSystemRights::WriteData, FileShare::Read, kDefaultBufferSize,
                       FileOptions::None, &expected, stream, &err)) << "win32=" << err.win32;
    EXPECT_TRUE(info.Exists());

    FileSecurity actual;
    ASSERT_TRUE(GetAccessControl(&info, actual, &err));

    const SecurityIdentifier users = SecurityIdentifier::WellKnown(WellKnownSid::BuiltinUsers);
    bool found = false;
    for (const auto& rule : actual.GetAccessRules(true, false)) {
        if (rule.IdentityReference() == users && rule.Type() == AccessControlType::Allow &&
            rule.Rights() == FileSystemRights::FullControl) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(FileSystemAclTest, CreateFileInMissingDirectory) {
    const FileInfo info(m_temp.Child(L"missing\\file.txt"));
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&info, FileMode::Create, FileSystemRights::WriteData, FileShare::None, kDefaultBufferSize,
                        FileOptions::None, &security, stream, &err));
    EXPECT_EQ(ErrorKind::DirectoryNotFound, err.kind);
    EXPECT_EQ(static_cast<DWORD>(ERROR_PATH_NOT_FOUND), err.win32);
}

TEST_F(FileSystemAclTest, CreateNewOverExistingFileFails) {
    const std::wstring path = m_temp.Child(L"file.txt");
    CreateEmptyFile(path);
    const FileInfo info(path);
    const FileSecurity security;
    FileStream stream;
    Error err;

    EXPECT_FALSE(Create(&info, FileMode::CreateNew, FileSystemRights::Write, FileShare::None, kDefaultBufferSize,
                        FileOptions::None, &security, stream, &err));
    EXPECT_EQ(ErrorKind::IO, err.kind);
    EXPECT_EQ(static_cast<DWORD>(ERROR_FILE_EXISTS), err.win32);
}

TEST_F(FileSystemAclTest, AppendPositionsAtEnd) {
    const std::wstring path = m_temp.Child(L"file.txt");
    {
        FileStream writer;
        ASSERT_TRUE(FileStream::Open(path, FileMode::Create, FileAccess::Write, FileShare::None, writer));
        const char payload[] = "0123456789";
        ASSERT_TRUE(writer.Write(payload, 10));
    }

    const FileInfo info(path);
    const FileSecurity security;
    FileStream stream;
    Error err;
    ASSERT_TRUE(Create(&info, FileMode::Append, FileSystemRights::AppendData, FileShare::None, kDefaultBufferSize,
                       FileOptions::None, &security, stream, &err)) << "win32=" << err.win32;

    uint64_t position = 0;
    ASSERT_TRUE(stream.Position(position));
    EXPECT_EQ(10u, position);
}

// ============================================================================
// Limits
// ============================================================================

class FileSystemAclLimitsTest : public FileSystemAclTest {
protected:
    void SetUp() override { m_saved = GetLimits(); }
    void TearDown() override { SetLimits(m_saved); }

    AclLimits m_saved;
};

TEST_F(FileSystemAclLimitsTest, OversizedDescriptorIsRejected) {
    AclLimits limits = m_saved;
    limits.maxSecurityDescriptorBytes = sizeof(SECURITY_DESCRIPTOR_RELATIVE);
    SetLimits(limits);
    EXPECT_EQ(limits.maxSecurityDescriptorBytes, GetLimits().maxSecurityDescriptorBytes);

    const DirectoryInfo info(m_temp.Path());
    DirectorySecurity security;
    Error err;
    EXPECT_FALSE(GetAccessControl(&info, security, &err));
    EXPECT_EQ(ErrorKind::IO, err.kind);
    EXPECT_EQ(static_cast<DWORD>(ERROR_INVALID_SECURITY_DESCR), err.win32);
}

TEST_F(FileSystemAclLimitsTest, OpenUsesConfiguredDefaultBufferSize) {
    AclLimits limits = m_saved;
    limits.defaultBufferSize = 8192;
    SetLimits(limits);

    FileStream stream;
    Error err;
    ASSERT_TRUE(FileStream::Open(m_temp.Child(L"buffered.txt"), FileMode::Create, FileAccess::Write,
                                 FileShare::None, stream, &err)) << "win32=" << err.win32;
    EXPECT_EQ(8192, stream.BufferSize());
}
