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
#pragma once
/**
 * @file FileUtils.hpp
 * @brief Path and file helpers used by the ACL facade, the settings loader and tests.
 */

#include <string>
#include <string_view>
#include <cstdint>

#ifdef _WIN32
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <Windows.h>
#endif

#include "Logger.hpp"

namespace AclKit {

	namespace Utils {

		namespace FileUtils {

			/// Long path prefix for extended-length paths (\\?\)
			inline constexpr std::wstring_view LONG_PATH_PREFIX = L"\\\\?\\";

			/// Maximum reasonable path length to prevent DoS via extremely long paths
			inline constexpr size_t MAX_REASONABLE_PATH_LENGTH = 32767;

			/// Upper bound for ReadAllTextUtf8 (64MB)
			inline constexpr uint64_t MAX_READ_FILE_SIZE = 64ULL * 1024 * 1024;

			/**
			 * @brief Error information for file operations.
			 */
			struct Error {
				DWORD win32 = 0;            ///< Win32 error code from GetLastError()
				std::string message;        ///< Human-readable error description

				[[nodiscard]] bool hasError() const noexcept { return win32 != 0; }

				void clear() noexcept { win32 = 0; message.clear(); }
			};

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Resolve a relative path against the current directory (GetFullPathNameW).
			 * @return Absolute path, or empty string on error
			 */
			[[nodiscard]] std::wstring GetFullPath(std::wstring_view path, Error* err = nullptr);

			/**
			 * @brief Immediate parent of a path, trailing separators ignored.
			 * @return Parent path, or empty string for a root or a bare name
			 */
			[[nodiscard]] std::wstring GetParentPath(std::wstring_view path);

			/**
			 * @brief Last component of a path, trailing separators ignored.
			 */
			[[nodiscard]] std::wstring GetFileName(std::wstring_view path);

			/**
			 * @brief Join two path fragments with a single backslash.
			 */
			[[nodiscard]] std::wstring Combine(std::wstring_view left, std::wstring_view right);

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			[[nodiscard]] bool Exists(std::wstring_view path, Error* err = nullptr);

			[[nodiscard]] bool IsDirectory(std::wstring_view path, Error* err = nullptr);

			// ============================================================================
			// Reading/Writing
			// ============================================================================

			/**
			 * @brief Read a file as UTF-8 text. A UTF-8 BOM is kept; callers strip it.
			 * @warning Limited to MAX_READ_FILE_SIZE
			 */
			[[nodiscard]] bool ReadAllTextUtf8(std::wstring_view path, std::string& out, Error* err = nullptr);

			/**
			 * @brief Write UTF-8 text through a temporary file and an atomic rename.
			 */
			[[nodiscard]] bool WriteAllTextUtf8Atomic(std::wstring_view path, std::string_view utf8, Error* err = nullptr);

			// ============================================================================
			// Directory Operations
			// ============================================================================

			/**
			 * @brief Create directory and all parent directories.
			 * @return true on success (or if already exists)
			 */
			[[nodiscard]] bool CreateDirectories(std::wstring_view dir, Error* err = nullptr);

			[[nodiscard]] bool RemoveFile(std::wstring_view path, Error* err = nullptr);

			/**
			 * @brief Recursively remove a directory and all contents.
			 *
			 * Read-only attributes are cleared before deletion. Reparse points are
			 * removed without being followed.
			 */
			[[nodiscard]] bool RemoveDirectoryRecursive(std::wstring_view dir, Error* err = nullptr);

			/**
			 * @brief Create a uniquely named directory below the user's temp directory.
			 * @param prefix Name prefix, e.g. L"AclKitTests"
			 * @return Full path of the new directory, or empty string on error
			 */
			[[nodiscard]] std::wstring CreateUniqueTempDirectory(std::wstring_view prefix, Error* err = nullptr);

		}//namespace FileUtils
	}//namespace Utils
}//namespace AclKit
