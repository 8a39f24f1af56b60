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
 * @file RegistryUtils.hpp
 * @brief Owning registry handle guard and a small key wrapper built on it.
 *
 * RegistryHandle releases its HKEY exactly once through RegCloseKey and never
 * throws. The outcome of the release is returned as a ReleaseResult carrying
 * the native status so callers decide whether a failure matters.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

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
		namespace RegistryUtils {

			/**
			 * @brief Error information for registry operations.
			 */
			struct Error {
				DWORD win32 = 0;            ///< LSTATUS / Win32 error code
				std::wstring message;
				std::wstring keyPath;       ///< Sub key involved, if any
				std::wstring valueName;     ///< Value involved, if any

				[[nodiscard]] bool hasError() const noexcept { return win32 != 0; }

				void clear() noexcept {
					win32 = 0;
					message.clear();
					keyPath.clear();
					valueName.clear();
				}
			};

			/**
			 * @brief Outcome of releasing a registry handle.
			 *
			 * `closed` tells whether RegCloseKey was actually invoked; it is false
			 * for empty guards and for guards that do not own their handle.
			 */
			struct ReleaseResult {
				LSTATUS status = ERROR_SUCCESS;
				bool closed = false;

				[[nodiscard]] constexpr bool succeeded() const noexcept { return status == ERROR_SUCCESS; }

				explicit constexpr operator bool() const noexcept { return succeeded(); }
			};

			/**
			 * @brief Exclusive owner of a native HKEY.
			 *
			 * The handle is released at most once: after Release() the guard is
			 * empty whatever the platform reported. A guard adopting a handle with
			 * ownsHandle = false never calls RegCloseKey.
			 *
			 * @note Not thread-safe. No other thread may use the handle once
			 *       Release() has started.
			 */
			class RegistryHandle {
			public:
				RegistryHandle() noexcept = default;

				explicit RegistryHandle(HKEY handle, bool ownsHandle = true) noexcept;

				/// Releases the handle; a failed release is logged, never thrown.
				~RegistryHandle() noexcept;

				RegistryHandle(const RegistryHandle&) = delete;
				RegistryHandle& operator=(const RegistryHandle&) = delete;

				RegistryHandle(RegistryHandle&& other) noexcept;
				RegistryHandle& operator=(RegistryHandle&& other) noexcept;

				/**
				 * @brief Close the handle through RegCloseKey.
				 * @return Native status of the close; success when nothing had to be closed
				 */
				[[nodiscard]] ReleaseResult Release() noexcept;

				/**
				 * @brief Boolean form of Release(): true iff the platform reported success.
				 */
				bool ReleaseHandle() noexcept { return Release().succeeded(); }

				/**
				 * @brief Give up ownership without closing.
				 */
				[[nodiscard]] HKEY Detach() noexcept;

				/**
				 * @brief Release the current handle and return the slot for an out-parameter.
				 */
				[[nodiscard]] HKEY* Put() noexcept;

				[[nodiscard]] HKEY Get() const noexcept { return m_key; }

				[[nodiscard]] bool IsInvalid() const noexcept;

				/// True once the guard released or detached a handle it held.
				[[nodiscard]] bool IsClosed() const noexcept { return m_closed; }

				[[nodiscard]] bool OwnsHandle() const noexcept { return m_owns; }

			private:
				HKEY m_key = nullptr;
				bool m_owns = true;
				bool m_closed = false;
			};

			/**
			 * @brief Registry key opened or created below a parent key.
			 */
			class RegistryKey {
			public:
				RegistryKey() noexcept = default;

				RegistryKey(RegistryKey&&) noexcept = default;
				RegistryKey& operator=(RegistryKey&&) noexcept = default;

				[[nodiscard]] bool Open(HKEY hKeyParent, std::wstring_view subKey, REGSAM access = KEY_READ, Error* err = nullptr) noexcept;

				/**
				 * @param disposition Optional; REG_CREATED_NEW_KEY or REG_OPENED_EXISTING_KEY
				 */
				[[nodiscard]] bool Create(HKEY hKeyParent, std::wstring_view subKey, REGSAM access = KEY_READ | KEY_WRITE,
				                          DWORD* disposition = nullptr, Error* err = nullptr) noexcept;

				ReleaseResult Close() noexcept;

				[[nodiscard]] bool IsValid() const noexcept { return !m_handle.IsInvalid(); }

				[[nodiscard]] HKEY Handle() const noexcept { return m_handle.Get(); }

				[[nodiscard]] const std::wstring& Path() const noexcept { return m_path; }

				[[nodiscard]] bool ReadString(std::wstring_view valueName, std::wstring& out, Error* err = nullptr) const noexcept;
				[[nodiscard]] bool ReadDWord(std::wstring_view valueName, DWORD& out, Error* err = nullptr) const noexcept;

				[[nodiscard]] bool WriteString(std::wstring_view valueName, std::wstring_view value, Error* err = nullptr) noexcept;
				[[nodiscard]] bool WriteDWord(std::wstring_view valueName, DWORD value, Error* err = nullptr) noexcept;

				[[nodiscard]] bool DeleteSubKeyTree(std::wstring_view subKey, Error* err = nullptr) noexcept;

				/**
				 * @brief Read the key's self-relative security descriptor.
				 * @param secInfo Sections, e.g. DACL_SECURITY_INFORMATION | OWNER_SECURITY_INFORMATION
				 */
				[[nodiscard]] bool GetKeySecurity(SECURITY_INFORMATION secInfo, std::vector<uint8_t>& sd, Error* err = nullptr) const noexcept;

			private:
				RegistryHandle m_handle;
				std::wstring m_path;
			};

		}// namespace RegistryUtils
	}// namespace Utils
}// namespace AclKit
