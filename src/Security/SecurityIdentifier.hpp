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
 * @file SecurityIdentifier.hpp
 * @brief Value type holding a binary SID.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "SecurityTypes.hpp"

namespace AclKit {
namespace Security {

enum class WellKnownSid : uint8_t {
    BuiltinUsers,
    BuiltinAdministrators,
    LocalSystem,
    World,
    AuthenticatedUsers,
    CreatorOwner
};

/**
 * @brief Self-contained copy of a SID (the SidBuffer of this library).
 *
 * An empty identifier is invalid. Equality compares the binary form.
 */
class SecurityIdentifier {
public:
    SecurityIdentifier() = default;

    /**
     * @brief Build a well-known SID through CreateWellKnownSid.
     */
    [[nodiscard]] static bool FromWellKnown(WellKnownSid kind, SecurityIdentifier& out, Error* err = nullptr) noexcept;

    /**
     * @brief Parse the string form, e.g. "S-1-5-32-545" or an SDDL alias such as "BU".
     */
    [[nodiscard]] static bool FromString(std::wstring_view text, SecurityIdentifier& out, Error* err = nullptr) noexcept;

    /**
     * @brief Copy a native SID.
     */
    [[nodiscard]] static bool FromNative(PSID sid, SecurityIdentifier& out, Error* err = nullptr) noexcept;

    /**
     * @brief Convenience form of FromWellKnown; returns an invalid identifier on failure.
     */
    [[nodiscard]] static SecurityIdentifier WellKnown(WellKnownSid kind) noexcept;

    /// "S-1-..." or an empty string when invalid
    [[nodiscard]] std::wstring ToString() const;

    [[nodiscard]] bool IsValid() const noexcept;

    /// Pointer usable wherever the platform expects a PSID; nullptr when invalid
    [[nodiscard]] PSID Native() const noexcept;

    [[nodiscard]] DWORD Length() const noexcept { return static_cast<DWORD>(m_sid.size()); }

    [[nodiscard]] const std::vector<uint8_t>& Bytes() const noexcept { return m_sid; }

    bool operator==(const SecurityIdentifier& other) const noexcept { return m_sid == other.m_sid; }
    bool operator!=(const SecurityIdentifier& other) const noexcept { return !(*this == other); }

private:
    std::vector<uint8_t> m_sid;
};

}  // namespace Security
}  // namespace AclKit
