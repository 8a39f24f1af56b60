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
 * AclKit - SETTINGS
 * ============================================================================
 *
 * @file Settings.hpp
 * @brief JSON configuration for the logger and the ACL facade limits.
 *
 * Recognised document (every key optional):
 * @code
 *   {
 *     "logging": {
 *       "level": "info", "flushLevel": "error",
 *       "toConsole": true, "toFile": false,
 *       "directory": "logs", "baseFileName": "AclKit",
 *       "maxFileSizeBytes": 10485760, "maxFileCount": 10,
 *       "async": false, "jsonLines": false
 *     },
 *     "acl": { "defaultBufferSize": 4096, "maxSecurityDescriptorBytes": 65536 }
 *   }
 * @endcode
 *
 * Unknown keys are ignored. Comments are accepted.
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "../Utils/Logger.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Security/FileSystemAcl.hpp"

namespace AclKit {
namespace Config {

/**
 * @brief Validation failure: the offending key as a dotted path plus a reason.
 */
struct SettingsError {
    std::string key;
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }

    void clear() noexcept {
        key.clear();
        message.clear();
    }
};

struct LoggingSettings {
    Utils::LogLevel level = Utils::LogLevel::Info;
    Utils::LogLevel flushLevel = Utils::LogLevel::Error;
    bool toConsole = true;
    bool toFile = false;
    std::wstring directory = L"logs";
    std::wstring baseFileName = L"AclKit";
    uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;
    size_t maxFileCount = 10;
    bool async = false;
    bool jsonLines = false;
};

struct AclSettings {
    int defaultBufferSize = Security::SecurityConstants::DEFAULT_BUFFER_SIZE;
    uint32_t maxSecurityDescriptorBytes = Security::SecurityConstants::DEFAULT_MAX_SECURITY_DESCRIPTOR_BYTES;
};

class Settings {
public:
    LoggingSettings logging;
    AclSettings acl;

    /**
     * @brief Build settings from a parsed document. `out` is untouched on failure.
     */
    [[nodiscard]] static bool FromJson(const Utils::JSON::Json& document, Settings& out,
                                       SettingsError* err = nullptr) noexcept;

    [[nodiscard]] static bool Parse(std::string_view jsonText, Settings& out, SettingsError* err = nullptr) noexcept;

    [[nodiscard]] static bool LoadFromFile(const std::filesystem::path& path, Settings& out,
                                           SettingsError* err = nullptr) noexcept;

    /**
     * @brief Parse "trace" .. "fatal" (case-insensitive).
     */
    [[nodiscard]] static bool ParseLogLevel(std::string_view text, Utils::LogLevel& out) noexcept;

    [[nodiscard]] Utils::LoggerConfig ToLoggerConfig() const;

    [[nodiscard]] Security::AclLimits ToAclLimits() const noexcept;

    /**
     * @brief (Re)initialise the logger and install the facade limits.
     */
    void Apply() const;
};

}  // namespace Config
}  // namespace AclKit
