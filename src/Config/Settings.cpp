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
#include "Settings.hpp"

namespace AclKit {
namespace Config {

namespace {

    using Utils::JSON::Json;

    void SetError(SettingsError* err, std::string_view key, std::string_view message) noexcept {
        if (!err) return;
        try {
            err->key = key;
            err->message = message;
        }
        catch (const std::bad_alloc&) {
            err->key.clear();
            err->message.clear();
        }
    }

    /// Node at a dotted path; false when absent
    [[nodiscard]] bool Lookup(const Json& doc, std::string_view key, Json& node) noexcept {
        return Utils::JSON::Contains(doc, key) && Utils::JSON::Get<Json>(doc, key, node);
    }

    bool ReadBool(const Json& doc, std::string_view key, bool& out, SettingsError* err) noexcept {
        Json node;
        if (!Lookup(doc, key, node)) return true;
        if (!node.is_boolean()) {
            SetError(err, key, "expected a boolean");
            return false;
        }
        out = node.get<bool>();
        return true;
    }

    bool ReadInteger(const Json& doc, std::string_view key, int64_t minValue, int64_t maxValue,
                     int64_t& out, SettingsError* err) noexcept {
        Json node;
        if (!Lookup(doc, key, node)) return true;
        if (!node.is_number_integer()) {
            SetError(err, key, "expected an integer");
            return false;
        }
        if (node.is_number_unsigned() && node.get<uint64_t>() > static_cast<uint64_t>(maxValue)) {
            SetError(err, key, "value out of range");
            return false;
        }
        const int64_t value = node.get<int64_t>();
        if (value < minValue || value > maxValue) {
            SetError(err, key, "value out of range");
            return false;
        }
        out = value;
        return true;
    }

    bool Utf8ToWide(std::string_view utf8, std::wstring& out) {
        out.clear();
        if (utf8.empty()) return true;
        const int needed = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8.data(),
                                                 static_cast<int>(utf8.size()), nullptr, 0);
        if (needed <= 0) return false;
        out.resize(static_cast<size_t>(needed));
        return ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8.data(),
                                     static_cast<int>(utf8.size()), out.data(), needed) == needed;
    }

    bool ReadWideString(const Json& doc, std::string_view key, bool allowEmpty,
                        std::wstring& out, SettingsError* err) {
        Json node;
        if (!Lookup(doc, key, node)) return true;
        if (!node.is_string()) {
            SetError(err, key, "expected a string");
            return false;
        }
        const auto& text = node.get_ref<const std::string&>();
        if (text.empty() && !allowEmpty) {
            SetError(err, key, "must not be empty");
            return false;
        }
        std::wstring wide;
        if (!Utf8ToWide(text, wide)) {
            SetError(err, key, "invalid UTF-8");
            return false;
        }
        out = std::move(wide);
        return true;
    }

    bool ReadLevel(const Json& doc, std::string_view key, Utils::LogLevel& out, SettingsError* err) {
        Json node;
        if (!Lookup(doc, key, node)) return true;
        if (!node.is_string()) {
            SetError(err, key, "expected a level name");
            return false;
        }
        Utils::LogLevel level;
        if (!Settings::ParseLogLevel(node.get_ref<const std::string&>(), level)) {
            SetError(err, key, "unknown level '" + node.get<std::string>() + "'");
            return false;
        }
        out = level;
        return true;
    }

}  // namespace

bool Settings::ParseLogLevel(std::string_view text, Utils::LogLevel& out) noexcept {
    static constexpr struct {
        std::string_view name;
        Utils::LogLevel level;
    } kLevels[] = {
        { "trace", Utils::LogLevel::Trace },
        { "debug", Utils::LogLevel::Debug },
        { "info",  Utils::LogLevel::Info },
        { "warn",  Utils::LogLevel::Warn },
        { "error", Utils::LogLevel::Error },
        { "fatal", Utils::LogLevel::Fatal },
    };

    for (const auto& entry : kLevels) {
        if (entry.name.size() != text.size()) continue;
        const bool same = std::equal(text.begin(), text.end(), entry.name.begin(), [](char a, char b) {
            return (a >= 'A' && a <= 'Z' ? static_cast<char>(a - 'A' + 'a') : a) == b;
        });
        if (same) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

bool Settings::FromJson(const Json& document, Settings& out, SettingsError* err) noexcept {
    if (err) err->clear();
    if (!document.is_object()) {
        SetError(err, "/", "configuration root must be an object");
        return false;
    }

    try {
        Settings s;

        if (!ReadLevel(document, "logging.level", s.logging.level, err)) return false;
        if (!ReadLevel(document, "logging.flushLevel", s.logging.flushLevel, err)) return false;
        if (!ReadBool(document, "logging.toConsole", s.logging.toConsole, err)) return false;
        if (!ReadBool(document, "logging.toFile", s.logging.toFile, err)) return false;
        if (!ReadBool(document, "logging.async", s.logging.async, err)) return false;
        if (!ReadBool(document, "logging.jsonLines", s.logging.jsonLines, err)) return false;
        if (!ReadWideString(document, "logging.directory", false, s.logging.directory, err)) return false;
        if (!ReadWideString(document, "logging.baseFileName", false, s.logging.baseFileName, err)) return false;

        int64_t value = static_cast<int64_t>(s.logging.maxFileSizeBytes);
        if (!ReadInteger(document, "logging.maxFileSizeBytes", 1, INT64_MAX, value, err)) return false;
        s.logging.maxFileSizeBytes = static_cast<uint64_t>(value);

        value = static_cast<int64_t>(s.logging.maxFileCount);
        if (!ReadInteger(document, "logging.maxFileCount", 0, 1000, value, err)) return false;
        if (value == 0) {
            SetError(err, "logging.maxFileCount", "must be at least 1");
            return false;
        }
        s.logging.maxFileCount = static_cast<size_t>(value);

        value = s.acl.defaultBufferSize;
        if (!ReadInteger(document, "acl.defaultBufferSize", INT32_MIN, INT32_MAX, value, err)) return false;
        if (value <= 0) {
            SetError(err, "acl.defaultBufferSize", "must be positive");
            return false;
        }
        s.acl.defaultBufferSize = static_cast<int>(value);

        value = s.acl.maxSecurityDescriptorBytes;
        if (!ReadInteger(document, "acl.maxSecurityDescriptorBytes", 0, UINT32_MAX, value, err)) return false;
        if (value < static_cast<int64_t>(sizeof(SECURITY_DESCRIPTOR_RELATIVE))) {
            SetError(err, "acl.maxSecurityDescriptorBytes", "too small for any security descriptor");
            return false;
        }
        s.acl.maxSecurityDescriptorBytes = static_cast<uint32_t>(value);

        out = std::move(s);
        return true;
    }
    catch (const std::bad_alloc&) {
        SetError(err, "/", "memory allocation failed");
        return false;
    }
    catch (const Json::exception& e) {
        SetError(err, "/", e.what());
        return false;
    }
}

bool Settings::Parse(std::string_view jsonText, Settings& out, SettingsError* err) noexcept {
    Json document;
    Utils::JSON::Error jerr;
    if (!Utils::JSON::Parse(jsonText, document, &jerr)) {
        SetError(err, "/", jerr.message);
        return false;
    }
    return FromJson(document, out, err);
}

bool Settings::LoadFromFile(const std::filesystem::path& path, Settings& out, SettingsError* err) noexcept {
    Json document;
    Utils::JSON::Error jerr;
    if (!Utils::JSON::LoadFromFile(path, document, &jerr)) {
        SetError(err, "/", jerr.message);
        return false;
    }
    if (!FromJson(document, out, err)) {
        AK_LOG_WARN(L"Config", L"rejected %ls", path.wstring().c_str());
        return false;
    }
    return true;
}

Utils::LoggerConfig Settings::ToLoggerConfig() const {
    Utils::LoggerConfig cfg;
    cfg.minimalLevel = logging.level;
    cfg.flushLevel = logging.flushLevel;
    cfg.toConsole = logging.toConsole;
    cfg.toFile = logging.toFile;
    cfg.logDirectory = logging.directory;
    cfg.baseFileName = logging.baseFileName;
    cfg.maxFileSizeBytes = logging.maxFileSizeBytes;
    cfg.maxFileCount = logging.maxFileCount;
    cfg.async = logging.async;
    cfg.jsonLines = logging.jsonLines;
    return cfg;
}

Security::AclLimits Settings::ToAclLimits() const noexcept {
    Security::AclLimits limits;
    limits.defaultBufferSize = acl.defaultBufferSize;
    limits.maxSecurityDescriptorBytes = acl.maxSecurityDescriptorBytes;
    return limits;
}

void Settings::Apply() const {
    Utils::Logger::Instance().Initialize(ToLoggerConfig());
    Security::SetLimits(ToAclLimits());
    AK_LOG_INFO(L"Config", L"settings applied (level=%ls, bufferSize=%d, maxDescriptor=%u)",
                Utils::Logger::LevelToString(logging.level), acl.defaultBufferSize, acl.maxSecurityDescriptorBytes);
}

}  // namespace Config
}  // namespace AclKit
