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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"
#include "Logger.hpp"

namespace AclKit {
    namespace Utils {
        namespace JSON {

            namespace {

                void SetError(Error* err, std::string msg, size_t byteOffset = 0) noexcept {
                    if (!err) return;
                    try {
                        err->message = std::move(msg);
                    }
                    catch (const std::bad_alloc&) {
                        err->message.clear();
                    }
                    err->byteOffset = byteOffset;
                }

                /// Derives 1-based line/column for a byte offset reported by the parser
                void FillLineColumn(Error* err, std::string_view text, size_t byteOffset) noexcept {
                    if (!err || byteOffset == 0) return;
                    size_t line = 1;
                    size_t column = 1;
                    const size_t limit = std::min(byteOffset - 1, text.size());
                    for (size_t i = 0; i < limit; ++i) {
                        if (text[i] == '\n') {
                            ++line;
                            column = 1;
                        }
                        else {
                            ++column;
                        }
                    }
                    err->line = line;
                    err->column = column;
                }

                [[nodiscard]] std::string_view StripUtf8Bom(std::string_view text) noexcept {
                    if (text.size() >= 3 &&
                        static_cast<unsigned char>(text[0]) == 0xEF &&
                        static_cast<unsigned char>(text[1]) == 0xBB &&
                        static_cast<unsigned char>(text[2]) == 0xBF) {
                        text.remove_prefix(3);
                    }
                    return text;
                }
            }

            bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
                out = Json();
                if (err) err->clear();

                size_t depth = 0;
                bool tooDeep = false;
                const size_t maxDepth = opt.maxDepth;

                const Json::parser_callback_t limiter =
                    [&depth, &tooDeep, maxDepth](int /*level*/, Json::parse_event_t event, Json& /*parsed*/) -> bool {
                        switch (event) {
                        case Json::parse_event_t::object_start:
                        case Json::parse_event_t::array_start:
                            if (++depth > maxDepth) {
                                tooDeep = true;
                            }
                            break;
                        case Json::parse_event_t::object_end:
                        case Json::parse_event_t::array_end:
                            if (depth > 0) --depth;
                            break;
                        default:
                            break;
                        }
                        return !tooDeep;
                    };

                try {
                    Json parsed = Json::parse(jsonText.begin(), jsonText.end(), limiter, true, opt.allowComments);
                    if (tooDeep) {
                        SetError(err, "Maximum nesting depth exceeded");
                        return false;
                    }
                    out = std::move(parsed);
                    return true;
                }
                catch (const Json::parse_error& e) {
                    SetError(err, e.what(), e.byte);
                    FillLineColumn(err, jsonText, e.byte);
                }
                catch (const Json::exception& e) {
                    SetError(err, e.what());
                }
                catch (const std::bad_alloc&) {
                    SetError(err, "Memory allocation failed");
                }
                out = Json();
                return false;
            }

            bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
                              const ParseOptions& opt, size_t maxBytes) noexcept {
                out = Json();
                if (err) err->clear();

                try {
                    std::string text;
                    FileUtils::Error ferr;
                    if (!FileUtils::ReadAllTextUtf8(path.wstring(), text, &ferr)) {
                        SetError(err, "Cannot read file: " + ferr.message + " (win32=" + std::to_string(ferr.win32) + ")");
                        if (err) err->path = path;
                        return false;
                    }
                    if (text.size() > maxBytes) {
                        SetError(err, "File exceeds size limit");
                        if (err) err->path = path;
                        return false;
                    }

                    if (!Parse(StripUtf8Bom(text), out, err, opt)) {
                        if (err) err->path = path;
                        AK_LOG_WARN(L"JSON", L"parse failed for %ls", path.wstring().c_str());
                        return false;
                    }
                    return true;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, "Memory allocation failed");
                    return false;
                }
            }

            std::string ToJsonPointer(std::string_view pathLike) noexcept {
                try {
                    if (pathLike.empty() || pathLike == "/") {
                        return "/";
                    }
                    if (pathLike.front() == '/') {
                        return std::string(pathLike);
                    }

                    std::string out;
                    out.reserve(pathLike.size() + 8);
                    std::string token;

                    auto flush = [&]() {
                        if (token.empty()) return;
                        out.push_back('/');
                        for (const char c : token) {
                            // RFC 6901 escaping
                            if (c == '~') out += "~0";
                            else if (c == '/') out += "~1";
                            else out.push_back(c);
                        }
                        token.clear();
                    };

                    for (const char c : pathLike) {
                        if (c == '.' || c == '[' || c == ']') {
                            flush();
                        }
                        else {
                            token.push_back(c);
                        }
                    }
                    flush();
                    return out.empty() ? std::string("/") : out;
                }
                catch (const std::bad_alloc&) {
                    return "/";
                }
            }

            bool Contains(const Json& j, std::string_view pathLike) noexcept {
                try {
                    const auto jp = ToJsonPointer(pathLike);
                    if (jp == "/") return true;
                    return j.contains(Json::json_pointer(jp));
                }
                catch (const Json::exception&) {
                    return false;
                }
                catch (const std::bad_alloc&) {
                    return false;
                }
            }

            bool RequireKeys(const Json& j, std::string_view objectPathLike,
                             const std::vector<std::string>& requiredKeys, Error* err) noexcept {
                try {
                    const auto jp = ToJsonPointer(objectPathLike);
                    const Json* obj = &j;
                    if (jp != "/") {
                        const Json::json_pointer ptr(jp);
                        if (!j.contains(ptr)) {
                            SetError(err, "Missing object: " + jp);
                            return false;
                        }
                        obj = &j.at(ptr);
                    }

                    if (!obj->is_object()) {
                        SetError(err, "Not an object: " + jp);
                        return false;
                    }

                    for (const auto& key : requiredKeys) {
                        if (!obj->contains(key)) {
                            SetError(err, "Missing required key: " + key);
                            return false;
                        }
                    }
                    return true;
                }
                catch (const Json::exception& e) {
                    SetError(err, e.what());
                    return false;
                }
                catch (const std::bad_alloc&) {
                    SetError(err, "Memory allocation failed");
                    return false;
                }
            }

        }  // namespace JSON
    }  // namespace Utils
}  // namespace AclKit
