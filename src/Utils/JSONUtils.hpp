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
 * @file JSONUtils.hpp
 * @brief nlohmann/json wrappers used by the settings loader.
 *
 * - Parsing with depth and size limits
 * - Loading from file (UTF-8 BOM stripped)
 * - JSON Pointer and dot/bracket path navigation
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <new>

#include <nlohmann/json.hpp>

namespace AclKit {
	namespace Utils {
		namespace JSON {

			using Json = nlohmann::json;

			/// Maximum nesting depth accepted by Parse
			inline constexpr size_t MAX_JSON_DEPTH = 256;

			/// Default file size limit for LoadFromFile (4MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 4ULL * 1024 * 1024;

			/**
			 * @brief Error information for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< 1-based, 0 = unknown
				size_t column = 0;                ///< 1-based, 0 = unknown

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			struct ParseOptions {
				bool allowComments = true;         ///< Accept // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;
			};

			/**
			 * @brief Parse JSON text.
			 * @param out Cleared on failure
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Load and parse a JSON file.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Convert path-like string to JSON Pointer.
			 *
			 * "a.b[0].c" becomes "/a/b/0/c"; strings starting with '/' pass through.
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/**
			 * @brief Typed lookup.
			 * @param out Unchanged on failure
			 * @return true if the path exists and converts to T
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const Json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const Json::exception&) {
					return false;
				}
				catch (const std::bad_alloc&) {
					return false;
				}
			}

			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Validate that required keys exist in an object.
			 * @param objectPathLike Path to the object ("/" for root)
			 */
			[[nodiscard]] bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                               const std::vector<std::string>& requiredKeys,
			                               Error* err = nullptr) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace AclKit
