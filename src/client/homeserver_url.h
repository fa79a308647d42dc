#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace Reloaded {

/**
 * Splits a homeserver argument into its domain and full url:
 *  - ParseHomeserver("matrix.domain.com") => ("matrix.domain.com", "https://matrix.domain.com")
 *  - ParseHomeserver("http://matrix.domain.com") => ("matrix.domain.com", "http://matrix.domain.com")
 */
std::pair<std::string, std::string> ParseHomeserver(const std::string& homeserver,
		const std::optional<std::string>& protocol = std::nullopt);

// "@localpart:domain"
std::string MakeUserId(const std::string& localpart, const std::string& domain);

// "user_<ordinal>_<execution_id>"
std::string MakeLocalpart(size_t ordinal, uint64_t execution_id);

} // namespace Reloaded
