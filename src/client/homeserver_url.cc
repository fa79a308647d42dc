#include "homeserver_url.h"

namespace Reloaded {

namespace {

constexpr const char* kSchemes[] = {"https://", "http://"};

} // namespace

std::pair<std::string, std::string> ParseHomeserver(const std::string& homeserver,
		const std::optional<std::string>& protocol) {
	for (const char* scheme : kSchemes) {
		std::string prefix(scheme);
		if (homeserver.compare(0, prefix.size(), prefix) == 0) {
			return {homeserver.substr(prefix.size()), homeserver};
		}
	}
	return {homeserver, protocol.value_or("https") + "://" + homeserver};
}

std::string MakeUserId(const std::string& localpart, const std::string& domain) {
	return "@" + localpart + ":" + domain;
}

std::string MakeLocalpart(size_t ordinal, uint64_t execution_id) {
	return "user_" + std::to_string(ordinal) + "_" + std::to_string(execution_id);
}

} // namespace Reloaded
