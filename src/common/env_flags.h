#pragma once

#include <cstdlib>
#include <cstring>
#include <optional>
#include <strings.h>

namespace Braid {

inline bool IsEnvFalseValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "0") == 0 ||
	       strcasecmp(value, "false") == 0 ||
	       strcasecmp(value, "no") == 0 ||
	       strcasecmp(value, "off") == 0;
}

inline bool IsEnvTrueValue(const char* value) {
	if (!value || !value[0]) return false;
	return std::strcmp(value, "1") == 0 ||
	       strcasecmp(value, "true") == 0 ||
	       strcasecmp(value, "yes") == 0 ||
	       strcasecmp(value, "on") == 0;
}

// nullopt when the variable is unset or holds something that is neither true nor false.
inline std::optional<bool> ReadEnvBool(const char* env_name) {
	const char* env = std::getenv(env_name);
	if (!env) return std::nullopt;
	if (IsEnvTrueValue(env)) return true;
	if (IsEnvFalseValue(env)) return false;
	return std::nullopt;
}

}  // namespace Braid
