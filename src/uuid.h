#pragma once

#include <string>

namespace modelsmith::utils
{
// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string make_uuid();

bool is_safe_identifier(const std::string& value);
} // namespace modelsmith::utils
