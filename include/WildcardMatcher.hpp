#pragma once

#include <string>

// Case-insensitive glob match of a single path component.
// '*' matches any run of characters (including none), '?' exactly one.
// '/' has no special meaning here; callers split paths first.
bool WildcardMatches(const std::string& Pattern, const std::string& Name);
