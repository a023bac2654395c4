#pragma once
#include <string>

// Terminal cells are counted as code points: every code point is assumed to
// take one column, continuation bytes (10xxxxxx) take none.

size_t utf8_length(const std::string& str);

// byte offset of the first n code points, str.size() if str is shorter
size_t utf8_offset(const std::string& str, size_t n);
