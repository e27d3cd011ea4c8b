#pragma once

#include <biotok/types.hpp>

#include <string>

namespace biotok::text {

// Lowercases A-Z only; other bytes, including non-ASCII, pass through
std::string to_lower_ascii(std::string s);

void fold_case(SubTokens& sub_tokens);

}  // namespace biotok::text
