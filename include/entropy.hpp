#pragma once
#include <string_view>

namespace leakscan {

// Shannon entropy of the byte distribution, in bits per character.
// 0.0 for empty input or a single repeated byte, at most 8.0.
double shannon_entropy(std::string_view data);

} // namespace leakscan
