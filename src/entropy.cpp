#include "entropy.hpp"
#include <array>
#include <cmath>

namespace leakscan {

double shannon_entropy(std::string_view data) {
    if (data.empty()) return 0.0;

    std::array<size_t, 256> counts{};
    for (char c : data) counts[static_cast<unsigned char>(c)]++;

    double total = static_cast<double>(data.size());
    double h = 0.0;
    for (size_t count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / total;
        h -= p * std::log2(p);
    }
    return h;
}

} // namespace leakscan
