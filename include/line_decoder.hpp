#pragma once

#include <string_view>
#include <cstddef>

namespace leakscan {

// Splits a buffer into lines without copying. Lines have no length limit,
// so minified single-line bundles of several megabytes come through whole.
// Terminators are '\n' with an optional preceding '\r'; a trailing
// terminator does not produce an extra empty line.
class LineDecoder {
public:
    explicit LineDecoder(std::string_view data) : data_(data) {}

    bool next(std::string_view& line) {
        if (pos_ >= data_.size()) return false;

        size_t end = data_.find('\n', pos_);
        if (end == std::string_view::npos) end = data_.size();

        line = data_.substr(pos_, end - pos_);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        pos_ = end + 1;
        line_number_++;
        return true;
    }

    // 1-based number of the line last returned by next()
    size_t line_number() const { return line_number_; }

private:
    std::string_view data_;
    size_t pos_ = 0;
    size_t line_number_ = 0;
};

} // namespace leakscan
