#pragma once

#include <string>

#include "resume/Style.hpp"

namespace resume {

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    // advance width in points of UTF-8 `text` set in `style`
    virtual double text_width(const TextStyle& style, const std::string& text) const = 0;
};

}  // namespace resume
