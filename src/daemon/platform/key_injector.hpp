#pragma once

#include "errors.hpp"

#include <expected>
#include <string_view>

// Types a single character (one UTF-8 encoded code point) as a key
// press/release pair at the current cursor position.
class KeyInjector {
public:
    virtual ~KeyInjector() = default;
    virtual std::expected<void, Error> type_char(std::string_view glyph) = 0;
};
