#pragma once

#include "output.hpp"
#include "platform/key_injector.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Splits UTF-8 text into code points. Invalid lead bytes become one-byte glyphs.
std::vector<std::string_view> split_glyphs(std::string_view text);

class TypeOutput : public OutputMethod {
public:
    TypeOutput(KeyInjector& injector, std::chrono::duration<double> delay);

    // Normalizes whitespace, then types the result.
    std::expected<void, std::string> deliver(const std::string& text) override;

    // Types every character with `delay` between consecutive characters.
    // A failed character is logged and skipped. Returns the failure count.
    size_t type_text(std::string_view text);

private:
    KeyInjector& injector_;
    std::chrono::duration<double> delay_;
};
