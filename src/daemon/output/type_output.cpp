#include "type_output.hpp"

#include "text_util.hpp"

#include <print>
#include <thread>

std::vector<std::string_view> split_glyphs(std::string_view text) {
    std::vector<std::string_view> glyphs;
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) len = 1;
        glyphs.push_back(text.substr(i, len));
        i += len;
    }
    return glyphs;
}

TypeOutput::TypeOutput(KeyInjector& injector, std::chrono::duration<double> delay)
    : injector_(injector), delay_(delay) {}

std::expected<void, std::string> TypeOutput::deliver(const std::string& text) {
    auto cleaned = normalize_whitespace(text);
    size_t failed = type_text(cleaned);
    if (failed > 0) {
        return std::unexpected(std::to_string(failed) + " of " +
                               std::to_string(split_glyphs(cleaned).size()) +
                               " characters could not be typed");
    }
    return {};
}

size_t TypeOutput::type_text(std::string_view text) {
    size_t failed = 0;
    bool first = true;
    for (auto glyph : split_glyphs(text)) {
        if (!first && delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        first = false;

        auto res = injector_.type_char(glyph);
        if (!res) {
            std::println(stderr, "output: failed to type '{}': {}", glyph, res.error().message);
            failed++;
        }
    }
    return failed;
}
