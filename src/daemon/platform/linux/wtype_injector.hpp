#pragma once

#include "platform/key_injector.hpp"

#include <string>

// Injects keystrokes through the wtype virtual-keyboard client.
class WtypeInjector : public KeyInjector {
public:
    explicit WtypeInjector(std::string program = "wtype");
    std::expected<void, Error> type_char(std::string_view glyph) override;

private:
    std::string program_;
};
