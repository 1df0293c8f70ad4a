#pragma once

#include <expected>
#include <string>

class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    // Partial delivery still reports an error; callers only log it.
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
