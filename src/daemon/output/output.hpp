#pragma once

#include "error.hpp"

#include <expected>
#include <string>

class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, Error> deliver(const std::string& text) = 0;
};
