#pragma once

#include "output/output.hpp"

#include <optional>
#include <string>

class WaylandClipboardOutput : public OutputMethod {
public:
    std::expected<void, Error> deliver(const std::string& text) override;

    // Current text selection, nullopt when empty or unavailable.
    std::optional<std::string> current_text();
};
