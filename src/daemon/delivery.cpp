#include "delivery.hpp"

#include "text_util.hpp"

TranscriptDelivery::TranscriptDelivery(std::chrono::milliseconds break_interval, Clock clock)
    : break_interval_(break_interval), clock_(std::move(clock)) {}

std::optional<DeliveryResult> TranscriptDelivery::process(const std::string& text,
                                                          const DeliveryConfig& config) {
    auto normalized = normalize(text, config);
    auto trimmed = text::trim(normalized);
    if (trimmed == blank_marker) return std::nullopt;

    last_transcript_ = normalized;

    if (config.auto_paste) {
        auto outgoing = prepare_for_paste(normalized, trimmed, config);
        return DeliveryResult{
            .normalized_text = normalized,
            .action = DeliveryAction::Paste,
            .text = std::move(outgoing),
        };
    }
    return DeliveryResult{
        .normalized_text = normalized,
        .action = DeliveryAction::Copy,
        .text = normalized,
    };
}

void TranscriptDelivery::mark_paste_completed() {
    last_paste_ = clock_();
}

void TranscriptDelivery::reset_paste_history() {
    last_paste_.reset();
}

std::string TranscriptDelivery::normalize(const std::string& text, const DeliveryConfig& config) {
    if (config.newline_on_break) return text;

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (size_t n = text::newline_length(text, pos)) {
            c = ' ';
            pos += n;
        } else {
            ++pos;
        }
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        out.push_back(c);
    }
    return out;
}

std::string TranscriptDelivery::prepare_for_paste(const std::string& normalized,
                                                  const std::string& trimmed,
                                                  const DeliveryConfig& config) const {
    if (normalized.empty()) return normalized;

    std::string prefix;
    if (config.newline_on_break && should_insert_break() && !trimmed.empty() &&
        !normalized.starts_with('\n')) {
        prefix.push_back('\n');
    }
    if (config.prepend_space && !trimmed.empty() && !text::starts_with_whitespace(normalized)) {
        prefix.push_back(' ');
    }
    return prefix + normalized;
}

bool TranscriptDelivery::should_insert_break() const {
    if (!last_paste_) return false;
    return clock_() - *last_paste_ >= break_interval_;
}
