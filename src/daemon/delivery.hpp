#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

struct DeliveryConfig {
    bool auto_paste = true;
    bool prepend_space = true;
    bool newline_on_break = false;
};

enum class DeliveryAction { Paste, Copy };

struct DeliveryResult {
    std::string normalized_text;
    DeliveryAction action = DeliveryAction::Copy;
    // Text to hand to the paste or clipboard output.
    std::string text;
};

// Normalizes transcripts and decides between auto-paste and clipboard copy.
//
// Holds the only cross-session state of the pipeline: the last delivered
// transcript and the time of the last successful paste. When newline-on-break
// is enabled and at least `break_interval` has passed since that paste, the
// next pasted transcript starts on a new line. No line break is inserted
// before the first paste, since there is no earlier text to separate from.
class TranscriptDelivery {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::string_view blank_marker = "[BLANK_AUDIO]";
    static constexpr std::chrono::milliseconds default_break_interval{6000};

    explicit TranscriptDelivery(std::chrono::milliseconds break_interval = default_break_interval,
                                Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Returns nothing for the blank-audio marker; otherwise remembers the
    // normalized text as the last transcript.
    std::optional<DeliveryResult> process(const std::string& text, const DeliveryConfig& config);

    // Call only after a paste actually succeeded.
    void mark_paste_completed();
    void reset_paste_history();

    const std::optional<std::string>& last_transcript() const { return last_transcript_; }
    std::chrono::milliseconds break_interval() const { return break_interval_; }
    void set_break_interval(std::chrono::milliseconds interval) { break_interval_ = interval; }

    // Without newline-on-break, line breaks become spaces and space runs collapse.
    static std::string normalize(const std::string& text, const DeliveryConfig& config);

private:
    std::string prepare_for_paste(const std::string& normalized, const std::string& trimmed,
                                  const DeliveryConfig& config) const;
    bool should_insert_break() const;

    std::chrono::milliseconds break_interval_;
    Clock clock_;
    std::optional<std::string> last_transcript_;
    std::optional<std::chrono::steady_clock::time_point> last_paste_;
};
