#pragma once

#include <functional>

class AudioCapture {
public:
    // Peak amplitude of the last metering period, 0.0..1.0.
    using LevelHandler = std::function<void(float)>;

    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    // Invoked from the capture thread while capturing. Set before start().
    virtual void set_level_handler(LevelHandler handler) = 0;
};
