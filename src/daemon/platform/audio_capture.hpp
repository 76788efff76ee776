#pragma once

#include <cstdint>
#include <expected>
#include <string>

// Input device at its native format. Frames go into the RingBuffer handed to
// the implementation; nothing else crosses from the audio thread.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    // Fails (device unavailable, stream error) without leaving anything open.
    virtual std::expected<void, std::string> start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    // Valid once the format is negotiated; 0 before that.
    virtual uint32_t native_rate() const = 0;
    virtual uint8_t channel_count() const = 0;

    // RMS of the most recent callback buffer, 0..1.
    virtual float level() const = 0;
};
