#pragma once

#include "audio_chunk.hpp"

#include <expected>
#include <mutex>
#include <string>
#include <vector>

// Holds the frames of the current session only. The controller appends while
// recording and moves everything out exactly once with take().
class StreamingAccumulator {
public:
    StreamingAccumulator() = default;

    StreamingAccumulator(const StreamingAccumulator&) = delete;
    StreamingAccumulator& operator=(const StreamingAccumulator&) = delete;

    void append(RawAudioChunk chunk);

    // Concatenate and empty. Fails when the session saw no audio or when the
    // chunks disagree on rate or channel count.
    std::expected<AccumulatedAudio, std::string> take();

    void clear();

    bool empty() const;
    size_t chunk_count() const;
    size_t sample_count() const;

    // Overall RMS over everything buffered, normalized to 0..1.
    double rms() const;

private:
    mutable std::mutex mutex_;
    std::vector<RawAudioChunk> chunks_;
    size_t sample_count_ = 0;
};
