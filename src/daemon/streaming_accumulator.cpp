#include "streaming_accumulator.hpp"

#include <cmath>
#include <format>

void StreamingAccumulator::append(RawAudioChunk chunk) {
    if (chunk.samples.empty()) return;
    std::lock_guard lock(mutex_);
    sample_count_ += chunk.samples.size();
    chunks_.push_back(std::move(chunk));
}

std::expected<AccumulatedAudio, std::string> StreamingAccumulator::take() {
    std::vector<RawAudioChunk> chunks;
    size_t total = 0;
    {
        std::lock_guard lock(mutex_);
        chunks.swap(chunks_);
        total = sample_count_;
        sample_count_ = 0;
    }

    if (chunks.empty()) {
        return std::unexpected("no audio captured");
    }

    AccumulatedAudio out;
    out.sample_rate = chunks.front().native_sample_rate;
    out.channel_count = chunks.front().channel_count;
    out.samples.reserve(total);

    for (auto& c : chunks) {
        if (c.native_sample_rate != out.sample_rate || c.channel_count != out.channel_count) {
            return std::unexpected(std::format(
                "format changed mid-session ({} Hz/{} ch -> {} Hz/{} ch)",
                out.sample_rate, out.channel_count, c.native_sample_rate, c.channel_count));
        }
        out.samples.insert(out.samples.end(), c.samples.begin(), c.samples.end());
        // Release each chunk as soon as it is copied.
        std::vector<int16_t>().swap(c.samples);
    }
    return out;
}

void StreamingAccumulator::clear() {
    std::lock_guard lock(mutex_);
    chunks_.clear();
    sample_count_ = 0;
}

bool StreamingAccumulator::empty() const {
    std::lock_guard lock(mutex_);
    return chunks_.empty();
}

size_t StreamingAccumulator::chunk_count() const {
    std::lock_guard lock(mutex_);
    return chunks_.size();
}

size_t StreamingAccumulator::sample_count() const {
    std::lock_guard lock(mutex_);
    return sample_count_;
}

double StreamingAccumulator::rms() const {
    std::lock_guard lock(mutex_);
    if (sample_count_ == 0) return 0.0;

    double sum_sq = 0.0;
    for (const auto& c : chunks_) {
        for (int16_t s : c.samples) {
            double v = s / 32768.0;
            sum_sq += v * v;
        }
    }
    return std::sqrt(sum_sq / static_cast<double>(sample_count_));
}
