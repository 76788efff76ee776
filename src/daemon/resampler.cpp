#include "resampler.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace {

int16_t to_sample(double v) {
    return static_cast<int16_t>(std::clamp(std::lround(v), -32768L, 32767L));
}

std::vector<int16_t> downmix(std::vector<int16_t> interleaved, size_t channels) {
    if (channels == 1) return interleaved;

    size_t frames = interleaved.size() / channels;
    std::vector<int16_t> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        int32_t sum = 0;
        for (size_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = static_cast<int16_t>(sum / static_cast<int32_t>(channels));
    }
    return mono;
}

} // namespace

Resampler::Resampler(uint32_t target_rate) : target_rate_(target_rate) {}

size_t Resampler::expected_length(size_t input_frames, uint32_t in_rate, uint32_t out_rate) {
    if (in_rate == 0) return 0;
    double exact = static_cast<double>(input_frames) * out_rate / in_rate;
    return static_cast<size_t>(std::llround(exact));
}

std::expected<ResampledBuffer, std::string> Resampler::convert(AccumulatedAudio audio) const {
    if (target_rate_ == 0) {
        return std::unexpected("target sample rate is zero");
    }
    if (audio.sample_rate == 0) {
        return std::unexpected("input sample rate is zero");
    }
    if (audio.channel_count == 0) {
        return std::unexpected("input has zero channels");
    }
    if (audio.samples.empty()) {
        return std::unexpected("no samples to convert");
    }
    if (audio.samples.size() % audio.channel_count != 0) {
        return std::unexpected(std::format("{} samples is not a whole number of {}-channel frames",
                                           audio.samples.size(), audio.channel_count));
    }

    auto mono = downmix(std::move(audio.samples), audio.channel_count);
    const size_t n = mono.size();

    ResampledBuffer out;
    out.sample_rate = target_rate_;

    if (audio.sample_rate == target_rate_) {
        out.samples = std::move(mono);
        return out;
    }

    const size_t out_n = expected_length(n, audio.sample_rate, target_rate_);
    if (out_n == 0) {
        return std::unexpected(std::format("{} frames at {} Hz is too short to convert to {} Hz",
                                           n, audio.sample_rate, target_rate_));
    }

    const double ratio = static_cast<double>(audio.sample_rate) / target_rate_;
    out.samples.resize(out_n);

    if (ratio > 1.0) {
        // Decimating: average each output sample's source span (box filter).
        for (size_t i = 0; i < out_n; ++i) {
            size_t lo = std::min(n - 1, static_cast<size_t>(i * ratio));
            size_t hi = std::min(n, static_cast<size_t>((i + 1) * ratio));
            if (hi <= lo) hi = lo + 1;

            double sum = 0.0;
            for (size_t k = lo; k < hi; ++k) sum += mono[k];
            out.samples[i] = to_sample(sum / static_cast<double>(hi - lo));
        }
    } else {
        // Interpolating: linear between neighbours.
        for (size_t i = 0; i < out_n; ++i) {
            double pos = i * ratio;
            size_t i0 = std::min(n - 1, static_cast<size_t>(pos));
            size_t i1 = std::min(n - 1, i0 + 1);
            double frac = pos - static_cast<double>(i0);
            out.samples[i] = to_sample(mono[i0] + (mono[i1] - mono[i0]) * frac);
        }
    }

    return out;
}
