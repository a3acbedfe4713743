#pragma once

#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

// Encodes mono F32 samples into an IEEE-float WAV file in memory.
namespace wav {

constexpr size_t header_size = 58;

// RIFF sizes are 32-bit; longer recordings cannot be expressed.
constexpr size_t max_samples = (std::numeric_limits<uint32_t>::max() - (header_size - 8)) / sizeof(float);

constexpr bool fits(size_t sample_count) {
    return sample_count <= max_samples;
}

// Throws std::length_error when the samples do not fit in a WAV file.
inline std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate) {
    if (!fits(samples.size())) {
        throw std::length_error("too many samples for a WAV file");
    }

    constexpr uint16_t format_ieee_float = 3;
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 32;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(float));
    // Non-PCM formats carry an 18-byte fmt chunk and a fact chunk.
    uint32_t riff_size = static_cast<uint32_t>(header_size - 8) + data_size;

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(riff_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(18);
    w16(format_ieee_float);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w16(0);                 // cbSize
    w("fact", 4);
    w32(4);
    w32(static_cast<uint32_t>(samples.size()));
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

} // namespace wav
