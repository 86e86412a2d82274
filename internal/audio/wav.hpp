#pragma once

#include <cstdint>
#include <string>

namespace callscribe::audio {

inline constexpr std::size_t kWavHeaderBytes = 44;

// Canonical 44-byte RIFF/WAVE header for little-endian integer PCM.
std::string WavHeader(std::uint32_t sample_rate_hz, std::uint16_t channels, std::uint16_t bits_per_sample, std::uint32_t data_bytes);

} // namespace callscribe::audio
