#include "audio_types.hpp"

namespace callscribe::audio {

std::string InterleavedFrame::ToBytes() const {
  std::string out;
  out.resize(samples.size() * 2);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto v   = static_cast<std::uint16_t>(samples[i]);
    out[2 * i]     = static_cast<char>(v & 0xFF);
    out[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
  }
  return out;
}

std::vector<int16_t> DecodePcm16(std::string_view bytes) {
  std::vector<int16_t> samples(bytes.size() / 2);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto lo = static_cast<std::uint8_t>(bytes[2 * i]);
    const auto hi = static_cast<std::uint8_t>(bytes[2 * i + 1]);
    samples[i]    = static_cast<int16_t>(static_cast<std::uint16_t>(lo | (hi << 8)));
  }
  return samples;
}

} // namespace callscribe::audio
