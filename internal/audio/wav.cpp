#include "wav.hpp"

namespace callscribe::audio {

namespace {

void PutU32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void PutU16(std::string& out, std::uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

} // namespace

std::string WavHeader(std::uint32_t sample_rate_hz, std::uint16_t channels, std::uint16_t bits_per_sample, std::uint32_t data_bytes) {
  const std::uint16_t block_align = static_cast<std::uint16_t>(channels * bits_per_sample / 8);

  std::string out;
  out.reserve(kWavHeaderBytes);
  out += "RIFF";
  PutU32(out, 36 + data_bytes);
  out += "WAVE";
  out += "fmt ";
  PutU32(out, 16);
  PutU16(out, 1); // PCM
  PutU16(out, channels);
  PutU32(out, sample_rate_hz);
  PutU32(out, sample_rate_hz * block_align);
  PutU16(out, block_align);
  PutU16(out, bits_per_sample);
  out += "data";
  PutU32(out, data_bytes);
  return out;
}

} // namespace callscribe::audio
