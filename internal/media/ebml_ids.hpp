#pragma once

#include <cstdint>

namespace callscribe::media::ebml {

// Element ids keep their length-marker bits, as written on the wire.
constexpr std::uint32_t kEbmlHeader    = 0x1A45DFA3;
constexpr std::uint32_t kSegment       = 0x18538067;
constexpr std::uint32_t kInfo          = 0x1549A966;
constexpr std::uint32_t kTimecodeScale = 0x2AD7B1;
constexpr std::uint32_t kTracks        = 0x1654AE6B;
constexpr std::uint32_t kTrackEntry    = 0xAE;
constexpr std::uint32_t kTrackNumber   = 0xD7;
constexpr std::uint32_t kName          = 0x536E;
constexpr std::uint32_t kCluster       = 0x1F43B675;
constexpr std::uint32_t kTimecode      = 0xE7;
constexpr std::uint32_t kSimpleBlock   = 0xA3;
constexpr std::uint32_t kBlockGroup    = 0xA0;
constexpr std::uint32_t kBlock         = 0xA1;
constexpr std::uint32_t kTags          = 0x1254C367;
constexpr std::uint32_t kTag           = 0x7373;
constexpr std::uint32_t kSimpleTag     = 0x67C8;
constexpr std::uint32_t kTagName       = 0x45A3;
constexpr std::uint32_t kTagString     = 0x4487;
constexpr std::uint32_t kCues          = 0x1C53BB6B;
constexpr std::uint32_t kSeekHead      = 0x114D9B74;

} // namespace callscribe::media::ebml
