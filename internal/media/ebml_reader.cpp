#include "ebml_reader.hpp"

#include <algorithm>
#include <sstream>

#include "ebml_ids.hpp"

namespace callscribe::media {

namespace {

struct Vint {
  enum class Status { kOk, kNeedMore, kInvalid };

  Status        status  = Status::kNeedMore;
  std::uint64_t value   = 0;
  std::size_t   length  = 0;
  bool          unknown = false;
};

/*
  EBML variable-length integer. Ids keep the marker bit (max 4 bytes),
  sizes drop it (max 8 bytes) and an all-ones size means "unknown".
*/
Vint ReadVint(const std::uint8_t* p, std::size_t avail, std::size_t max_length, bool keep_marker) {
  Vint v;
  if (avail == 0) return v;

  const std::uint8_t first  = p[0];
  std::size_t        length = 1;
  std::uint8_t       mask   = 0x80;
  while (length <= 8 && (first & mask) == 0) {
    mask >>= 1;
    ++length;
  }
  if (length > max_length) {
    v.status = Vint::Status::kInvalid;
    return v;
  }
  if (avail < length) return v;

  const std::uint8_t value_bits = static_cast<std::uint8_t>(mask - 1);
  v.value                       = keep_marker ? first : (first & value_bits);
  bool all_ones                 = (first & value_bits) == value_bits;
  for (std::size_t i = 1; i < length; ++i) {
    v.value  = (v.value << 8) | p[i];
    all_ones = all_ones && p[i] == 0xFF;
  }
  v.status  = Vint::Status::kOk;
  v.length  = length;
  v.unknown = !keep_marker && all_ones;
  return v;
}

std::string HexId(std::uint32_t id) {
  std::ostringstream out;
  out << "0x" << std::hex << std::uppercase << id;
  return out.str();
}

// -1: element the reader does not know the nesting level of
int ElementLevel(std::uint32_t id) {
  switch (id) {
    case ebml::kEbmlHeader:
    case ebml::kSegment:
      return 0;
    case ebml::kInfo:
    case ebml::kTracks:
    case ebml::kCluster:
    case ebml::kTags:
    case ebml::kCues:
    case ebml::kSeekHead:
      return 1;
    case ebml::kTimecodeScale:
    case ebml::kTrackEntry:
    case ebml::kTimecode:
    case ebml::kSimpleBlock:
    case ebml::kBlockGroup:
    case ebml::kTag:
      return 2;
    case ebml::kTrackNumber:
    case ebml::kName:
    case ebml::kBlock:
    case ebml::kSimpleTag:
      return 3;
    case ebml::kTagName:
    case ebml::kTagString:
      return 4;
    default:
      return -1;
  }
}

bool IsDescendedMaster(std::uint32_t id) {
  switch (id) {
    case ebml::kSegment:
    case ebml::kInfo:
    case ebml::kTracks:
    case ebml::kTrackEntry:
    case ebml::kCluster:
    case ebml::kBlockGroup:
    case ebml::kTags:
    case ebml::kTag:
    case ebml::kSimpleTag:
      return true;
    default:
      return false;
  }
}

bool IsReadLeaf(std::uint32_t id) {
  switch (id) {
    case ebml::kTimecodeScale:
    case ebml::kTrackNumber:
    case ebml::kName:
    case ebml::kTimecode:
    case ebml::kSimpleBlock:
    case ebml::kBlock:
    case ebml::kTagName:
    case ebml::kTagString:
      return true;
    default:
      return false;
  }
}

} // namespace

EbmlReader::EbmlReader(std::size_t max_element_bytes) : max_element_bytes_(max_element_bytes) {
}

void EbmlReader::Feed(std::string_view bytes) {
  buf_.append(bytes.data(), bytes.size());
}

std::optional<EbmlEvent> EbmlReader::Next() {
  while (true) {
    if (skip_ > 0) {
      const auto n = std::min<std::uint64_t>(skip_, buf_.size() - pos_);
      pos_ += static_cast<std::size_t>(n);
      skip_ -= n;
      Compact();
      if (skip_ > 0) return std::nullopt;
    }

    const std::uint64_t here = Position();
    if (!stack_.empty() && stack_.back().end && *stack_.back().end <= here) {
      return CloseTop();
    }

    const auto*       p     = reinterpret_cast<const std::uint8_t*>(buf_.data()) + pos_;
    const std::size_t avail = buf_.size() - pos_;

    const Vint id = ReadVint(p, avail, 4, true);
    if (id.status == Vint::Status::kNeedMore) return std::nullopt;
    if (id.status == Vint::Status::kInvalid) {
      ++pos_;
      if (resyncing_) continue;
      resyncing_ = true;
      return Error("invalid element id at offset " + std::to_string(here));
    }

    const Vint size = ReadVint(p + id.length, avail - id.length, 8, false);
    if (size.status == Vint::Status::kNeedMore) return std::nullopt;
    if (size.status == Vint::Status::kInvalid) {
      ++pos_;
      if (resyncing_) continue;
      resyncing_ = true;
      return Error("invalid element size at offset " + std::to_string(here));
    }
    resyncing_ = false;

    const auto          element_id = static_cast<std::uint32_t>(id.value);
    const std::size_t   header_len = id.length + size.length;
    const int           level      = ElementLevel(element_id);
    const std::uint64_t body_start = here + header_len;

    // an unknown-size master ends where a sibling or an ancestor-level element starts
    if (level >= 0 && !stack_.empty() && !stack_.back().end && stack_.back().level >= level) {
      return CloseTop();
    }

    if (!size.unknown && !stack_.empty() && stack_.back().end && body_start + size.value > *stack_.back().end) {
      skip_ = *stack_.back().end - here;
      return Error("element " + HexId(element_id) + " overruns its parent at offset " + std::to_string(here));
    }

    if (IsDescendedMaster(element_id)) {
      pos_ += header_len;
      OpenMaster master;
      master.id    = element_id;
      master.level = level;
      if (!size.unknown) master.end = body_start + size.value;
      stack_.push_back(master);
      EbmlEvent event;
      event.kind = EbmlEvent::Kind::kMasterStart;
      event.id   = element_id;
      return event;
    }

    if (size.unknown) {
      // nothing to skip to; carry on with whatever follows the header
      pos_ += header_len;
      if (IsReadLeaf(element_id)) {
        return Error("leaf element with unknown size at offset " + std::to_string(here));
      }
      continue;
    }

    if (IsReadLeaf(element_id)) {
      if (size.value > max_element_bytes_) {
        pos_ += header_len;
        skip_ = size.value;
        return Error("element of " + std::to_string(size.value) + " bytes exceeds limit at offset " + std::to_string(here));
      }
      if (avail < header_len + size.value) return std::nullopt;

      EbmlEvent event;
      event.kind = EbmlEvent::Kind::kLeaf;
      event.id   = element_id;
      event.data.assign(buf_, pos_ + header_len, static_cast<std::size_t>(size.value));
      pos_ += header_len + static_cast<std::size_t>(size.value);
      Compact();
      return event;
    }

    pos_ += header_len;
    skip_ = size.value;
  }
}

std::vector<EbmlEvent> EbmlReader::Finish() {
  std::vector<EbmlEvent> events;
  while (!stack_.empty()) {
    events.push_back(CloseTop());
  }
  return events;
}

EbmlEvent EbmlReader::CloseTop() {
  EbmlEvent event;
  event.kind = EbmlEvent::Kind::kMasterEnd;
  event.id   = stack_.back().id;
  stack_.pop_back();
  return event;
}

EbmlEvent EbmlReader::Error(std::string message) {
  EbmlEvent event;
  event.kind = EbmlEvent::Kind::kDecodeError;
  event.data = std::move(message);
  return event;
}

void EbmlReader::Compact() {
  if (pos_ == 0) return;
  if (pos_ == buf_.size() || pos_ >= 64 * 1024) {
    buf_.erase(0, pos_);
    base_ += pos_;
    pos_ = 0;
  }
}

} // namespace callscribe::media
