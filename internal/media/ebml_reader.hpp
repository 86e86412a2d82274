#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe::media {

struct EbmlEvent {
  enum class Kind {
    kMasterStart,
    kMasterEnd,
    kLeaf,
    kDecodeError,
  };

  Kind          kind = Kind::kLeaf;
  std::uint32_t id   = 0;
  // leaf payload, or a description for kDecodeError
  std::string data;
};

/*
  Incremental EBML (Matroska) element reader.

  Bytes are pushed with Feed() as they arrive; Next() yields events as soon
  as enough input is buffered. Only the masters the demuxer cares about are
  descended into and only the leaves it reads are buffered; every other
  element is skipped as its bytes stream past, so memory stays bounded by
  the largest interesting leaf.

  Masters of unknown size are closed when an element of the same or a
  higher level starts. A malformed element yields a kDecodeError and only
  that element is skipped.
*/
class EbmlReader {
 public:
  explicit EbmlReader(std::size_t max_element_bytes = 4 * 1024 * 1024);

  void Feed(std::string_view bytes);

  // std::nullopt: more input needed.
  std::optional<EbmlEvent> Next();

  // End of input: closes every open master, innermost first.
  std::vector<EbmlEvent> Finish();

  std::uint64_t Position() const {
    return base_ + pos_;
  }

  std::size_t Depth() const {
    return stack_.size();
  }

 private:
  struct OpenMaster {
    std::uint32_t                id    = 0;
    int                          level = 0;
    std::optional<std::uint64_t> end;
  };

  EbmlEvent CloseTop();
  EbmlEvent Error(std::string message);
  void      Compact();

  std::size_t             max_element_bytes_;
  std::string             buf_;
  std::size_t             pos_  = 0;
  std::uint64_t           base_ = 0;
  std::uint64_t           skip_ = 0;
  bool                    resyncing_ = false;
  std::vector<OpenMaster> stack_;
};

} // namespace callscribe::media
