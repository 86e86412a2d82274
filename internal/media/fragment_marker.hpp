#pragma once

#include <string_view>

namespace callscribe::media {

/*
  Orders fragment markers.

  Markers are unsigned decimal numbers too long for any integer type, so
  numeric markers compare by length then lexicographically. Anything that is
  not purely digits falls back to plain lexicographic order.

  Returns <0, 0 or >0.
*/
int CompareFragmentMarkers(std::string_view a, std::string_view b);

} // namespace callscribe::media
