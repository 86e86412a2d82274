#include "fragment_marker.hpp"

#include <algorithm>

namespace callscribe::media {

namespace {

bool IsNumeric(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view StripLeadingZeros(std::string_view s) {
  while (s.size() > 1 && s.front() == '0') s.remove_prefix(1);
  return s;
}

} // namespace

int CompareFragmentMarkers(std::string_view a, std::string_view b) {
  if (IsNumeric(a) && IsNumeric(b)) {
    a = StripLeadingZeros(a);
    b = StripLeadingZeros(b);
    if (a.size() != b.size()) {
      return a.size() < b.size() ? -1 : 1;
    }
  }
  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace callscribe::media
