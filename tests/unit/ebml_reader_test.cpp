#include "internal/media/ebml_reader.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/media/ebml_ids.hpp"
#include "tests/support/mkv_builder.hpp"

namespace {

using callscribe::media::EbmlEvent;
using callscribe::media::EbmlReader;
namespace ebml = callscribe::media::ebml;
using namespace callscribe::testing;

std::vector<EbmlEvent> ReadAll(EbmlReader& reader) {
  std::vector<EbmlEvent> events;
  while (auto event = reader.Next()) events.push_back(*event);
  return events;
}

void TestLeavesAndMastersInOrder() {
  EbmlReader reader;
  reader.Feed(Element(ebml::kCluster, Uint(ebml::kTimecode, 42) + SimpleBlock(1, 0, {1, 2})));

  auto events = ReadAll(reader);
  assert(events.size() == 4);
  assert(events[0].kind == EbmlEvent::Kind::kMasterStart && events[0].id == ebml::kCluster);
  assert(events[1].kind == EbmlEvent::Kind::kLeaf && events[1].id == ebml::kTimecode);
  assert(events[1].data == std::string(1, '\x2A'));
  assert(events[2].kind == EbmlEvent::Kind::kLeaf && events[2].id == ebml::kSimpleBlock);
  assert(events[3].kind == EbmlEvent::Kind::kMasterEnd && events[3].id == ebml::kCluster);
  assert(reader.Depth() == 0);
}

void TestByteAtATimeFeeding() {
  const std::string stream = Element(ebml::kTags, Element(ebml::kTag, SimpleTag("NAME", "value")));

  EbmlReader             reader;
  std::vector<EbmlEvent> events;
  for (char c : stream) {
    reader.Feed(std::string(1, c));
    while (auto event = reader.Next()) events.push_back(*event);
  }

  std::vector<EbmlEvent> leaves;
  for (const auto& e : events) {
    if (e.kind == EbmlEvent::Kind::kLeaf) leaves.push_back(e);
  }
  assert(leaves.size() == 2);
  assert(leaves[0].id == ebml::kTagName && leaves[0].data == "NAME");
  assert(leaves[1].id == ebml::kTagString && leaves[1].data == "value");
  assert(reader.Position() == stream.size());
}

void TestUninterestingElementsAreSkipped() {
  EbmlReader reader;
  // EBML header and Cues are stepped over without events
  reader.Feed(EbmlHeader() + Element(ebml::kCues, std::string(100, 'x')) + Element(ebml::kInfo, Uint(ebml::kTimecodeScale, 1000000)));

  auto events = ReadAll(reader);
  assert(events.size() == 3);
  assert(events[0].id == ebml::kInfo);
  assert(events[1].id == ebml::kTimecodeScale);
}

void TestUnknownSizeSegmentClosedBySibling() {
  EbmlReader reader;
  reader.Feed(OpenUnknown(ebml::kSegment) + Element(ebml::kInfo, "") + OpenUnknown(ebml::kSegment));

  auto events = ReadAll(reader);
  // Segment start, Info start, Info end, Segment end (closed by the next Segment), Segment start
  assert(events.size() == 5);
  assert(events[3].kind == EbmlEvent::Kind::kMasterEnd && events[3].id == ebml::kSegment);
  assert(events[4].kind == EbmlEvent::Kind::kMasterStart && events[4].id == ebml::kSegment);

  auto closing = reader.Finish();
  assert(closing.size() == 1 && closing[0].id == ebml::kSegment);
}

void TestInvalidIdResyncs() {
  EbmlReader reader;
  reader.Feed(std::string("\x00\x00\x00", 3) + Element(ebml::kInfo, ""));

  auto events = ReadAll(reader);
  // one error for the whole run of garbage
  assert(events.size() == 3);
  assert(events[0].kind == EbmlEvent::Kind::kDecodeError);
  assert(events[1].kind == EbmlEvent::Kind::kMasterStart && events[1].id == ebml::kInfo);
}

void TestOverrunSkipsToParentEnd() {
  // a block claiming more bytes than its cluster holds
  std::string block = EncodeId(ebml::kSimpleBlock) + EncodeSize(500) + std::string(10, '\x01');
  std::string body  = Uint(ebml::kTimecode, 1) + block;

  EbmlReader reader;
  reader.Feed(Element(ebml::kCluster, body) + Element(ebml::kCluster, Uint(ebml::kTimecode, 2)));

  auto events = ReadAll(reader);
  int  errors = 0;
  int  timecodes = 0;
  for (const auto& e : events) {
    if (e.kind == EbmlEvent::Kind::kDecodeError) ++errors;
    if (e.kind == EbmlEvent::Kind::kLeaf && e.id == ebml::kTimecode) ++timecodes;
  }
  assert(errors == 1);
  assert(timecodes == 2);
  assert(reader.Depth() == 0);
}

void TestOversizedLeafIsSkipped() {
  EbmlReader reader(16);
  reader.Feed(Element(ebml::kName, std::string(64, 'n')) + Element(ebml::kName, "ok"));

  auto events = ReadAll(reader);
  assert(events.size() == 2);
  assert(events[0].kind == EbmlEvent::Kind::kDecodeError);
  assert(events[1].kind == EbmlEvent::Kind::kLeaf && events[1].data == "ok");
}

} // namespace

int main() {
  TestLeavesAndMastersInOrder();
  TestByteAtATimeFeeding();
  TestUninterestingElementsAreSkipped();
  TestUnknownSizeSegmentClosedBySibling();
  TestInvalidIdResyncs();
  TestOverrunSkipsToParentEnd();
  TestOversizedLeafIsSkipped();

  std::cout << "callscribe_unit_ebml_reader: pass\n";
  return 0;
}
