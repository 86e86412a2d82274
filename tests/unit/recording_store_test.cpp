#include "internal/recording/recording_store.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/audio/wav.hpp"
#include "internal/recording/recording_finalizer.hpp"

namespace {

using callscribe::recording::RecordingFinalizer;
using callscribe::recording::RecordingOptions;
using callscribe::recording::RecordingStore;

struct Fixture {
  std::filesystem::path           dir;
  std::shared_ptr<RecordingStore> store;
};

Fixture MakeStore(const std::string& test_name) {
  Fixture fixture;
  fixture.dir = std::filesystem::temp_directory_path() / "callscribe_recording_store_tests" / test_name;
  std::filesystem::remove_all(fixture.dir);
  std::filesystem::create_directories(fixture.dir / "store");
  std::filesystem::create_directories(fixture.dir / "tmp");
  fixture.store = std::make_shared<RecordingStore>(std::make_shared<arrow::fs::LocalFileSystem>(), (fixture.dir / "store").string());
  return fixture;
}

void WriteFile(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary);
  out << bytes;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

RecordingOptions Options(const Fixture& fixture) {
  RecordingOptions options;
  options.temp_path = (fixture.dir / "tmp").string() + "/";
  options.url_base  = "https://recordings.example.com/";
  return options;
}

void TestPutGetRemove() {
  auto fixture = MakeStore("put_get");
  auto store   = fixture.store;

  store->Put("raw/a.raw", arrow::Buffer::FromString("abc"));
  assert(store->Exists("raw/a.raw"));
  assert(store->Get("raw/a.raw")->ToString() == "abc");
  assert(std::filesystem::exists(fixture.dir / "store" / "raw" / "a.raw"));

  store->Remove("raw/a.raw");
  assert(!store->Exists("raw/a.raw"));
}

void TestKeysCannotEscapeRoot() {
  auto fixture = MakeStore("escape");
  for (const char* key : {"", "/etc/passwd", "raw/../../x"}) {
    bool threw = false;
    try {
      fixture.store->Put(key, arrow::Buffer::FromString("x"));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestMergeConcatenatesInOrderBehindWavHeader() {
  auto fixture = MakeStore("merge");
  auto store   = fixture.store;
  store->Put("raw/c-1.raw", arrow::Buffer::FromString("1111"));
  store->Put("raw/c-3.raw", arrow::Buffer::FromString("33"));

  const auto result = store->MergeInto("recordings/c.wav", {"raw/c-1.raw", "raw/c-2.raw", "raw/c-3.raw"}, 8000);
  assert(result.parts_merged == 2);
  assert(result.parts_missing == 1);
  assert(result.data_bytes == 6);

  const auto wav = store->Get("recordings/c.wav")->ToString();
  assert(wav.size() == callscribe::audio::kWavHeaderBytes + 6);
  assert(wav.substr(0, callscribe::audio::kWavHeaderBytes) == callscribe::audio::WavHeader(8000, 2, 16, 6));
  assert(wav.substr(callscribe::audio::kWavHeaderBytes) == "111133");
}

void TestFinalizerNaming() {
  auto               fixture = MakeStore("naming");
  RecordingFinalizer finalizer(fixture.store, Options(fixture));

  assert(finalizer.PartKey("call-1", 2) == "raw/call-1-2.raw");
  assert(finalizer.RecordingKey("call-1") == "recordings/call-1.wav");
  assert(finalizer.RecordingUrl("call-1") == "https://recordings.example.com/recordings/call-1.wav");
  assert(finalizer.TempPath("call-1", 2) == (fixture.dir / "tmp" / "call-1-2.raw").string());

  bool threw = false;
  try {
    (void)finalizer.PartKey("../call", 1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestUploadPartsThenMergeCall() {
  auto               fixture = MakeStore("upload_merge");
  RecordingFinalizer finalizer(fixture.store, Options(fixture));

  WriteFile(finalizer.TempPath("call-1", 1), std::string(3200, '\x01'));
  WriteFile(finalizer.TempPath("call-1", 2), std::string(1600, '\x02'));

  assert(finalizer.UploadPart("call-1", 1));
  assert(finalizer.UploadPart("call-1", 2));
  assert(!std::filesystem::exists(finalizer.TempPath("call-1", 1)));
  assert(fixture.store->Exists("raw/call-1-2.raw"));

  // no temp file for this unit
  assert(!finalizer.UploadPart("call-1", 3));

  const auto url = finalizer.MergeCall("call-1", 3);
  assert(url && *url == "https://recordings.example.com/recordings/call-1.wav");

  const auto wav = ReadFile(fixture.dir / "store" / "recordings" / "call-1.wav");
  assert(wav.size() == callscribe::audio::kWavHeaderBytes + 4800);
  assert(wav[callscribe::audio::kWavHeaderBytes] == '\x01');
  assert(wav.back() == '\x02');

  assert(!fixture.store->Exists("raw/call-1-1.raw"));
  assert(!fixture.store->Exists("raw/call-1-2.raw"));
}

} // namespace

int main() {
  TestPutGetRemove();
  TestKeysCannotEscapeRoot();
  TestMergeConcatenatesInOrderBehindWavHeader();
  TestFinalizerNaming();
  TestUploadPartsThenMergeCall();

  std::cout << "callscribe_unit_recording_store: pass\n";
  return 0;
}
