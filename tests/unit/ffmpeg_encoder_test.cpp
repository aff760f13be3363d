#include "internal/encoder/ffmpeg_encoder.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/encoder/encoder_factory.hpp"
#include "internal/storage/local/local_artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using slideshow::encoder::EncodeOptions;
using slideshow::encoder::EncodeRequest;
using slideshow::encoder::FfmpegEncoder;
using namespace std::chrono_literals;

struct Fixture {
  std::filesystem::path                                  dir;
  std::shared_ptr<slideshow::storage::LocalArtifactStore> store;
};

Fixture MakeFixture(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  Fixture    f;
  f.dir   = std::filesystem::temp_directory_path() / ("slideshow_ffmpeg_" + name + "_" + std::to_string(stamp));
  f.store = std::make_shared<slideshow::storage::LocalArtifactStore>(f.dir / "store");
  f.store->Write("staging/run/frame_0000.png", arrow::Buffer::FromString("a"));
  f.store->Write("staging/run/frame_0001.png", arrow::Buffer::FromString("b"));
  return f;
}

// Writes an executable shell script standing in for the encoder binary.
std::string FakeBinary(const Fixture& f, const std::string& name, const std::string& body) {
  const auto path = f.dir / name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path.string();
}

EncodeRequest TwoFrameRequest() {
  EncodeRequest request;
  request.frame_paths       = {"staging/run/frame_0000.png", "staging/run/frame_0001.png"};
  request.output_path       = "videos/project_1_out.mp4";
  request.seconds_per_frame = 1.5;
  request.fps               = 25;
  return request;
}

void TestSuccessfulEncode() {
  auto f = MakeFixture("ok");

  EncodeOptions options;
  // the last argument is the output path; record the argv alongside it
  options.binary = FakeBinary(f, "ffmpeg-ok", R"(for last; do :; done
echo "$@" > "$last.args"
printf 'mp4-bytes' > "$last"
echo "encoded" 1>&2
exit 0)");

  FfmpegEncoder encoder(f.store, options);
  auto          result = encoder.Encode(TwoFrameRequest());

  assert(!result.placeholder);
  assert(result.duration_seconds == 3.0);
  assert(result.diagnostics.find("encoded") != std::string::npos);
  assert(f.store->Read("videos/project_1_out.mp4")->ToString() == "mp4-bytes");

  // frames were handed over as absolute paths, in order
  auto args = f.store->Read("videos/project_1_out.mp4.args")->ToString();
  auto first  = args.find(f.store->LocalPath("staging/run/frame_0000.png"));
  auto second = args.find(f.store->LocalPath("staging/run/frame_0001.png"));
  assert(first != std::string::npos && second != std::string::npos && first < second);
  assert(encoder.Mode() == "ffmpeg");

  std::filesystem::remove_all(f.dir);
}

void TestNonZeroExitRaisesEncodeFailedAndDiscardsOutput() {
  auto f = MakeFixture("fail");

  EncodeOptions options;
  options.binary = FakeBinary(f, "ffmpeg-fail", R"(for last; do :; done
printf 'partial' > "$last"
echo "Invalid data found when processing input" 1>&2
exit 1)");

  FfmpegEncoder encoder(f.store, options);
  bool          threw = false;
  try {
    (void)encoder.Encode(TwoFrameRequest());
  } catch (const slideshow::util::EncodeFailed& e) {
    threw = true;
    assert(e.exit_code() == 1);
    assert(!e.timed_out());
    assert(e.diagnostics().find("Invalid data found") != std::string::npos);
  }
  assert(threw);
  assert(!f.store->Exists("videos/project_1_out.mp4"));

  std::filesystem::remove_all(f.dir);
}

void TestTimeoutRaisesEncodeFailed() {
  auto f = MakeFixture("timeout");

  EncodeOptions options;
  options.binary  = FakeBinary(f, "ffmpeg-slow", "exec sleep 30");
  options.timeout = 200ms;

  FfmpegEncoder encoder(f.store, options);
  bool          threw = false;
  try {
    (void)encoder.Encode(TwoFrameRequest());
  } catch (const slideshow::util::EncodeFailed& e) {
    threw = true;
    assert(e.timed_out());
    assert(std::string(e.what()).find("timed out") != std::string::npos);
  }
  assert(threw);

  std::filesystem::remove_all(f.dir);
}

void TestCleanExitWithoutOutputRaisesEncodeFailed() {
  auto f = MakeFixture("no_output");

  EncodeOptions options;
  options.binary = FakeBinary(f, "ffmpeg-silent", "exit 0");

  FfmpegEncoder encoder(f.store, options);
  bool          threw = false;
  try {
    (void)encoder.Encode(TwoFrameRequest());
  } catch (const slideshow::util::EncodeFailed& e) {
    threw = true;
    assert(e.exit_code() == 0);
  }
  assert(threw);

  std::filesystem::remove_all(f.dir);
}

void TestMissingBinaryRaisesEncodeFailed() {
  auto f = MakeFixture("missing");

  EncodeOptions options;
  options.binary = (f.dir / "not-installed-ffmpeg").string();

  FfmpegEncoder encoder(f.store, options);
  bool          threw = false;
  try {
    (void)encoder.Encode(TwoFrameRequest());
  } catch (const slideshow::util::EncodeFailed& e) {
    threw = true;
    assert(e.exit_code() == -1);
  }
  assert(threw);

  std::filesystem::remove_all(f.dir);
}

void TestSetupFailuresRaiseEncodeFailed() {
  auto f = MakeFixture("setup");

  EncodeOptions options;
  const auto    marker = (f.dir / "ran").string();
  options.binary       = FakeBinary(f, "ffmpeg-never", "touch '" + marker + "'\nexit 0");
  FfmpegEncoder encoder(f.store, options);

  auto expect_encode_failed = [&](const EncodeRequest& request) {
    bool threw = false;
    try {
      (void)encoder.Encode(request);
    } catch (const slideshow::util::EncodeFailed& e) {
      threw = true;
      assert(e.exit_code() == -1);
    }
    assert(threw);
  };

  // output path escaping the store
  auto escaping        = TwoFrameRequest();
  escaping.output_path = "../escape.mp4";
  expect_encode_failed(escaping);

  // output directory cannot be created over a regular file
  f.store->Write("videos", arrow::Buffer::FromString("not a directory"));
  expect_encode_failed(TwoFrameRequest());

  assert(!std::filesystem::exists(marker));
  std::filesystem::remove_all(f.dir);
}

void TestFactoryPicksRealEncoderWhenBinaryResolves() {
  auto f = MakeFixture("factory");

  EncodeOptions options;
  options.binary = FakeBinary(f, "ffmpeg-ok", "exit 0");

  assert(slideshow::encoder::MakeEncoder(f.store, options, /*allow_placeholder=*/true)->Mode() == "ffmpeg");

  options.binary = (f.dir / "not-installed-ffmpeg").string();
  assert(slideshow::encoder::MakeEncoder(f.store, options, /*allow_placeholder=*/true)->Mode() == "placeholder");
  // without the fallback every attempt fails at the real encoder
  assert(slideshow::encoder::MakeEncoder(f.store, options, /*allow_placeholder=*/false)->Mode() == "ffmpeg");

  std::filesystem::remove_all(f.dir);
}

} // namespace

int main() {
  TestSuccessfulEncode();
  TestNonZeroExitRaisesEncodeFailedAndDiscardsOutput();
  TestTimeoutRaisesEncodeFailed();
  TestCleanExitWithoutOutputRaisesEncodeFailed();
  TestMissingBinaryRaisesEncodeFailed();
  TestSetupFailuresRaiseEncodeFailed();
  TestFactoryPicksRealEncoderWhenBinaryResolves();

  std::cout << "slideshow_unit_ffmpeg_encoder: pass\n";
  return 0;
}
