#include "internal/encoder/placeholder_encoder.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/local/local_artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using slideshow::encoder::EncodeOptions;
using slideshow::encoder::EncodeRequest;
using slideshow::encoder::PlaceholderEncoder;

std::shared_ptr<slideshow::storage::LocalArtifactStore> MakeStore(std::filesystem::path& root) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  root = std::filesystem::temp_directory_path() / ("slideshow_placeholder_" + std::to_string(stamp));
  return std::make_shared<slideshow::storage::LocalArtifactStore>(root);
}

void TestPlaceholderBytesAreAnMp4Header() {
  const auto& bytes = PlaceholderEncoder::PlaceholderBytes();
  assert(bytes.size() == 32);
  assert(bytes.substr(4, 4) == "ftyp");
  assert(bytes.substr(8, 4) == "isom");
  assert(bytes.substr(28, 4) == "free");
  // box sizes are big-endian and cover the whole buffer
  assert(static_cast<unsigned char>(bytes[3]) == 24);
  assert(static_cast<unsigned char>(bytes[27]) == 8);
}

void TestEncodeWritesPlaceholderAndFlagsIt() {
  std::filesystem::path root;
  auto                  store = MakeStore(root);
  store->Write("staging/run/frame_0000.png", arrow::Buffer::FromString("a"));

  PlaceholderEncoder encoder(store, EncodeOptions{});
  EncodeRequest      request;
  request.frame_paths       = {"staging/run/frame_0000.png"};
  request.output_path       = "videos/project_9_out.mp4";
  request.seconds_per_frame = 2.0;
  request.fps               = 30;

  auto result = encoder.Encode(request);
  assert(result.placeholder);
  assert(result.duration_seconds == 2.0);
  assert(store->Read("videos/project_9_out.mp4")->ToString() == PlaceholderEncoder::PlaceholderBytes());
  assert(encoder.Mode() == "placeholder");

  std::filesystem::remove_all(root);
}

void TestPlaceholderValidatesLikeRealEncode() {
  std::filesystem::path root;
  auto                  store = MakeStore(root);

  PlaceholderEncoder encoder(store, EncodeOptions{});
  EncodeRequest      request;
  request.output_path       = "videos/out.mp4";
  request.seconds_per_frame = 2.0;
  request.fps               = 30;

  bool threw = false;
  try {
    (void)encoder.Encode(request);
  } catch (const slideshow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!store->Exists("videos/out.mp4"));

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestPlaceholderBytesAreAnMp4Header();
  TestEncodeWritesPlaceholderAndFlagsIt();
  TestPlaceholderValidatesLikeRealEncode();

  std::cout << "slideshow_unit_placeholder_encoder: pass\n";
  return 0;
}
