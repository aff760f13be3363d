#include "internal/service/generation_service.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/generation_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/encoder/placeholder_encoder.hpp"
#include "internal/generation/generation_scheduler.hpp"
#include "internal/generation/single_flight.hpp"
#include "internal/service/project_service.hpp"
#include "internal/storage/local/local_artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "slideshow/v1.hpp"

namespace {

using namespace slideshow::v1;
using slideshow::service::GenerationService;
using slideshow::service::ProjectService;

struct Fixture {
  std::filesystem::path                                   root;
  slideshow::service::ServiceContext                      ctx;
  std::shared_ptr<slideshow::storage::LocalArtifactStore> store;
  std::unique_ptr<ProjectService>                         projects;
  std::unique_ptr<GenerationService>                      generation;
};

Fixture MakeFixture(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

  Fixture f;
  f.root  = std::filesystem::temp_directory_path() / ("slideshow_generation_service_" + name + "_" + std::to_string(stamp));
  f.store = std::make_shared<slideshow::storage::LocalArtifactStore>(f.root);

  f.ctx.repository    = std::make_shared<slideshow::db::memory::MemoryRepository>();
  f.ctx.store         = f.store;
  f.ctx.encoder       = std::make_shared<slideshow::encoder::PlaceholderEncoder>(f.store, slideshow::encoder::EncodeOptions{});
  f.ctx.orchestrator  = std::make_shared<slideshow::core::GenerationOrchestrator>(f.ctx.repository, f.store, f.ctx.encoder);
  f.ctx.scheduler     = std::make_shared<slideshow::generation::GenerationScheduler>();
  f.ctx.single_flight = std::make_shared<slideshow::generation::SingleFlight>();

  f.projects   = std::make_unique<ProjectService>(f.ctx);
  f.generation = std::make_unique<GenerationService>(f.ctx);
  return f;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

int64_t CreateProjectWithImage(Fixture& f) {
  CreateProjectRequest create;
  create.set_name("p");
  auto id = f.projects->CreateProject(create).project().id();

  UploadImageRequest upload;
  upload.set_project_id(id);
  upload.set_filename("a.png");
  upload.set_file_data("png");
  upload.set_mime_type("image/png");
  (void)f.projects->UploadImage(upload);
  return id;
}

GenerateVideoRequest Generate(int64_t id, bool wait) {
  GenerateVideoRequest req;
  req.set_project_id(id);
  req.set_wait(wait);
  return req;
}

void TestSynchronousGenerationReturnsCompletedProject() {
  auto f  = MakeFixture("sync");
  auto id = CreateProjectWithImage(f);

  auto resp = f.generation->GenerateVideo(Generate(id, true));
  assert(!resp.queued());
  assert(resp.placeholder());
  assert(resp.project().status() == PROJECT_STATUS_COMPLETED);
  assert(!resp.project().output_path().empty());
  assert(!f.ctx.single_flight->InFlight(id));

  std::filesystem::remove_all(f.root);
}

void TestSynchronousFailureSurfacesClassifiedError() {
  auto f = MakeFixture("sync_fail");

  CreateProjectRequest create;
  create.set_name("empty");
  auto id = f.projects->CreateProject(create).project().id();

  assert(Throws<slideshow::util::EmptyInput>([&] { (void)f.generation->GenerateVideo(Generate(id, true)); }));

  GetProjectRequest get;
  get.set_project_id(id);
  assert(f.projects->GetProject(get).project().status() == PROJECT_STATUS_FAILED);
  assert(!f.ctx.single_flight->InFlight(id));

  std::filesystem::remove_all(f.root);
}

void TestAsyncGenerationQueuesAndHoldsSingleFlight() {
  auto f  = MakeFixture("async");
  auto id = CreateProjectWithImage(f);

  auto resp = f.generation->GenerateVideo(Generate(id, false));
  assert(resp.queued());
  assert(resp.placeholder());
  assert(resp.project().id() == id);
  assert(resp.project().status() == PROJECT_STATUS_PENDING);
  assert(f.ctx.scheduler->Pending() == 1);
  assert(f.ctx.single_flight->InFlight(id));

  // a second request while the first is queued is rejected, sync or not
  assert(Throws<slideshow::util::InvalidState>([&] { (void)f.generation->GenerateVideo(Generate(id, false)); }));
  assert(Throws<slideshow::util::InvalidState>([&] { (void)f.generation->GenerateVideo(Generate(id, true)); }));

  // what a worker does
  {
    auto task = f.ctx.scheduler->Dequeue();
    assert(task.has_value());
    assert(task->project_id == id);
    auto outcome = f.ctx.orchestrator->Generate(task->project_id);
    assert(outcome.project.status == PROJECT_STATUS_COMPLETED);
  }
  assert(!f.ctx.single_flight->InFlight(id));

  auto again = f.generation->GenerateVideo(Generate(id, true));
  assert(again.project().status() == PROJECT_STATUS_COMPLETED);

  std::filesystem::remove_all(f.root);
}

void TestAsyncUnknownProjectIsRejectedUpFront() {
  auto f = MakeFixture("async_unknown");

  assert(Throws<slideshow::util::NotFound>([&] { (void)f.generation->GenerateVideo(Generate(777, false)); }));
  assert(f.ctx.scheduler->Pending() == 0);
  assert(!f.ctx.single_flight->InFlight(777));

  std::filesystem::remove_all(f.root);
}

void TestAsyncAfterShutdownIsRejected() {
  auto f  = MakeFixture("shutdown");
  auto id = CreateProjectWithImage(f);

  (void)f.ctx.scheduler->Shutdown();
  assert(Throws<slideshow::util::InvalidState>([&] { (void)f.generation->GenerateVideo(Generate(id, false)); }));
  assert(!f.ctx.single_flight->InFlight(id));

  std::filesystem::remove_all(f.root);
}

void TestGetVideoDownload() {
  auto f  = MakeFixture("download_info");
  auto id = CreateProjectWithImage(f);

  GetVideoDownloadRequest req;
  req.set_project_id(id);
  assert(Throws<slideshow::util::InvalidState>([&] { (void)f.generation->GetVideoDownload(req); }));

  auto generated = f.generation->GenerateVideo(Generate(id, true)).project();
  auto info      = f.generation->GetVideoDownload(req);

  const auto& output = generated.output_path();
  const auto  name   = output.substr(output.rfind('/') + 1);
  assert(info.output_path() == output);
  assert(info.filename() == name);
  assert(info.download_url() == "/videos/" + name);
  assert(info.size_bytes() == slideshow::encoder::PlaceholderEncoder::PlaceholderBytes().size());

  req.set_project_id(9999);
  assert(Throws<slideshow::util::NotFound>([&] { (void)f.generation->GetVideoDownload(req); }));

  std::filesystem::remove_all(f.root);
}

void TestGetVideoDownloadWithVanishedFileIsNotFound() {
  auto f  = MakeFixture("vanished");
  auto id = CreateProjectWithImage(f);

  auto generated = f.generation->GenerateVideo(Generate(id, true)).project();
  f.store->Remove(generated.output_path(), false);

  GetVideoDownloadRequest req;
  req.set_project_id(id);
  assert(Throws<slideshow::util::NotFound>([&] { (void)f.generation->GetVideoDownload(req); }));

  std::filesystem::remove_all(f.root);
}

void TestDownloadVideoStreamsInChunks() {
  auto f  = MakeFixture("download_stream");
  auto id = CreateProjectWithImage(f);

  // 2.5 chunks of output
  const std::size_t chunk = GenerationService::kDownloadChunkBytes;
  std::string       video(chunk * 2 + chunk / 2, '\0');
  for (std::size_t i = 0; i < video.size(); ++i) video[i] = static_cast<char>(i % 251);
  f.store->Write("videos/big.mp4", arrow::Buffer::FromString(video));

  UpdateProjectStatusRequest status;
  status.set_project_id(id);
  status.set_status(PROJECT_STATUS_COMPLETED);
  status.set_output_path("videos/big.mp4");
  (void)f.projects->UpdateProjectStatus(status);

  DownloadVideoRequest req;
  req.set_project_id(id);

  std::string           received;
  std::vector<uint64_t> offsets;
  f.generation->DownloadVideo(req, [&](const VideoChunk& c) {
    offsets.push_back(c.offset());
    received += c.data();
    return true;
  });
  assert(received == video);
  assert((offsets == std::vector<uint64_t>{0, chunk, chunk * 2}));

  // the sink can stop the transfer
  int calls = 0;
  f.generation->DownloadVideo(req, [&](const VideoChunk&) {
    ++calls;
    return false;
  });
  assert(calls == 1);

  std::filesystem::remove_all(f.root);
}

void TestDownloadWithoutOutputIsInvalidState() {
  auto f  = MakeFixture("download_none");
  auto id = CreateProjectWithImage(f);

  DownloadVideoRequest req;
  req.set_project_id(id);
  assert(Throws<slideshow::util::InvalidState>(
      [&] { f.generation->DownloadVideo(req, [](const VideoChunk&) { return true; }); }));

  std::filesystem::remove_all(f.root);
}

} // namespace

int main() {
  TestSynchronousGenerationReturnsCompletedProject();
  TestSynchronousFailureSurfacesClassifiedError();
  TestAsyncGenerationQueuesAndHoldsSingleFlight();
  TestAsyncUnknownProjectIsRejectedUpFront();
  TestAsyncAfterShutdownIsRejected();
  TestGetVideoDownload();
  TestGetVideoDownloadWithVanishedFileIsNotFound();
  TestDownloadVideoStreamsInChunks();
  TestDownloadWithoutOutputIsInvalidState();

  std::cout << "slideshow_unit_generation_service: pass\n";
  return 0;
}
