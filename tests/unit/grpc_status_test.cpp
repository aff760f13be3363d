#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/core/generation_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/encoder/placeholder_encoder.hpp"
#include "internal/generation/generation_scheduler.hpp"
#include "internal/generation/single_flight.hpp"
#include "internal/grpc/generation_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/project_server.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/project_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/local/local_artifact_store.hpp"
#include "slideshow/v1.hpp"

namespace {

using namespace slideshow::v1;

struct Servers {
  std::filesystem::path                              root;
  std::unique_ptr<slideshow::grpc::ProjectServer>    projects;
  std::unique_ptr<slideshow::grpc::GenerationServer> generation;
};

Servers BuildServers() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

  Servers s;
  s.root     = std::filesystem::temp_directory_path() / ("slideshow_grpc_status_" + std::to_string(stamp));
  auto store = std::make_shared<slideshow::storage::LocalArtifactStore>(s.root);

  slideshow::service::ServiceContext ctx;
  ctx.repository    = std::make_shared<slideshow::db::memory::MemoryRepository>();
  ctx.store         = store;
  ctx.encoder       = std::make_shared<slideshow::encoder::PlaceholderEncoder>(store, slideshow::encoder::EncodeOptions{});
  ctx.orchestrator  = std::make_shared<slideshow::core::GenerationOrchestrator>(ctx.repository, store, ctx.encoder);
  ctx.scheduler     = std::make_shared<slideshow::generation::GenerationScheduler>();
  ctx.single_flight = std::make_shared<slideshow::generation::SingleFlight>();

  s.projects   = std::make_unique<slideshow::grpc::ProjectServer>(std::make_shared<slideshow::service::ProjectService>(ctx));
  s.generation = std::make_unique<slideshow::grpc::GenerationServer>(
      std::make_shared<slideshow::service::GenerationService>(ctx));
  return s;
}

int64_t CreateEmptyProject(Servers& s) {
  CreateProjectRequest  req;
  CreateProjectResponse resp;
  req.set_name("empty");
  ::grpc::ServerContext grpc_ctx;
  const auto status = s.projects->CreateProject(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.project().id();
}

void TestExceptionMapping() {
  using namespace slideshow::util;
  using slideshow::grpc::ToStatus;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(EmptyInput("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(MissingAsset("x", "images/a.png")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(StagingFailed("x", "images/a.png")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(EncodeFailed("x", 1, "tail")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(NotFound("project 7 not found"));
  assert(status.error_message() == "project 7 not found");
}

void TestGetMissingProjectReturnsNotFound() {
  auto s = BuildServers();

  GetProjectRequest req;
  req.set_project_id(404);
  GetProjectResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.projects->GetProject(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  std::filesystem::remove_all(s.root);
}

void TestInvalidCreateReturnsInvalidArgument() {
  auto s = BuildServers();

  CreateProjectRequest req;
  req.set_name("");
  CreateProjectResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.projects->CreateProject(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  std::filesystem::remove_all(s.root);
}

void TestGenerateEmptyProjectReturnsFailedPrecondition() {
  auto s  = BuildServers();
  auto id = CreateEmptyProject(s);

  GenerateVideoRequest req;
  req.set_project_id(id);
  req.set_wait(true);
  GenerateVideoResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = s.generation->GenerateVideo(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  std::filesystem::remove_all(s.root);
}

void TestDownloadInfoWithoutVideoReturnsFailedPrecondition() {
  auto s  = BuildServers();
  auto id = CreateEmptyProject(s);

  GetVideoDownloadRequest req;
  req.set_project_id(id);
  GetVideoDownloadResponse resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = s.generation->GetVideoDownload(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  std::filesystem::remove_all(s.root);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingProjectReturnsNotFound();
  TestInvalidCreateReturnsInvalidArgument();
  TestGenerateEmptyProjectReturnsFailedPrecondition();
  TestDownloadInfoWithoutVideoReturnsFailedPrecondition();

  std::cout << "slideshow_unit_grpc_status: pass\n";
  return 0;
}
