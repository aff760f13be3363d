#include "internal/service/project_service.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/local/local_artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "slideshow/v1.hpp"

namespace {

using namespace slideshow::v1;
using slideshow::service::ProjectService;
using slideshow::service::SanitizeFilename;

struct Fixture {
  std::filesystem::path                                   root;
  std::shared_ptr<slideshow::storage::LocalArtifactStore> store;
  std::unique_ptr<ProjectService>                         service;
};

Fixture MakeFixture(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();

  Fixture f;
  f.root  = std::filesystem::temp_directory_path() / ("slideshow_project_service_" + name + "_" + std::to_string(stamp));
  f.store = std::make_shared<slideshow::storage::LocalArtifactStore>(f.root);

  slideshow::service::ServiceContext ctx;
  ctx.repository = std::make_shared<slideshow::db::memory::MemoryRepository>();
  ctx.store      = f.store;
  f.service      = std::make_unique<ProjectService>(ctx);
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

Project Create(Fixture& f, const std::string& name) {
  CreateProjectRequest req;
  req.set_name(name);
  return f.service->CreateProject(req).project();
}

UploadImageRequest Upload(int64_t project_id, const std::string& filename, int32_t order_index) {
  UploadImageRequest req;
  req.set_project_id(project_id);
  req.set_filename(filename);
  req.set_file_data("bytes-of-" + filename);
  req.set_mime_type("image/png");
  req.set_order_index(order_index);
  return req;
}

void TestCreateProjectAppliesDefaults() {
  auto f       = MakeFixture("defaults");
  auto project = Create(f, "Holiday");

  assert(project.id() > 0);
  assert(project.name() == "Holiday");
  assert(project.status() == PROJECT_STATUS_PENDING);
  assert(project.output_path().empty());
  assert(project.duration_per_image() == 2.0);
  assert(project.fps() == 30);
  assert(project.created_at().seconds() > 0);

  std::filesystem::remove_all(f.root);
}

void TestCreateProjectValidation() {
  auto f = MakeFixture("validation");

  auto create = [&](const std::string& name, std::optional<double> duration, std::optional<int32_t> fps) {
    CreateProjectRequest req;
    req.set_name(name);
    if (duration) req.set_duration_per_image(*duration);
    if (fps) req.set_fps(*fps);
    return f.service->CreateProject(req);
  };

  using slideshow::util::InvalidArgument;
  assert(Throws<InvalidArgument>([&] { (void)create("", std::nullopt, std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create(std::string(256, 'x'), std::nullopt, std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", 0.0, std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", -1.0, std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", 1000.0, std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", std::nan(""), std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", std::numeric_limits<double>::infinity(), std::nullopt); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", std::nullopt, 0); }));
  assert(Throws<InvalidArgument>([&] { (void)create("p", std::nullopt, 61); }));

  auto edge = create(std::string(255, 'x'), 999.99, 60).project();
  assert(edge.duration_per_image() == 999.99);
  assert(edge.fps() == 60);

  auto slow = create("slow", 0.5, 1).project();
  assert(slow.fps() == 1);

  std::filesystem::remove_all(f.root);
}

void TestListAndGetProjects() {
  auto f      = MakeFixture("list");
  auto first  = Create(f, "first");
  auto second = Create(f, "second");

  auto listed = f.service->ListProjects(ListProjectsRequest{});
  assert(listed.projects_size() == 2);
  assert(listed.projects(0).id() == first.id());
  assert(listed.projects(1).id() == second.id());

  GetProjectRequest get;
  get.set_project_id(second.id());
  assert(f.service->GetProject(get).project().name() == "second");

  get.set_project_id(9999);
  assert(Throws<slideshow::util::NotFound>([&] { (void)f.service->GetProject(get); }));

  get.set_project_id(0);
  assert(Throws<slideshow::util::InvalidArgument>([&] { (void)f.service->GetProject(get); }));

  std::filesystem::remove_all(f.root);
}

void TestUploadStoresBytesUnderProjectDirectory() {
  auto f       = MakeFixture("upload");
  auto project = Create(f, "p");

  auto image = f.service->UploadImage(Upload(project.id(), "beach.png", 3)).image();

  const auto prefix = "images/project_" + std::to_string(project.id()) + "/";
  assert(image.id() > 0);
  assert(image.project_id() == project.id());
  assert(image.filename() == "beach.png");
  assert(image.file_path().rfind(prefix, 0) == 0);
  assert(image.file_path().size() > prefix.size() + std::string("beach.png").size());
  assert(image.file_size() == std::string("bytes-of-beach.png").size());
  assert(image.mime_type() == "image/png");
  assert(image.order_index() == 3);
  assert(f.store->Read(image.file_path())->ToString() == "bytes-of-beach.png");

  // same name twice never collides
  auto again = f.service->UploadImage(Upload(project.id(), "beach.png", 3)).image();
  assert(again.file_path() != image.file_path());

  std::filesystem::remove_all(f.root);
}

void TestUploadSanitizesFilename() {
  auto f       = MakeFixture("sanitize");
  auto project = Create(f, "p");

  auto image = f.service->UploadImage(Upload(project.id(), "../../etc/passwd.png", 0)).image();
  assert(image.filename() == "passwd.png");
  assert(image.file_path().find("..") == std::string::npos);

  assert(SanitizeFilename("C:\\photos\\cat.jpg") == "cat.jpg");
  assert(SanitizeFilename("a\nb.png") == "ab.png");
  assert(SanitizeFilename("") == "image");
  assert(SanitizeFilename("dir/") == "image");
  assert(SanitizeFilename("..") == "image");

  std::filesystem::remove_all(f.root);
}

void TestUploadValidation() {
  auto f       = MakeFixture("upload_validation");
  auto project = Create(f, "p");

  using slideshow::util::InvalidArgument;

  auto bad_mime = Upload(project.id(), "a.txt", 0);
  bad_mime.set_mime_type("text/plain");
  assert(Throws<InvalidArgument>([&] { (void)f.service->UploadImage(bad_mime); }));

  bad_mime.set_mime_type("image/");
  assert(Throws<InvalidArgument>([&] { (void)f.service->UploadImage(bad_mime); }));

  auto negative = Upload(project.id(), "a.png", -1);
  assert(Throws<InvalidArgument>([&] { (void)f.service->UploadImage(negative); }));

  auto empty = Upload(project.id(), "a.png", 0);
  empty.set_file_data("");
  assert(Throws<InvalidArgument>([&] { (void)f.service->UploadImage(empty); }));

  auto unknown = Upload(9999, "a.png", 0);
  assert(Throws<slideshow::util::NotFound>([&] { (void)f.service->UploadImage(unknown); }));
  assert(f.store->List("images").empty());

  std::filesystem::remove_all(f.root);
}

void TestListProjectImagesIsOrdered() {
  auto f       = MakeFixture("images");
  auto project = Create(f, "p");

  auto c = f.service->UploadImage(Upload(project.id(), "c.png", 2)).image();
  auto a = f.service->UploadImage(Upload(project.id(), "a.png", 0)).image();
  auto b = f.service->UploadImage(Upload(project.id(), "b.png", 1)).image();
  auto d = f.service->UploadImage(Upload(project.id(), "d.png", 1)).image();

  ListProjectImagesRequest req;
  req.set_project_id(project.id());
  auto images = f.service->ListProjectImages(req);

  assert(images.images_size() == 4);
  assert(images.images(0).id() == a.id());
  assert(images.images(1).id() == b.id());
  assert(images.images(2).id() == d.id());
  assert(images.images(3).id() == c.id());

  std::filesystem::remove_all(f.root);
}

void TestUpdateProjectStatus() {
  auto f       = MakeFixture("status");
  auto project = Create(f, "p");

  UpdateProjectStatusRequest req;
  req.set_project_id(project.id());
  req.set_status(PROJECT_STATUS_COMPLETED);
  req.set_output_path("videos/manual.mp4");
  auto updated = f.service->UpdateProjectStatus(req).project();
  assert(updated.status() == PROJECT_STATUS_COMPLETED);
  assert(updated.output_path() == "videos/manual.mp4");

  // status only keeps the path
  UpdateProjectStatusRequest status_only;
  status_only.set_project_id(project.id());
  status_only.set_status(PROJECT_STATUS_FAILED);
  updated = f.service->UpdateProjectStatus(status_only).project();
  assert(updated.status() == PROJECT_STATUS_FAILED);
  assert(updated.output_path() == "videos/manual.mp4");

  // explicit empty path clears it
  req.set_status(PROJECT_STATUS_PENDING);
  req.set_output_path("");
  updated = f.service->UpdateProjectStatus(req).project();
  assert(updated.status() == PROJECT_STATUS_PENDING);
  assert(updated.output_path().empty());

  req.set_status(PROJECT_STATUS_UNSPECIFIED);
  assert(Throws<slideshow::util::InvalidArgument>([&] { (void)f.service->UpdateProjectStatus(req); }));

  req.set_status(PROJECT_STATUS_COMPLETED);
  req.set_project_id(9999);
  assert(Throws<slideshow::util::NotFound>([&] { (void)f.service->UpdateProjectStatus(req); }));

  std::filesystem::remove_all(f.root);
}

} // namespace

int main() {
  TestCreateProjectAppliesDefaults();
  TestCreateProjectValidation();
  TestListAndGetProjects();
  TestUploadStoresBytesUnderProjectDirectory();
  TestUploadSanitizesFilename();
  TestUploadValidation();
  TestListProjectImagesIsOrdered();
  TestUpdateProjectStatus();

  std::cout << "slideshow_unit_project_service: pass\n";
  return 0;
}
