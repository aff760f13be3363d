#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "slideshow/v1.hpp"

using namespace slideshow::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  slideshowctl <addr> create <name> [duration_per_image] [fps]\n"
            << "  slideshowctl <addr> list\n"
            << "  slideshowctl <addr> get <project_id>\n"
            << "  slideshowctl <addr> upload <project_id> <file> <order_index> [mime_type]\n"
            << "  slideshowctl <addr> images <project_id>\n"
            << "  slideshowctl <addr> status <project_id> <pending|processing|completed|failed> [output_path]\n"
            << "  slideshowctl <addr> generate <project_id> [--async]\n"
            << "  slideshowctl <addr> download <project_id> [dest_file]\n"
            << "  slideshowctl <addr> health\n"
            << "  slideshowctl <addr> stats\n";
}

static std::string StatusName(ProjectStatus status) {
  switch (status) {
    case PROJECT_STATUS_PENDING:
      return "pending";
    case PROJECT_STATUS_PROCESSING:
      return "processing";
    case PROJECT_STATUS_COMPLETED:
      return "completed";
    case PROJECT_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

static std::optional<ProjectStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return PROJECT_STATUS_PENDING;
  if (value == "processing") return PROJECT_STATUS_PROCESSING;
  if (value == "completed") return PROJECT_STATUS_COMPLETED;
  if (value == "failed") return PROJECT_STATUS_FAILED;
  return std::nullopt;
}

static std::string GuessMimeType(const std::string& path) {
  auto dot = path.rfind('.');
  if (dot == std::string::npos) return "application/octet-stream";

  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "png") return "image/png";
  if (ext == "gif") return "image/gif";
  if (ext == "webp") return "image/webp";
  if (ext == "bmp") return "image/bmp";
  return "application/octet-stream";
}

static void PrintProject(const Project& p) {
  std::cout << "id=" << p.id() << " name=" << p.name() << " status=" << StatusName(p.status())
            << " duration_per_image=" << p.duration_per_image() << " fps=" << p.fps();
  if (!p.output_path().empty()) std::cout << " output=" << p.output_path();
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto project_stub    = ProjectService::NewStub(channel);
  auto generation_stub = GenerationService::NewStub(channel);
  auto admin_stub      = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 4) return 1;

      CreateProjectRequest req;
      req.set_name(argv[3]);
      if (argc >= 5) req.set_duration_per_image(std::stod(argv[4]));
      if (argc >= 6) req.set_fps(std::stoi(argv[5]));

      CreateProjectResponse resp;
      auto status = project_stub->CreateProject(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintProject(resp.project());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      ListProjectsRequest  req;
      ListProjectsResponse resp;
      auto status = project_stub->ListProjects(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& p : resp.projects()) PrintProject(p);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 4) return 1;

      GetProjectRequest req;
      req.set_project_id(std::stoll(argv[3]));

      GetProjectResponse resp;
      auto status = project_stub->GetProject(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintProject(resp.project());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "upload") {
      if (argc < 6) return 1;

      std::string   path = argv[4];
      std::ifstream in(path, std::ios::binary);
      if (!in) {
        std::cerr << "cannot read " << path << "\n";
        return 1;
      }
      std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

      UploadImageRequest req;
      req.set_project_id(std::stoll(argv[3]));
      req.set_filename(path);
      req.set_file_data(std::move(data));
      req.set_order_index(std::stoi(argv[5]));
      req.set_mime_type(argc >= 7 ? argv[6] : GuessMimeType(path));

      UploadImageResponse resp;
      auto status = project_stub->UploadImage(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "image=" << resp.image().id() << " path=" << resp.image().file_path()
                << " size=" << resp.image().file_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "images") {
      if (argc < 4) return 1;

      ListProjectImagesRequest req;
      req.set_project_id(std::stoll(argv[3]));

      ListProjectImagesResponse resp;
      auto status = project_stub->ListProjectImages(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& image : resp.images()) {
        std::cout << "order=" << image.order_index() << " id=" << image.id() << " file=" << image.filename()
                  << " size=" << image.file_size() << " mime=" << image.mime_type() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "status") {
      if (argc < 5) return 1;

      auto parsed = ParseStatus(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }

      UpdateProjectStatusRequest req;
      req.set_project_id(std::stoll(argv[3]));
      req.set_status(parsed.value());
      if (argc >= 6) req.set_output_path(argv[5]);

      UpdateProjectStatusResponse resp;
      auto status = project_stub->UpdateProjectStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintProject(resp.project());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "generate") {
      if (argc < 4) return 1;

      GenerateVideoRequest req;
      req.set_project_id(std::stoll(argv[3]));
      req.set_wait(!(argc >= 5 && std::string(argv[4]) == "--async"));

      GenerateVideoResponse resp;
      auto status = generation_stub->GenerateVideo(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (resp.queued()) std::cout << "queued\n";
      if (resp.placeholder()) std::cout << "placeholder output (encoder not installed)\n";
      PrintProject(resp.project());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "download") {
      if (argc < 4) return 1;

      const int64_t project_id = std::stoll(argv[3]);

      if (argc < 5) {
        GetVideoDownloadRequest req;
        req.set_project_id(project_id);

        GetVideoDownloadResponse resp;
        auto status = generation_stub->GetVideoDownload(&ctx, req, &resp);
        if (!status.ok()) return Fail(status);

        std::cout << "url=" << resp.download_url() << " file=" << resp.filename() << " size=" << resp.size_bytes()
                  << "\n";
        return 0;
      }

      std::ofstream out(argv[4], std::ios::binary | std::ios::trunc);
      if (!out) {
        std::cerr << "cannot write " << argv[4] << "\n";
        return 1;
      }

      DownloadVideoRequest req;
      req.set_project_id(project_id);

      auto       reader = generation_stub->DownloadVideo(&ctx, req);
      VideoChunk chunk;
      uint64_t   total = 0;
      while (reader->Read(&chunk)) {
        out.write(chunk.data().data(), static_cast<std::streamsize>(chunk.data().size()));
        total += chunk.data().size();
      }
      auto status = reader->Finish();
      if (!status.ok()) return Fail(status);

      std::cout << "wrote " << total << " bytes to " << argv[4] << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "health") {
      HealthcheckRequest  req;
      HealthcheckResponse resp;
      auto status = admin_stub->Healthcheck(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "status=" << resp.status() << " time=" << resp.timestamp().seconds() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;
      auto status = admin_stub->Stats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "pending=" << resp.projects_pending() << "\n";
      std::cout << "processing=" << resp.projects_processing() << "\n";
      std::cout << "completed=" << resp.projects_completed() << "\n";
      std::cout << "failed=" << resp.projects_failed() << "\n";
      std::cout << "encoder=" << resp.encoder_mode() << "\n";
      return 0;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "number out of range: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
