#include "project_service.hpp"

#include <arrow/buffer.h>

#include <cmath>

#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/project_mapping.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace slideshow::service {

using namespace slideshow::v1;

namespace {

constexpr std::size_t kMaxNameLength       = 255;
constexpr double      kMaxDurationPerImage = 999.99;
constexpr double      kDefaultDuration     = 2.0;
constexpr int32_t     kDefaultFps          = 30;

void RequireProjectId(int64_t project_id) {
  if (project_id <= 0) {
    throw util::InvalidArgument("project_id must be positive");
  }
}

bool IsImageMimeType(const std::string& mime_type) {
  return mime_type.size() > 6 && mime_type.compare(0, 6, "image/") == 0;
}

} // namespace

std::string SanitizeFilename(const std::string& filename) {
  auto slash = filename.find_last_of("/\\");
  auto base  = slash == std::string::npos ? filename : filename.substr(slash + 1);

  std::string out;
  out.reserve(base.size());
  for (unsigned char c : base) {
    if (c < 0x20 || c == 0x7f) continue;
    out.push_back(static_cast<char>(c));
  }
  if (out.empty() || out == "." || out == "..") {
    return "image";
  }
  return out;
}

ProjectService::ProjectService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateProjectResponse ProjectService::CreateProject(const CreateProjectRequest& req) {
  return ObserveRpc("ProjectService.CreateProject", 0, [&] {
    if (req.name().empty() || req.name().size() > kMaxNameLength) {
      throw util::InvalidArgument("name must be 1..255 characters");
    }

    db::model::ProjectRecord record;
    record.name               = req.name();
    record.status             = PROJECT_STATUS_PENDING;
    record.duration_per_image = req.has_duration_per_image() ? req.duration_per_image() : kDefaultDuration;
    record.fps                = req.has_fps() ? req.fps() : kDefaultFps;

    if (!std::isfinite(record.duration_per_image) || record.duration_per_image <= 0.0 ||
        record.duration_per_image > kMaxDurationPerImage) {
      throw util::InvalidArgument("duration_per_image must be within (0, 999.99]");
    }
    if (record.fps < 1 || record.fps > 60) {
      throw util::InvalidArgument("fps must be within 1..60");
    }

    record.created_at_ms = util::NowMillis();
    record.updated_at_ms = record.created_at_ms;

    auto tx = ctx_.repository->Begin();
    db::ThrowIfDbError(ctx_.repository->InsertProject(*tx, record), "create project");
    tx->Commit();

    CreateProjectResponse resp;
    *resp.mutable_project() = ToProto(record);
    return resp;
  });
}

ListProjectsResponse ProjectService::ListProjects(const ListProjectsRequest&) {
  return ObserveRpc("ProjectService.ListProjects", 0, [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListProjects(*tx);
    tx->Commit();

    ListProjectsResponse resp;
    for (const auto& record : records) {
      *resp.add_projects() = ToProto(record);
    }
    return resp;
  });
}

GetProjectResponse ProjectService::GetProject(const GetProjectRequest& req) {
  return ObserveRpc("ProjectService.GetProject", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetProject(*tx, req.project_id());
    tx->Commit();
    if (!record.has_value()) {
      throw util::NotFound("project " + std::to_string(req.project_id()) + " not found");
    }

    GetProjectResponse resp;
    *resp.mutable_project() = ToProto(*record);
    return resp;
  });
}

UploadImageResponse ProjectService::UploadImage(const UploadImageRequest& req) {
  return ObserveRpc("ProjectService.UploadImage", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    if (!IsImageMimeType(req.mime_type())) {
      throw util::InvalidArgument("mime_type must be image/*");
    }
    if (req.order_index() < 0) {
      throw util::InvalidArgument("order_index must be non-negative");
    }
    if (req.file_data().empty()) {
      throw util::InvalidArgument("file_data must not be empty");
    }

    {
      auto tx = ctx_.repository->Begin();
      if (!ctx_.repository->GetProject(*tx, req.project_id()).has_value()) {
        throw util::NotFound("project " + std::to_string(req.project_id()) + " not found");
      }
      tx->Commit();
    }

    const auto filename = SanitizeFilename(req.filename());
    const auto dir      = storage::common::JoinStorePath(ctx_.images_dir, "project_" + std::to_string(req.project_id()));
    const auto path     = storage::common::JoinStorePath(dir, util::ToString(util::GenerateUUID()) + "_" + filename);

    ctx_.store->Write(path, arrow::Buffer::FromString(req.file_data()));

    db::model::ImageRecord record;
    record.project_id     = req.project_id();
    record.filename       = filename;
    record.file_path      = path;
    record.file_size      = req.file_data().size();
    record.mime_type      = req.mime_type();
    record.order_index    = req.order_index();
    record.uploaded_at_ms = util::NowMillis();

    try {
      auto tx = ctx_.repository->Begin();
      db::ThrowIfDbError(ctx_.repository->InsertImage(*tx, record), "upload image");
      tx->Commit();
    } catch (const std::exception&) {
      // no ledger row refers to the bytes; drop them
      try {
        ctx_.store->Remove(path, /*recursive=*/false);
      } catch (const std::exception& e) {
        SLIDESHOW_LOG_WARN("orphaned upload not removed", {observability::StringField("path", path),
                                                           observability::StringField("error", e.what())});
      }
      throw;
    }

    observability::Metrics::Instance().AddUploadedBytes(record.file_size);

    UploadImageResponse resp;
    *resp.mutable_image() = ToProto(record);
    return resp;
  });
}

ListProjectImagesResponse ProjectService::ListProjectImages(const ListProjectImagesRequest& req) {
  return ObserveRpc("ProjectService.ListProjectImages", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    auto tx     = ctx_.repository->Begin();
    auto images = ctx_.repository->ListImagesOrdered(*tx, req.project_id());
    tx->Commit();

    ListProjectImagesResponse resp;
    for (const auto& image : images) {
      *resp.add_images() = ToProto(image);
    }
    return resp;
  });
}

UpdateProjectStatusResponse ProjectService::UpdateProjectStatus(const UpdateProjectStatusRequest& req) {
  return ObserveRpc("ProjectService.UpdateProjectStatus", req.project_id(), [&] {
    RequireProjectId(req.project_id());
    if (req.status() == PROJECT_STATUS_UNSPECIFIED) {
      throw util::InvalidArgument("status must be specified");
    }

    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetProject(*tx, req.project_id());
    if (!record.has_value()) {
      throw util::NotFound("project " + std::to_string(req.project_id()) + " not found");
    }

    record->status        = req.status();
    record->updated_at_ms = util::NowMillis();
    // present but empty clears the path
    if (req.has_output_path()) {
      record->output_path = req.output_path().empty() ? std::nullopt : std::optional<std::string>(req.output_path());
    }

    db::ThrowIfDbError(ctx_.repository->UpdateProject(*tx, *record), "update project status");
    tx->Commit();

    UpdateProjectStatusResponse resp;
    *resp.mutable_project() = ToProto(*record);
    return resp;
  });
}

} // namespace slideshow::service
