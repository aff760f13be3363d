#include "project_mapping.hpp"

#include "internal/util/time.hpp"

namespace slideshow::service {

slideshow::v1::Project ToProto(const db::model::ProjectRecord& record) {
  slideshow::v1::Project project;
  project.set_id(record.id);
  project.set_name(record.name);
  project.set_status(record.status);
  if (record.output_path.has_value()) {
    project.set_output_path(*record.output_path);
  }
  project.set_duration_per_image(record.duration_per_image);
  project.set_fps(record.fps);
  *project.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *project.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return project;
}

slideshow::v1::Image ToProto(const db::model::ImageRecord& record) {
  slideshow::v1::Image image;
  image.set_id(record.id);
  image.set_project_id(record.project_id);
  image.set_filename(record.filename);
  image.set_file_path(record.file_path);
  image.set_file_size(record.file_size);
  image.set_mime_type(record.mime_type);
  image.set_order_index(record.order_index);
  *image.mutable_uploaded_at() = util::MillisToProto(record.uploaded_at_ms);
  return image;
}

} // namespace slideshow::service
