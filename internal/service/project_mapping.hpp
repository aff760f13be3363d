#pragma once

#include "internal/db/model/image_record.hpp"
#include "internal/db/model/project_record.hpp"
#include "slideshow/v1/types.pb.h"

namespace slideshow::service {

slideshow::v1::Project ToProto(const db::model::ProjectRecord& record);
slideshow::v1::Image   ToProto(const db::model::ImageRecord& record);

}
