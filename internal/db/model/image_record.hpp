#pragma once

#include <cstdint>
#include <string>

namespace slideshow::db::model {

struct ImageRecord {
  int64_t     id         = 0;
  int64_t     project_id = 0;
  std::string filename;
  // Store-relative path of the uploaded bytes.
  std::string file_path;
  uint64_t    file_size = 0;
  std::string mime_type;
  // Not unique, not contiguous.
  int32_t  order_index    = 0;
  uint64_t uploaded_at_ms = 0;
};

}
