#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace slideshow::storage {

/*
  Durable store for uploaded images, staged frames and generated videos.

  Every path is store-relative ("videos/project_1_....mp4"); absolute
  paths and ".." components are rejected with util::InvalidArgument.
  Backend failures surface as std::runtime_error.

  Implementations:
    LOCAL → Arrow LocalFileSystem rooted at storage.root_path
*/

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual bool Exists(const std::string& path) = 0;

  // Whole file as one buffer.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& path) = 0;

  // At most length bytes starting at offset; empty at end of file.
  virtual std::shared_ptr<arrow::Buffer> ReadRange(const std::string& path, uint64_t offset, uint64_t length) = 0;

  /*
    Atomic write:
        write tmp → close → rename
    Parent directories are created as needed.
  */
  virtual void Write(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  virtual void Copy(const std::string& src, const std::string& dst) = 0;

  virtual void CreateDir(const std::string& path) = 0;

  // Immediate children of dir as store paths, sorted. Missing dir → empty.
  virtual std::vector<std::string> List(const std::string& dir) = 0;

  /*
    Remove a file or directory. Missing paths are not an error.
    A non-empty directory requires recursive = true.
  */
  virtual void Remove(const std::string& path, bool recursive) = 0;

  virtual uint64_t Size(const std::string& path) = 0;

  // Absolute filesystem path, for handing to an external process.
  virtual std::string LocalPath(const std::string& path) const = 0;
};

} // namespace slideshow::storage
