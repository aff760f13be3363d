#pragma once

#include <arrow/filesystem/filesystem.h>

#include <filesystem>

#include "internal/storage/artifact_store.hpp"

namespace slideshow::storage {

/*
  Artifact store on the local filesystem using Arrow IO.

  Properties:
    - rooted: all access goes through a SubTreeFileSystem
    - atomic replace writes
*/

class LocalArtifactStore final : public ArtifactStore {
 public:
  // Creates root if it does not exist.
  explicit LocalArtifactStore(std::filesystem::path root);

  bool Exists(const std::string& path) override;
  std::shared_ptr<arrow::Buffer> Read(const std::string& path) override;
  std::shared_ptr<arrow::Buffer> ReadRange(const std::string& path, uint64_t offset, uint64_t length) override;
  void Write(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void Copy(const std::string& src, const std::string& dst) override;
  void CreateDir(const std::string& path) override;
  std::vector<std::string> List(const std::string& dir) override;
  void Remove(const std::string& path, bool recursive) override;
  uint64_t Size(const std::string& path) override;
  std::string LocalPath(const std::string& path) const override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  // Best-effort removal of a half-written temp file.
  void DiscardTemp(const std::string& tmp_path);

  std::filesystem::path                  root_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
};

} // namespace slideshow::storage
