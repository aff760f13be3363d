#include "local_artifact_store.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace slideshow::storage {

using namespace slideshow::storage::common;

namespace {

arrow::fs::FileInfo Stat(arrow::fs::FileSystem& fs, const std::string& path) {
  return ValueOrThrow(fs.GetFileInfo(path), "stat", path);
}

} // namespace

LocalArtifactStore::LocalArtifactStore(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()) {
  auto local = std::make_shared<arrow::fs::LocalFileSystem>();
  ThrowIfError(local->CreateDir(root_.string(), /*recursive=*/true), "create root", root_.string());
  fs_ = std::make_shared<arrow::fs::SubTreeFileSystem>(root_.string(), local);
}

bool LocalArtifactStore::Exists(const std::string& path) {
  ValidateStorePath(path);
  return Stat(*fs_, path).type() != arrow::fs::FileType::NotFound;
}

std::shared_ptr<arrow::Buffer> LocalArtifactStore::Read(const std::string& path) {
  ValidateStorePath(path);
  auto input = ValueOrThrow(fs_->OpenInputFile(path), "open", path);
  auto size  = ValueOrThrow(input->GetSize(), "size", path);
  return ValueOrThrow(input->ReadAt(0, size), "read", path);
}

std::shared_ptr<arrow::Buffer> LocalArtifactStore::ReadRange(const std::string& path, uint64_t offset, uint64_t length) {
  ValidateStorePath(path);
  auto input = ValueOrThrow(fs_->OpenInputFile(path), "open", path);
  auto size  = static_cast<uint64_t>(ValueOrThrow(input->GetSize(), "size", path));
  if (offset >= size) {
    return std::make_shared<arrow::Buffer>(nullptr, 0);
  }
  auto n = std::min(length, size - offset);
  return ValueOrThrow(input->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(n)), "read", path);
}

void LocalArtifactStore::Write(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  ValidateStorePath(path);

  auto parent = ParentOf(path);
  if (!parent.empty()) {
    ThrowIfError(fs_->CreateDir(parent, /*recursive=*/true), "mkdir", parent);
  }

  // unique suffix so concurrent writers never share a temp file
  auto tmp_path = path + ".tmp-" + util::ShortToken();
  try {
    {
      auto out = ValueOrThrow(fs_->OpenOutputStream(tmp_path), "create", tmp_path);
      ThrowIfError(out->Write(buffer->data(), buffer->size()), "write", tmp_path);
      ThrowIfError(out->Close(), "close", tmp_path);
    }
    ThrowIfError(fs_->Move(tmp_path, path), "rename", path);
  } catch (const std::exception&) {
    DiscardTemp(tmp_path);
    throw;
  }
}

void LocalArtifactStore::DiscardTemp(const std::string& tmp_path) {
  auto info = fs_->GetFileInfo(tmp_path);
  if (!info.ok() || info->type() != arrow::fs::FileType::File) {
    return;
  }
  auto status = fs_->DeleteFile(tmp_path);
  if (!status.ok()) {
    SLIDESHOW_LOG_WARN("temp file cleanup failed", {observability::StringField("path", tmp_path),
                                                    observability::StringField("error", status.ToString())});
  }
}

void LocalArtifactStore::Copy(const std::string& src, const std::string& dst) {
  ValidateStorePath(src);
  ValidateStorePath(dst);

  auto parent = ParentOf(dst);
  if (!parent.empty()) {
    ThrowIfError(fs_->CreateDir(parent, /*recursive=*/true), "mkdir", parent);
  }
  ThrowIfError(fs_->CopyFile(src, dst), "copy", src + " -> " + dst);
}

void LocalArtifactStore::CreateDir(const std::string& path) {
  ValidateStorePath(path);
  ThrowIfError(fs_->CreateDir(path, /*recursive=*/true), "mkdir", path);
}

std::vector<std::string> LocalArtifactStore::List(const std::string& dir) {
  ValidateStorePath(dir);

  arrow::fs::FileSelector selector;
  selector.base_dir        = dir;
  selector.allow_not_found = true;
  selector.recursive       = false;

  std::vector<std::string> out;
  for (const auto& info : ValueOrThrow(fs_->GetFileInfo(selector), "list", dir)) {
    out.push_back(JoinStorePath(dir, info.base_name()));
  }
  std::sort(out.begin(), out.end());
  return out;
}

void LocalArtifactStore::Remove(const std::string& path, bool recursive) {
  ValidateStorePath(path);

  auto info = Stat(*fs_, path);
  switch (info.type()) {
    case arrow::fs::FileType::NotFound:
      return;
    case arrow::fs::FileType::Directory:
      if (!recursive && !List(path).empty()) {
        throw std::runtime_error("directory not empty: " + path);
      }
      ThrowIfError(fs_->DeleteDir(path), "rmdir", path);
      return;
    default:
      ThrowIfError(fs_->DeleteFile(path), "delete", path);
      return;
  }
}

uint64_t LocalArtifactStore::Size(const std::string& path) {
  ValidateStorePath(path);
  auto info = Stat(*fs_, path);
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("artifact not found: " + path);
  }
  return static_cast<uint64_t>(info.size());
}

std::string LocalArtifactStore::LocalPath(const std::string& path) const {
  ValidateStorePath(path);
  return (root_ / path).string();
}

} // namespace slideshow::storage
