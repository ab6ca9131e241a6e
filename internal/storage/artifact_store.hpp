#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

namespace vkyc::storage {

/*
  Write-once store for finished recording artifacts.
*/
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // Returns the artifact's location URI.
  virtual std::string Put(const std::string& name, const std::shared_ptr<arrow::Buffer>& data) = 0;
};

/*
  ArtifactStore over an Arrow filesystem (local disk or S3).

  Object layout:

      <root>/<name>

  Writes go to <name>.tmp and are moved into place once closed.
*/
class FileSystemArtifactStore final : public ArtifactStore {
 public:
  FileSystemArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, std::string location_prefix);

  static std::shared_ptr<FileSystemArtifactStore> FromUri(const std::string& uri);

  std::string Put(const std::string& name, const std::shared_ptr<arrow::Buffer>& data) override;

 private:
  std::string Path(const std::string& name) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_;
  std::string                            location_prefix_;
};

} // namespace vkyc::storage
