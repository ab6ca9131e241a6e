#include "artifact_store.hpp"

#include <arrow/io/interfaces.h>

#include "arrow_utils.hpp"

namespace vkyc::storage {

FileSystemArtifactStore::FileSystemArtifactStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root, std::string location_prefix)
    : fs_(std::move(fs)), root_(std::move(root)), location_prefix_(std::move(location_prefix)) {
  if (!fs_) {
    throw std::invalid_argument("FileSystemArtifactStore: filesystem is required");
  }
  if (!root_.empty()) {
    Unwrap(fs_->CreateDir(root_, /*recursive=*/true));
  }
}

std::shared_ptr<FileSystemArtifactStore> FileSystemArtifactStore::FromUri(const std::string& uri) {
  auto [fs, root] = Unwrap(ResolveFileSystem(uri));
  const auto prefix = fs->type_name() == "s3" ? std::string("s3://") : std::string();
  return std::make_shared<FileSystemArtifactStore>(std::move(fs), std::move(root), prefix);
}

std::string FileSystemArtifactStore::Path(const std::string& name) const {
  ValidateArtifactName(name);
  if (root_.empty()) {
    return name;
  }
  if (root_.back() == '/') {
    return root_ + name;
  }
  return root_ + "/" + name;
}

std::string FileSystemArtifactStore::Put(const std::string& name, const std::shared_ptr<arrow::Buffer>& data) {
  const auto final_path = Path(name);
  const auto tmp_path   = final_path + ".tmp";

  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
    Unwrap(out->Write(data->data(), data->size()));
    Unwrap(out->Close());
  }
  Unwrap(fs_->Move(tmp_path, final_path));

  return location_prefix_ + final_path;
}

} // namespace vkyc::storage
