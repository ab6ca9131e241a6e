#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace vkyc::storage {

namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri) {
  std::string resolved_path;

  if (StartsWith(uri, "s3://")) {
    ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(uri, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  if (StartsWith(uri, "file://")) {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(uri, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  std::error_code ec;
  const auto      absolute = std::filesystem::absolute(uri.empty() ? std::string(".") : uri, ec);
  if (ec) {
    return arrow::Status::Invalid("cannot resolve storage path '", uri, "': ", ec.message());
  }
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(absolute.lexically_normal().string(), &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

arrow::Result<arrow::Compression::type> ResolveCompression(const std::string& codec) {
  std::string name = codec;
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (name.empty() || name == "none") {
    return arrow::Compression::UNCOMPRESSED;
  }
  ARROW_ASSIGN_OR_RAISE(auto type, arrow::util::Codec::GetCompressionType(name));
  if (!arrow::util::Codec::IsAvailable(type)) {
    return arrow::Status::NotImplemented("codec '", name, "' is not built into this Arrow");
  }
  return type;
}

void ValidateArtifactName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("artifact name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("artifact name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("artifact name must not be a relative path component");
  }
}

} // namespace vkyc::storage
