#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace vkyc::storage {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Resolves a storage URI to a filesystem and the root path inside it.

    s3://bucket/prefix   -> S3 (initialized on first use)
    file:///abs/path     -> local
    relative/or/abs/path -> local, made absolute
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri);

// "zstd", "gzip", "lz4", "snappy", "brotli", "bz2" or "uncompressed".
arrow::Result<arrow::Compression::type> ResolveCompression(const std::string& codec);

// Throws std::invalid_argument for names that could escape the root.
void ValidateArtifactName(const std::string& name);

} // namespace vkyc::storage
