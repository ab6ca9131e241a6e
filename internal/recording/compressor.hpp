#pragma once

#include <arrow/buffer.h>
#include <arrow/util/compression.h>

#include <memory>
#include <string>

namespace vkyc::recording {

class Compressor {
 public:
  virtual ~Compressor() = default;

  // Throws on codec failure.
  virtual std::shared_ptr<arrow::Buffer> Compress(const std::shared_ptr<arrow::Buffer>& input) = 0;

  // Suffix for stored artifacts, e.g. ".zst"; empty when uncompressed.
  virtual std::string Extension() const = 0;
};

/*
  Compressor backed by arrow::util::Codec.
*/
class CodecCompressor final : public Compressor {
 public:
  // Throws std::runtime_error for an unknown or unavailable codec.
  explicit CodecCompressor(const std::string& codec_name);

  std::shared_ptr<arrow::Buffer> Compress(const std::shared_ptr<arrow::Buffer>& input) override;
  std::string                    Extension() const override;

 private:
  arrow::Compression::type            type_;
  std::unique_ptr<arrow::util::Codec> codec_;
};

} // namespace vkyc::recording
