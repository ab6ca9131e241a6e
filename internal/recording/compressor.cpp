#include "compressor.hpp"

#include <arrow/memory_pool.h>

#include "internal/storage/arrow_utils.hpp"

namespace vkyc::recording {

using storage::Unwrap;

CodecCompressor::CodecCompressor(const std::string& codec_name) : type_(Unwrap(storage::ResolveCompression(codec_name))) {
  if (type_ != arrow::Compression::UNCOMPRESSED) {
    codec_ = Unwrap(arrow::util::Codec::Create(type_));
  }
}

std::shared_ptr<arrow::Buffer> CodecCompressor::Compress(const std::shared_ptr<arrow::Buffer>& input) {
  if (!codec_) {
    return input;
  }

  const int64_t max_len = codec_->MaxCompressedLen(input->size(), input->data());
  auto          output  = Unwrap(arrow::AllocateResizableBuffer(max_len));

  const int64_t actual = Unwrap(codec_->Compress(input->size(), input->data(), max_len, output->mutable_data()));
  Unwrap(output->Resize(actual, /*shrink_to_fit=*/true));
  return std::shared_ptr<arrow::Buffer>(std::move(output));
}

std::string CodecCompressor::Extension() const {
  switch (type_) {
    case arrow::Compression::UNCOMPRESSED:
      return "";
    case arrow::Compression::ZSTD:
      return ".zst";
    case arrow::Compression::GZIP:
      return ".gz";
    case arrow::Compression::BZ2:
      return ".bz2";
    case arrow::Compression::LZ4:
    case arrow::Compression::LZ4_FRAME:
      return ".lz4";
    default:
      return "." + arrow::util::Codec::GetCodecAsString(type_);
  }
}

} // namespace vkyc::recording
