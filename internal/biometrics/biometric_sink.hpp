#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vkyc::biometrics {

class BiometricSink {
 public:
  virtual ~BiometricSink() = default;

  // All or nothing.
  virtual db::Result Write(const std::vector<db::model::BiometricEventRecord>& events) = 0;
};

class RepositoryBiometricSink final : public BiometricSink {
 public:
  explicit RepositoryBiometricSink(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  }

  db::Result Write(const std::vector<db::model::BiometricEventRecord>& events) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace vkyc::biometrics
