#include "biometric_sink.hpp"

#include <exception>

namespace vkyc::biometrics {

db::Result RepositoryBiometricSink::Write(const std::vector<db::model::BiometricEventRecord>& events) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->AppendBiometricEvents(*tx, events);
    if (!result) {
      tx->Rollback();
      return result;
    }
    tx->Commit();
    return db::Result::Ok();
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::IOError, e.what());
  }
}

} // namespace vkyc::biometrics
