#pragma once

#include <chrono>
#include <map>
#include <string>

#include "types.hpp"

namespace vkyc::verification {

/*
  Document registry capability.

  A call that exceeds its timeout reports RegistryOutcome::kTimeout.
*/
class RegistryService {
 public:
  virtual ~RegistryService() = default;

  virtual RegistryResponse Verify(const std::map<std::string, std::string>& fields, vkyc::v1::DocumentType document_type,
                                  std::chrono::milliseconds timeout) = 0;
};

} // namespace vkyc::verification
