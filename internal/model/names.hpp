#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "vkyc/v1/signaling.pb.h"
#include "vkyc/v1/types.pb.h"

namespace vkyc::model {

/*
  Short lowercase names for logs, metrics and the CLI.
*/

std::string_view StateName(vkyc::v1::SessionState state);
std::string_view ReasonName(vkyc::v1::TerminationReason reason);
std::string_view DocumentName(vkyc::v1::DocumentType type);
std::string_view RoleName(vkyc::v1::PeerRole role);
std::string_view RegistryStatusName(vkyc::v1::RegistryStatus status);

// Accepts "PAN"/"pan" and "AADHAAR"/"aadhaar".
std::optional<vkyc::v1::DocumentType> ParseDocumentType(std::string_view value);

std::optional<vkyc::v1::TerminationReason> ParseReason(std::string_view value);

// What the end user sees for a terminal session.
vkyc::v1::EndCategory EndCategoryFor(vkyc::v1::SessionState state, vkyc::v1::TerminationReason reason);

} // namespace vkyc::model
