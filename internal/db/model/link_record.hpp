#pragma once

#include <cstdint>
#include <string>

namespace vkyc::db::model {

/*
  Persistent verification link row.

  A link is usable while not consumed, not superseded and now < expires_at.
*/
struct LinkRecord {
  std::string token;
  std::string customer_id;

  int64_t issued_at_ms  = 0;
  int64_t expires_at_ms = 0;

  bool consumed = false;

  // Token of the link that replaced this one (scheduled re-issue).
  std::string superseded_by;

  // Empty until a session is created from the link.
  std::string session_id;
};

} // namespace vkyc::db::model
