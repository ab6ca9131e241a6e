#pragma once

#include <cstddef>
#include <string>

namespace vkyc::util {

/*
  Identifier helpers.

  Session ids are RFC4122 v4 UUIDs in canonical lowercase form. Link tokens
  are drawn from [A-Z0-9] so they stay URL-safe and can be read out over the
  phone.
*/

std::string GenerateSessionId();

std::string GenerateToken(std::size_t length);
bool        IsValidToken(const std::string& token);

} // namespace vkyc::util
