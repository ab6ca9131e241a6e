#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "vkyc/v1.hpp"

namespace vkyc::link {

struct LinkPolicy {
  std::string                 base_url{"http://localhost:3000"};
  std::size_t                 token_length{16};
  std::chrono::milliseconds   link_ttl{std::chrono::hours(24)};
  std::chrono::milliseconds   scheduled_link_ttl{std::chrono::hours(24)};
};

/*
  Issues and resolves single-use verification links.

  Links are never deleted. A link stops being resolvable once it expires,
  is consumed by BeginSession or is superseded by a scheduled re-issue.
*/
class LinkIssuer {
 public:
  LinkIssuer(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock, LinkPolicy policy);

  vkyc::v1::VerificationLink Issue(const std::string& customer_id, std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  // Issues inside a caller-owned transaction; used for the scheduled re-issue.
  vkyc::v1::VerificationLink IssueInTransaction(db::Transaction& tx, const std::string& customer_id, util::TimePoint expires_at,
                                                const std::string& session_id);

  // Throws NotFound, LinkExpired or LinkConsumed.
  vkyc::v1::ResolveLinkResponse Resolve(const std::string& token);

  // Throws LinkExpired or LinkConsumed when the link can no longer start a session.
  static void CheckUsable(const db::model::LinkRecord& link, util::TimePoint now);

  vkyc::v1::VerificationLink ToProto(const db::model::LinkRecord& record) const;

  std::string BuildUrl(const std::string& token, const std::string& session_id) const;

  const LinkPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<util::TimeSource> clock_;
  LinkPolicy                        policy_;
};

} // namespace vkyc::link
