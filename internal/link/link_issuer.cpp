#include "link_issuer.hpp"

#include "internal/db/api/check.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vkyc::link {

using namespace vkyc::v1;

namespace {

constexpr int kMaxTokenAttempts = 8;

} // namespace

LinkIssuer::LinkIssuer(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::TimeSource> clock, LinkPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), policy_(std::move(policy)) {
  if (!repository_ || !clock_) {
    throw std::invalid_argument("LinkIssuer: repository and clock are required");
  }
}

VerificationLink LinkIssuer::Issue(const std::string& customer_id, std::optional<std::chrono::milliseconds> ttl) {
  if (customer_id.empty()) {
    throw util::InvalidArgument("customer_id is required");
  }
  const auto effective_ttl = ttl.value_or(policy_.link_ttl);
  if (effective_ttl <= std::chrono::milliseconds::zero()) {
    throw util::InvalidArgument("link ttl must be positive");
  }

  auto tx   = repository_->Begin();
  auto link = IssueInTransaction(*tx, customer_id, clock_->Now() + effective_ttl, "");
  tx->Commit();

  VKYC_LOG_INFO("link issued", {observability::StringField("customer_id", customer_id), observability::RedactedField("token", link.token())});
  return link;
}

VerificationLink LinkIssuer::IssueInTransaction(db::Transaction& tx, const std::string& customer_id, util::TimePoint expires_at,
                                                const std::string& session_id) {
  db::model::LinkRecord record;
  record.customer_id   = customer_id;
  record.issued_at_ms  = util::ToUnixMillis(clock_->Now());
  record.expires_at_ms = util::ToUnixMillis(expires_at);
  record.session_id    = session_id;

  for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
    record.token = util::GenerateToken(policy_.token_length);

    const auto result = repository_->InsertLink(tx, record);
    if (result) {
      return ToProto(record);
    }
    if (result.code != db::ErrorCode::AlreadyExists) {
      db::ThrowIfDbError(result, "insert link");
    }
    VKYC_LOG_DEBUG("link token collision, retrying", {observability::IntField("attempt", attempt + 1)});
  }

  throw util::ResourceExhausted("could not generate a unique link token");
}

ResolveLinkResponse LinkIssuer::Resolve(const std::string& token) {
  if (!util::IsValidToken(token)) {
    throw util::NotFound("link not found");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetLink(*tx, token);
  if (!record) {
    throw util::NotFound("link not found");
  }
  CheckUsable(*record, clock_->Now());

  ResolveLinkResponse response;
  *response.mutable_link() = ToProto(*record);
  response.set_session_id(record->session_id);

  bool can_choose = record->session_id.empty();
  if (!can_choose) {
    const auto session = repository_->GetSession(*tx, record->session_id);
    can_choose         = session && session->state == SESSION_STATE_CREATED;
  }
  if (can_choose) {
    response.add_mode_options(SESSION_MODE_IMMEDIATE);
    response.add_mode_options(SESSION_MODE_SCHEDULED);
  }

  tx->Commit();
  return response;
}

void LinkIssuer::CheckUsable(const db::model::LinkRecord& link, util::TimePoint now) {
  if (!link.superseded_by.empty()) {
    throw util::LinkConsumed("link was superseded by a scheduled link");
  }
  if (link.consumed) {
    throw util::LinkConsumed("link already consumed");
  }
  if (util::ToUnixMillis(now) >= link.expires_at_ms) {
    throw util::LinkExpired("link expired");
  }
}

VerificationLink LinkIssuer::ToProto(const db::model::LinkRecord& record) const {
  VerificationLink link;
  link.set_token(record.token);
  link.set_customer_id(record.customer_id);
  *link.mutable_issued_at()  = util::ToProto(util::FromUnixMillis(record.issued_at_ms));
  *link.mutable_expires_at() = util::ToProto(util::FromUnixMillis(record.expires_at_ms));
  link.set_consumed(record.consumed);
  link.set_superseded_by(record.superseded_by);
  link.set_session_id(record.session_id);
  link.set_url(BuildUrl(record.token, record.session_id));
  return link;
}

std::string LinkIssuer::BuildUrl(const std::string& token, const std::string& session_id) const {
  std::string base = policy_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  auto url = base + "/vkyc/" + token;
  if (!session_id.empty()) {
    url += "?session_id=" + session_id;
  }
  return url;
}

} // namespace vkyc::link
