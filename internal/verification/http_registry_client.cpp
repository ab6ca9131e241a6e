#include "http_registry_client.hpp"

#include <google/protobuf/util/json_util.h>

#include "http_client.hpp"
#include "internal/model/names.hpp"
#include "vkyc/v1/external.pb.h"

namespace vkyc::verification {

HttpRegistryClient::HttpRegistryClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {
}

RegistryResponse HttpRegistryClient::Verify(const std::map<std::string, std::string>& fields, vkyc::v1::DocumentType document_type,
                                            std::chrono::milliseconds timeout) {
  if (endpoint_.url.empty()) {
    return {RegistryOutcome::kUnavailable, "no registry endpoint configured"};
  }

  vkyc::v1::RegistryRequest request;
  request.set_doc_type(std::string(model::DocumentName(document_type)));
  request.mutable_doc_info()->insert(fields.begin(), fields.end());

  google::protobuf::util::JsonPrintOptions print;
  print.preserve_proto_field_names = true;

  std::string body;
  if (!google::protobuf::util::MessageToJsonString(request, &body, print).ok()) {
    return {RegistryOutcome::kTransportError, "failed to encode registry request"};
  }

  const auto response = HttpClient::PostJson(endpoint_.url, body, endpoint_.bearer_token, timeout);
  switch (response.transport) {
    case HttpTransport::kTimeout:
      return {RegistryOutcome::kTimeout, response.error};
    case HttpTransport::kError:
      return {RegistryOutcome::kTransportError, response.error};
    case HttpTransport::kOk:
      break;
  }
  return ParseReply(response.status_code, response.body);
}

RegistryResponse HttpRegistryClient::ParseReply(long status_code, const std::string& body) {
  if (status_code == 408 || status_code == 429 || status_code >= 500) {
    return {RegistryOutcome::kUnavailable, "registry HTTP " + std::to_string(status_code)};
  }
  if (status_code >= 400 && status_code < 500) {
    return {RegistryOutcome::kRejected, "registry HTTP " + std::to_string(status_code)};
  }
  if (status_code < 200 || status_code >= 300) {
    return {RegistryOutcome::kTransportError, "registry HTTP " + std::to_string(status_code)};
  }

  vkyc::v1::RegistryReply reply;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(body, &reply, options).ok()) {
    return {RegistryOutcome::kTransportError, "malformed registry reply"};
  }

  if (reply.unavailable()) {
    return {RegistryOutcome::kUnavailable, reply.message()};
  }
  if (reply.verified()) {
    return {RegistryOutcome::kMatched, reply.message()};
  }
  return {RegistryOutcome::kMismatched, reply.message().empty() ? "registry reported a mismatch" : reply.message()};
}

} // namespace vkyc::verification
