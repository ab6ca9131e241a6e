#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "internal/model/names.hpp"
#include "vkyc/v1_grpc.hpp"

using namespace vkyc::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vkycctl <addr> issue <customer_id> [ttl_seconds]\n"
            << "  vkycctl <addr> resolve <token>\n"
            << "  vkycctl <addr> create <token>\n"
            << "  vkycctl <addr> mode <session_id> immediate\n"
            << "  vkycctl <addr> mode <session_id> scheduled <unix_seconds>\n"
            << "  vkycctl <addr> begin <session_id>\n"
            << "  vkycctl <addr> verify <session_id> <pan|aadhaar> <image_file>\n"
            << "  vkycctl <addr> complete <session_id>\n"
            << "  vkycctl <addr> fail <session_id> <reason> [detail]\n"
            << "  vkycctl <addr> expire <session_id>\n"
            << "  vkycctl <addr> waiting\n"
            << "  vkycctl <addr> accept <session_id> <agent_id>\n"
            << "  vkycctl <addr> decline <session_id> <agent_id>\n"
            << "  vkycctl <addr> get <session_id>\n"
            << "  vkycctl <addr> biometrics <session_id>\n";
}

static int Print(const ::grpc::Status& status, const google::protobuf::Message& message) {
  if (!status.ok()) {
    std::cerr << status.error_code();
    if (!status.error_details().empty()) {
      std::cerr << " (" << status.error_details() << ")";
    }
    std::cerr << ": " << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SessionService::NewStub(channel);

  grpc::ClientContext ctx;

  if (cmd == "waiting") {
    ListWaitingSessionsResponse resp;
    return Print(stub->ListWaitingSessions(&ctx, ListWaitingSessionsRequest{}, &resp), resp);
  }
  if (argc < 4) {
    Usage();
    return 1;
  }
  const std::string arg = argv[3];

  // ------------------------------------------------------------

  if (cmd == "issue") {
    IssueLinkRequest req;
    req.set_customer_id(arg);
    if (argc >= 5) {
      req.set_ttl_seconds(std::stoull(argv[4]));
    }
    IssueLinkResponse resp;
    return Print(stub->IssueLink(&ctx, req, &resp), resp);
  }

  if (cmd == "resolve") {
    ResolveLinkRequest req;
    req.set_token(arg);
    ResolveLinkResponse resp;
    return Print(stub->ResolveLink(&ctx, req, &resp), resp);
  }

  if (cmd == "create") {
    CreateSessionRequest req;
    req.set_token(arg);
    SessionResponse resp;
    return Print(stub->CreateSession(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "mode") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    ChooseModeRequest req;
    req.set_session_id(arg);

    const std::string mode = argv[4];
    if (mode == "immediate") {
      req.set_mode(SESSION_MODE_IMMEDIATE);
    } else if (mode == "scheduled" && argc >= 6) {
      req.set_mode(SESSION_MODE_SCHEDULED);
      req.mutable_scheduled_at()->set_seconds(std::stoll(argv[5]));
    } else {
      Usage();
      return 1;
    }
    ChooseModeResponse resp;
    return Print(stub->ChooseMode(&ctx, req, &resp), resp);
  }

  if (cmd == "verify") {
    if (argc < 6) {
      Usage();
      return 1;
    }
    const auto document_type = vkyc::model::ParseDocumentType(argv[4]);
    if (!document_type) {
      std::cerr << "unsupported document type: " << argv[4] << "\n";
      return 1;
    }
    auto image = ReadFile(argv[5]);
    if (!image) {
      std::cerr << "cannot read " << argv[5] << "\n";
      return 1;
    }

    RequestVerificationRequest req;
    req.set_session_id(arg);
    req.set_document_type(*document_type);
    req.set_image(std::move(*image));
    SessionResponse resp;
    return Print(stub->RequestVerification(&ctx, req, &resp), resp);
  }

  if (cmd == "fail") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    const auto reason = vkyc::model::ParseReason(argv[4]);
    if (!reason) {
      std::cerr << "unsupported reason: " << argv[4] << "\n";
      return 1;
    }

    FailSessionRequest req;
    req.set_session_id(arg);
    req.set_reason(*reason);
    if (argc >= 6) {
      req.set_detail(argv[5]);
    }
    SessionResponse resp;
    return Print(stub->FailSession(&ctx, req, &resp), resp);
  }

  if (cmd == "accept" || cmd == "decline") {
    if (argc < 5) {
      Usage();
      return 1;
    }
    AgentSessionRequest req;
    req.set_session_id(arg);
    req.set_agent_id(argv[4]);
    SessionResponse resp;
    return Print(cmd == "accept" ? stub->AcceptSession(&ctx, req, &resp) : stub->DeclineSession(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  SessionRequest req;
  req.set_session_id(arg);

  if (cmd == "begin") {
    SessionResponse resp;
    return Print(stub->BeginSession(&ctx, req, &resp), resp);
  }
  if (cmd == "complete") {
    SessionResponse resp;
    return Print(stub->CompleteSession(&ctx, req, &resp), resp);
  }
  if (cmd == "expire") {
    SessionResponse resp;
    return Print(stub->ExpireSession(&ctx, req, &resp), resp);
  }
  if (cmd == "get") {
    GetSessionResponse resp;
    return Print(stub->GetSession(&ctx, req, &resp), resp);
  }
  if (cmd == "biometrics") {
    ListBiometricEventsResponse resp;
    return Print(stub->ListBiometricEvents(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
