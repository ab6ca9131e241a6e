#include "http_ocr_client.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "http_client.hpp"
#include "internal/model/names.hpp"
#include "vkyc/v1/external.pb.h"

namespace vkyc::verification {

namespace {

std::string ValueToString(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      return std::to_string(number);
    }
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return {};
  }
}

void CollectFields(const google::protobuf::Struct& source, OcrResult* result) {
  for (const auto& [key, value] : source.fields()) {
    if (key == "success" || key == "error" || key == "confidence" || key == "data") {
      continue;
    }
    auto text = ValueToString(value);
    if (!text.empty()) {
      result->fields.emplace(key, std::move(text));
    }
  }
}

const google::protobuf::Value* Find(const google::protobuf::Struct& source, const std::string& key) {
  const auto it = source.fields().find(key);
  return it == source.fields().end() ? nullptr : &it->second;
}

} // namespace

HttpOcrClient::HttpOcrClient(std::map<vkyc::v1::DocumentType, HttpEndpoint> endpoints) : endpoints_(std::move(endpoints)) {
}

OcrResult HttpOcrClient::Extract(const std::string& image, vkyc::v1::DocumentType document_type, std::chrono::milliseconds timeout) {
  const auto it = endpoints_.find(document_type);
  if (it == endpoints_.end() || it->second.url.empty()) {
    OcrResult result;
    result.error = "no OCR endpoint for " + std::string(model::DocumentName(document_type));
    return result;
  }

  vkyc::v1::OcrRequest request;
  request.set_image(image);

  std::string body;
  if (!google::protobuf::util::MessageToJsonString(request, &body).ok()) {
    OcrResult result;
    result.error = "failed to encode OCR request";
    return result;
  }

  const auto response = HttpClient::PostJson(it->second.url, body, it->second.bearer_token, timeout);
  if (response.transport == HttpTransport::kTimeout) {
    OcrResult result;
    result.error = "OCR timed out";
    return result;
  }
  if (!response.Success()) {
    OcrResult result;
    result.error = response.error.empty() ? "OCR API error: HTTP " + std::to_string(response.status_code) : response.error;
    return result;
  }
  return ParseReply(response.body);
}

OcrResult HttpOcrClient::ParseReply(const std::string& body) {
  OcrResult result;

  google::protobuf::Struct reply;
  if (!google::protobuf::util::JsonStringToMessage(body, &reply).ok()) {
    result.error = "malformed OCR reply";
    return result;
  }

  if (const auto* success = Find(reply, "success"); success && success->kind_case() == google::protobuf::Value::kBoolValue &&
                                                    !success->bool_value()) {
    const auto* error = Find(reply, "error");
    result.error      = error ? ValueToString(*error) : "OCR reported failure";
    return result;
  }
  if (const auto* error = Find(reply, "error"); error && !ValueToString(*error).empty()) {
    result.error = ValueToString(*error);
    return result;
  }

  const auto* data = Find(reply, "data");
  if (data && data->kind_case() == google::protobuf::Value::kStructValue) {
    CollectFields(data->struct_value(), &result);
  } else {
    CollectFields(reply, &result);
  }

  result.confidence   = 1.0;
  const auto* conf    = Find(reply, "confidence");
  if (!conf && data && data->kind_case() == google::protobuf::Value::kStructValue) {
    conf = Find(data->struct_value(), "confidence");
  }
  if (conf && conf->kind_case() == google::protobuf::Value::kNumberValue) {
    result.confidence = conf->number_value() > 1.0 ? conf->number_value() / 100.0 : conf->number_value();
  }

  if (result.fields.empty()) {
    result.error = "OCR reply carried no fields";
    return result;
  }

  result.ok = true;
  return result;
}

} // namespace vkyc::verification
