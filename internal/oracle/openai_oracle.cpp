#include "openai_oracle.hpp"

#include <curl/curl.h>
#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/oracle/prompts.hpp"
#include "internal/oracle/response_parser.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace blockforge::oracle {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

google::protobuf::Value Message(const std::string& role, const std::string& content) {
  google::protobuf::Value message;
  auto&                   fields = *message.mutable_struct_value()->mutable_fields();
  fields["role"].set_string_value(role);
  fields["content"].set_string_value(content);
  return message;
}

std::string BuildRequestBody(const OpenAiOracleOptions& options, const std::string& system_prompt, const std::string& user_message) {
  google::protobuf::Struct request;
  auto&                    fields = *request.mutable_fields();
  fields["model"].set_string_value(options.model);
  fields["temperature"].set_number_value(options.temperature);
  fields["max_tokens"].set_number_value(options.max_tokens);

  auto* messages = fields["messages"].mutable_list_value();
  *messages->add_values() = Message("system", system_prompt);
  *messages->add_values() = Message("user", user_message);
  return util::ToJson(request);
}

// choices[0].message.content
std::string ExtractContent(const std::string& body) {
  const auto response = util::ParseJsonObject(body);
  if (!response) {
    throw util::OracleFailure("oracle returned malformed JSON");
  }
  const auto choices = response->fields().find("choices");
  if (choices == response->fields().end() || !choices->second.has_list_value() || choices->second.list_value().values_size() == 0) {
    throw util::OracleFailure("oracle response has no choices");
  }
  const auto& choice = choices->second.list_value().values(0);
  if (!choice.has_struct_value()) {
    throw util::OracleFailure("oracle response has a malformed choice");
  }
  const auto message = choice.struct_value().fields().find("message");
  if (message == choice.struct_value().fields().end() || !message->second.has_struct_value()) {
    throw util::OracleFailure("oracle response has no message");
  }
  const auto content = message->second.struct_value().fields().find("content");
  if (content == message->second.struct_value().fields().end() || content->second.kind_case() != google::protobuf::Value::kStringValue) {
    throw util::OracleFailure("oracle response has no message content");
  }
  return content->second.string_value();
}

} // namespace

OpenAiOracleOptions OpenAiOracleOptions::FromConfig(const blockforge::runtime::config::OracleConfig& config) {
  OpenAiOracleOptions options;
  if (!config.endpoint().empty()) options.endpoint = config.endpoint();
  if (!config.model().empty()) options.model = config.model();
  if (config.temperature() != 0.0) options.temperature = config.temperature();
  if (config.max_tokens() != 0) options.max_tokens = config.max_tokens();
  if (config.request_timeout_ms() != 0) options.request_timeout_ms = config.request_timeout_ms();

  const std::string env_name = config.api_key_env().empty() ? "OPENAI_API_KEY" : config.api_key_env();
  if (const char* key = std::getenv(env_name.c_str())) {
    options.api_key = key;
  }
  return options;
}

OpenAiOracle::OpenAiOracle(OpenAiOracleOptions options) : options_(std::move(options)) {
  EnsureCurlInitialized();
  if (options_.api_key.empty()) {
    BLOCKFORGE_LOG_WARN("oracle api key is empty; requests will be rejected", {observability::StringField("endpoint", options_.endpoint)});
  }
}

GeneratedCode OpenAiOracle::Generate(const std::string& prompt, const std::optional<GenerationContext>& context) {
  observability::SpanScope span("oracle.Generate");
  return ParseOracleResponse(Complete(GenerationSystemPrompt(), FormatGenerationMessage(prompt, context)));
}

GeneratedCode OpenAiOracle::Heal(const std::string& original_prompt, const std::string& error_message, const std::string& failed_code) {
  observability::SpanScope span("oracle.Heal");
  return ParseOracleResponse(Complete(HealingSystemPrompt(), FormatHealingMessage(original_prompt, error_message, failed_code)));
}

std::string OpenAiOracle::Complete(const std::string& system_prompt, const std::string& user_message) {
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::OracleFailure("curl_easy_init failed");
  }

  const auto request_body = BuildRequestBody(options_, system_prompt, user_message);
  std::string response_body;

  HeaderList headers(nullptr, &curl_slist_free_all);
  auto       append_header = [&headers](const std::string& header) {
    curl_slist* next = curl_slist_append(headers.get(), header.c_str());
    if (!next) {
      throw util::OracleFailure("curl_slist_append failed");
    }
    headers.release();
    headers.reset(next);
  };
  append_header("Content-Type: application/json");
  append_header("Authorization: Bearer " + options_.api_key);

  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.endpoint.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request_body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);

  const auto start = std::chrono::steady_clock::now();
  const auto rc    = curl_easy_perform(curl.get());
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  if (rc != CURLE_OK) {
    BLOCKFORGE_LOG_ERROR("oracle request failed", {observability::StringField("error", curl_easy_strerror(rc)),
                                                   observability::IntField("elapsed_ms", elapsed_ms)});
    throw util::OracleFailure(std::string("oracle request failed: ") + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    BLOCKFORGE_LOG_ERROR("oracle returned an error status", {observability::IntField("status", status),
                                                             observability::IntField("elapsed_ms", elapsed_ms)});
    throw util::OracleFailure("oracle returned HTTP " + std::to_string(status));
  }

  BLOCKFORGE_LOG_INFO("oracle request completed", {observability::IntField("status", status), observability::IntField("elapsed_ms", elapsed_ms),
                                                   observability::IntField("response_bytes", static_cast<std::int64_t>(response_body.size()))});
  return ExtractContent(response_body);
}

} // namespace blockforge::oracle
