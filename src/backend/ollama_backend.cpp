#include "cmdai/backend.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "cmdai/errors.hpp"
#include "cmdai/log.hpp"

namespace cmdai {
namespace {

constexpr std::size_t kErrorExcerptBytes = 200;
constexpr long kConnectTimeoutCapSeconds = 10;

struct CurlDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

void ensure_curl_global_init() {
  static std::once_flag once;
  static CURLcode result = CURLE_OK;
  std::call_once(once, []() { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (result != CURLE_OK) {
    throw BackendUnreachable(std::string("libcurl initialisation failed: ") + curl_easy_strerror(result));
  }
}

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userData) {
  auto* body = static_cast<std::string*>(userData);
  body->append(data, size * nmemb);
  return size * nmemb;
}

bool is_chat_endpoint(const std::string& url) {
  std::string path = url.substr(0, url.find_first_of("?#"));
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  const std::string suffix = "/chat";
  return path.size() >= suffix.size() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json build_chat_payload(const InferenceRequest& request) {
  nlohmann::json messages = nlohmann::json::array();
  messages.push_back({{"role", role_to_string(Role::System)}, {"content", request.m_systemPrompt}});
  for (const auto& exchange : request.m_context) {
    messages.push_back({{"role", role_to_string(Role::User)}, {"content", exchange.m_query}});
    messages.push_back({{"role", role_to_string(Role::Assistant)}, {"content", exchange.m_response}});
  }
  messages.push_back({{"role", role_to_string(Role::User)}, {"content", request.m_userText}});
  return {{"model", request.m_model}, {"messages", messages}, {"stream", false}};
}

nlohmann::json build_generate_payload(const InferenceRequest& request) {
  std::string prompt = request.m_systemPrompt;
  if (!prompt.empty()) {
    prompt += "\n\n";
  }
  prompt += request.m_userText;
  return {{"model", request.m_model}, {"prompt", prompt}, {"stream", false}};
}

std::string excerpt(const std::string& body) {
  if (body.size() <= kErrorExcerptBytes) {
    return body;
  }
  return body.substr(0, kErrorExcerptBytes) + "...";
}

std::string parse_response_text(const std::string& body, bool chat) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error&) {
    throw BackendUnreachable("unexpected response from backend (not JSON): " + excerpt(body));
  }

  if (document.is_object() && document.contains("error") && document["error"].is_string()) {
    throw BackendUnreachable("backend error: " + document["error"].get<std::string>());
  }

  const nlohmann::json* text = nullptr;
  if (chat) {
    if (document.is_object() && document.contains("message") && document["message"].is_object() &&
        document["message"].contains("content")) {
      text = &document["message"]["content"];
    }
  } else if (document.is_object() && document.contains("response")) {
    text = &document["response"];
  }

  if (text == nullptr || !text->is_string()) {
    throw BackendUnreachable(std::string("unexpected response from backend (missing ") +
                             (chat ? "message.content" : "response") + "): " + excerpt(body));
  }
  return text->get<std::string>();
}

class OllamaBackend final : public IInferenceBackend {
 public:
  std::string name() const override { return "ollama"; }

  std::string complete(const InferenceRequest& request) override {
    ensure_curl_global_init();

    const std::string url = resolve_endpoint_url(request.m_url);
    const bool chat = is_chat_endpoint(url);
    const std::string payload = (chat ? build_chat_payload(request) : build_generate_payload(request)).dump();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
      throw BackendUnreachable("failed to create libcurl handle");
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    std::string body;
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    const long timeout = request.m_timeoutSeconds > 0 ? request.m_timeoutSeconds : 60;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, std::min(timeout, kConnectTimeoutCapSeconds));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    log_debug("POST " + url + " (" + std::to_string(payload.size()) + " bytes, " +
              (chat ? "chat" : "generate") + ")");

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      throw BackendTimeout("backend did not respond within " + std::to_string(timeout) + "s: " + url);
    }
    if (rc != CURLE_OK) {
      const std::string detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(rc);
      throw BackendUnreachable("connection error: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
      throw BackendUnreachable("HTTP " + std::to_string(status) + " - " + excerpt(body), status);
    }

    return parse_response_text(body, chat);
  }
};

}  // namespace

std::unique_ptr<IInferenceBackend> make_ollama_backend() { return std::make_unique<OllamaBackend>(); }

std::unique_ptr<IInferenceBackend> make_backend(BackendType type) {
  switch (type) {
    case BackendType::Ollama:
      return make_ollama_backend();
  }
  throw std::invalid_argument("unsupported backend type");
}

}  // namespace cmdai
