#include "cmdai/inference_client.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "cmdai/command_extract.hpp"
#include "cmdai/log.hpp"

namespace cmdai {

InferenceClient::InferenceClient(std::unique_ptr<IInferenceBackend> backend) : m_backend(std::move(backend)) {
  if (!m_backend) {
    throw std::invalid_argument("InferenceClient requires a backend");
  }
}

std::string InferenceClient::backend_name() const { return m_backend->name(); }

CommandSuggestion InferenceClient::query(const std::string& userText, const Config& config,
                                         const std::vector<HistoryEntry>& context) const {
  InferenceRequest request;
  request.m_model = config.m_model;
  request.m_url = config.m_url;
  request.m_systemPrompt = config.m_promptPrefix;
  request.m_userText = userText;
  request.m_timeoutSeconds = config.m_timeoutSeconds;
  if (context.size() > kContextExchanges) {
    request.m_context.assign(context.end() - static_cast<std::ptrdiff_t>(kContextExchanges), context.end());
  } else {
    request.m_context = context;
  }

  const auto tStart = std::chrono::steady_clock::now();
  const std::string text = m_backend->complete(request);
  const auto tEnd = std::chrono::steady_clock::now();

  std::ostringstream perf;
  perf << "[perf] backend=" << m_backend->name() << " model=" << request.m_model << " total="
       << std::chrono::duration_cast<std::chrono::milliseconds>(tEnd - tStart).count() << "ms bytes="
       << text.size();
  log_debug(perf.str());

  CommandSuggestion suggestion;
  suggestion.m_text = trim(text);
  if (!suggestion.m_text.empty()) {
    suggestion.m_command = extract_command(suggestion.m_text);
  }
  return suggestion;
}

}  // namespace cmdai
