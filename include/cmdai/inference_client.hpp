#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cmdai/backend.hpp"
#include "cmdai/config.hpp"
#include "cmdai/types.hpp"

namespace cmdai {

class InferenceClient {
 public:
  static constexpr std::size_t kContextExchanges = 5;

  explicit InferenceClient(std::unique_ptr<IInferenceBackend> backend);

  std::string backend_name() const;

  CommandSuggestion query(const std::string& userText, const Config& config,
                          const std::vector<HistoryEntry>& context) const;

 private:
  std::unique_ptr<IInferenceBackend> m_backend;
};

}  // namespace cmdai
