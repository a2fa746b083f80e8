#pragma once

#include <memory>
#include <string>

#include "cmdai/config.hpp"
#include "cmdai/types.hpp"

namespace cmdai {

class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;
  virtual std::string name() const = 0;

  // Returns the generated text. Throws BackendUnreachable or BackendTimeout.
  virtual std::string complete(const InferenceRequest& request) = 0;
};

std::unique_ptr<IInferenceBackend> make_ollama_backend();
std::unique_ptr<IInferenceBackend> make_backend(BackendType type);

}  // namespace cmdai
