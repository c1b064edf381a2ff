// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/InferenceClient.hpp>
#include <llm/Sampler.hpp>

#include <memory>
#include <string>

struct llama_model;
struct llama_context;

namespace apkforge
{

/// @brief Configuration for the LLM engine.
struct LlmEngineConfig
{
    std::string modelPath;
    int contextSize = 4096;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto
};

/// @brief Local GGUF inference through llama.cpp.
///
/// One engine serves one completion at a time; concurrent callers are serialized.
/// Cancellation is checked between tokens and inside llama_decode via the context's abort callback.
class LlmEngine final: public InferenceClient
{
  public:
    explicit LlmEngine(SamplerConfig sampler = {});
    ~LlmEngine() override;

    LlmEngine(const LlmEngine&) = delete;
    LlmEngine& operator=(const LlmEngine&) = delete;

    /// @brief Loads a GGUF model from disk.
    /// @param config The engine configuration including model path.
    /// @return Success or a ModelLoadError.
    [[nodiscard]] auto load(const LlmEngineConfig& config) -> VoidResult;

    [[nodiscard]] auto complete(const InferenceRequest& request,
                                std::stop_token stopToken,
                                const StreamCallback& onPiece) -> Result<std::string> override;

    /// @brief Returns true if a model is currently loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

    /// @brief Returns the model's context size.
    [[nodiscard]] auto contextSize() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace apkforge
