// SPDX-License-Identifier: Apache-2.0
#include "LlmEngine.hpp"

#include <core/Log.hpp>
#include <llm/PromptComposer.hpp>

#include <llama.h>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace apkforge
{

namespace
{
    /// Rough characters-per-token estimate used to size the prompt budget.
    constexpr auto CharsPerToken = 3;

    auto llamaLogMutex = std::mutex {};
    auto llamaLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output to apkforge::log, one complete line at a time.
    ///
    /// llama.cpp emits partial lines (GGML_LOG_LEVEL_CONT); they are buffered until a newline arrives.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto const _ = std::lock_guard { llamaLogMutex };
        llamaLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = llamaLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = llamaLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);
            if (!line.empty() && end != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

    /// @brief Classifies a llama_decode() failure.
    ///
    /// 1 means no KV-cache slot was available, which clears up once memory is released.
    /// 2 means the abort callback fired.
    auto decodeError(int status, std::string_view what) -> std::unexpected<Error>
    {
        if (status == 1)
            return makeError(ErrorCode::TransientInferenceError,
                             std::format("{}: no KV cache slot available", what));
        if (status == 2)
            return makeError(ErrorCode::Cancelled, std::format("{}: aborted", what));
        return makeError(ErrorCode::FatalInferenceError, std::format("{} (status {})", what, status));
    }

    struct SamplerDeleter
    {
        void operator()(llama_sampler* sampler) const { llama_sampler_free(sampler); }
    };
    using SamplerChain = std::unique_ptr<llama_sampler, SamplerDeleter>;

    auto makeSamplerChain(const SamplerConfig& config) -> SamplerChain
    {
        auto chain = SamplerChain { llama_sampler_chain_init(llama_sampler_chain_default_params()) };
        llama_sampler_chain_add(chain.get(),
                                llama_sampler_init_penalties(config.repeatLastN, config.repeatPenalty, 0.0f, 0.0f));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_top_k(config.topK));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_top_p(config.topP, 1));
        llama_sampler_chain_add(chain.get(), llama_sampler_init_temp(config.temperature));
        llama_sampler_chain_add(
            chain.get(),
            llama_sampler_init_dist(config.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(config.seed)));
        return chain;
    }

    /// @brief Returns the text of @p token, growing the buffer for unusually long pieces.
    auto tokenToPiece(const llama_vocab* vocab, llama_token token) -> std::string
    {
        auto piece = std::string(256, '\0');
        auto length = llama_token_to_piece(vocab, token, piece.data(), static_cast<int32_t>(piece.size()), 0, true);
        if (length < 0)
        {
            // A negative result is the buffer size actually required.
            piece.resize(static_cast<std::size_t>(-length));
            length = llama_token_to_piece(vocab, token, piece.data(), static_cast<int32_t>(piece.size()), 0, true);
        }
        if (length <= 0)
            return {};
        piece.resize(static_cast<std::size_t>(length));
        return piece;
    }
} // namespace

struct LlmEngine::Impl
{
    SamplerConfig sampler;
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    int ctxSize = 0;

    std::mutex generateMutex;
    std::atomic<bool> abortRequested = false;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }

    static auto abortCallback(void* data) -> bool
    {
        return static_cast<Impl*>(data)->abortRequested.load();
    }

    auto applyChatTemplate(const std::vector<PromptMessage>& messages) const -> Result<std::string>;
    auto tokenize(const std::string& prompt) const -> Result<std::vector<llama_token>>;
};

auto LlmEngine::Impl::applyChatTemplate(const std::vector<PromptMessage>& messages) const -> Result<std::string>
{
    auto const* tmpl = llama_model_chat_template(model, nullptr);
    auto const chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    auto llamaMsgs = std::vector<llama_chat_message> {};
    llamaMsgs.reserve(messages.size());
    auto totalLength = std::size_t { 0 };
    for (const auto& msg: messages)
    {
        llamaMsgs.push_back(llama_chat_message { .role = msg.role.c_str(), .content = msg.content.c_str() });
        totalLength += msg.content.size();
    }

    auto buf = std::vector<char>(std::max<std::size_t>(totalLength * 2, 4096));
    auto len = llama_chat_apply_template(chatTemplate.c_str(),
                                         llamaMsgs.data(),
                                         llamaMsgs.size(),
                                         true,
                                         buf.data(),
                                         static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<std::size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(),
                                        llamaMsgs.data(),
                                        llamaMsgs.size(),
                                        true,
                                        buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }
    if (len < 0)
        return makeError(ErrorCode::FatalInferenceError, "Failed to apply chat template");

    return std::string(buf.data(), static_cast<std::size_t>(len));
}

auto LlmEngine::Impl::tokenize(const std::string& prompt) const -> Result<std::vector<llama_token>>
{
    auto const* vocab = llama_model_get_vocab(model);
    auto tokens = std::vector<llama_token>(prompt.size() + 16);
    auto count = llama_tokenize(vocab,
                                prompt.c_str(),
                                static_cast<int32_t>(prompt.size()),
                                tokens.data(),
                                static_cast<int32_t>(tokens.size()),
                                true,
                                true);
    if (count < 0)
    {
        // A negative result is the number of tokens actually required.
        tokens.resize(static_cast<std::size_t>(-count));
        count = llama_tokenize(vocab,
                               prompt.c_str(),
                               static_cast<int32_t>(prompt.size()),
                               tokens.data(),
                               static_cast<int32_t>(tokens.size()),
                               true,
                               true);
    }
    if (count < 0)
        return makeError(ErrorCode::FatalInferenceError, "Tokenization failed");

    tokens.resize(static_cast<std::size_t>(count));
    return tokens;
}

LlmEngine::LlmEngine(SamplerConfig sampler): _impl(std::make_unique<Impl>())
{
    _impl->sampler = sampler;
}

LlmEngine::~LlmEngine() = default;

auto LlmEngine::load(const LlmEngineConfig& config) -> VoidResult
{
    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);
    llama_backend_init();

    auto modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config.gpuLayers >= 0 ? config.gpuLayers : 999; // auto: offload everything

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_threads = config.threads > 0 ? config.threads
                                             : static_cast<int32_t>(std::max(1u, std::thread::hardware_concurrency()));
    ctxParams.n_threads_batch = ctxParams.n_threads;
    ctxParams.abort_callback = &Impl::abortCallback;
    ctxParams.abort_callback_data = _impl.get();

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    if (_impl->ctx)
        llama_free(_impl->ctx);
    if (_impl->model)
        llama_model_free(_impl->model);

    _impl->model = model;
    _impl->ctx = ctx;
    _impl->ctxSize = config.contextSize;

    log::info("Model loaded successfully (context size: {})", config.contextSize);
    return {};
}

auto LlmEngine::complete(const InferenceRequest& request,
                         std::stop_token stopToken,
                         const StreamCallback& onPiece) -> Result<std::string>
{
    auto const lock = std::lock_guard { _impl->generateMutex };

    if (!isLoaded())
        return makeError(ErrorCode::FatalInferenceError, "No model loaded");
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Inference cancelled before start");

    _impl->abortRequested = false;
    auto const stopAbort = std::stop_callback { stopToken, [this] { _impl->abortRequested = true; } };

    auto const& sampler = _impl->sampler;
    auto const promptBudgetTokens = std::max(256, _impl->ctxSize - sampler.maxTokens);
    auto const composer = PromptComposer { static_cast<std::size_t>(promptBudgetTokens) * CharsPerToken };

    auto prompt = _impl->applyChatTemplate(composer.compose(request));
    if (!prompt)
        return std::unexpected(prompt.error());

    auto tokens = _impl->tokenize(*prompt);
    if (!tokens)
        return std::unexpected(tokens.error());

    auto const nPrompt = static_cast<int>(tokens->size());
    if (nPrompt >= _impl->ctxSize)
        return makeError(ErrorCode::FatalInferenceError,
                         std::format("Prompt of {} tokens does not fit the context of {}", nPrompt, _impl->ctxSize));

    log::debug("{} prompt: {} tokens", roleToString(request.role), nPrompt);

    if (auto* mem = llama_get_memory(_impl->ctx))
        llama_memory_clear(mem, true);

    auto batch = llama_batch_get_one(tokens->data(), nPrompt);
    if (auto const status = llama_decode(_impl->ctx, batch); status != 0)
        return decodeError(status, "Failed to decode prompt");

    auto chain = makeSamplerChain(sampler);
    auto const* vocab = llama_model_get_vocab(_impl->model);
    auto const tokenLimit = std::min(sampler.maxTokens, _impl->ctxSize - nPrompt);

    auto text = std::string {};
    for (auto i = 0; i < tokenLimit; ++i)
    {
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Inference cancelled");

        auto token = llama_sampler_sample(chain.get(), _impl->ctx, -1);
        if (llama_vocab_is_eog(vocab, token))
            break;

        if (auto const piece = tokenToPiece(vocab, token); !piece.empty())
        {
            text += piece;
            if (onPiece)
                onPiece(piece);
        }

        auto next = llama_batch_get_one(&token, 1);
        if (auto const status = llama_decode(_impl->ctx, next); status != 0)
            return decodeError(status, "Failed to decode generated token");
    }

    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Inference cancelled");

    log::debug("{} completion: {} chars", roleToString(request.role), text.size());
    return text;
}

auto LlmEngine::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

auto LlmEngine::contextSize() const -> int
{
    return _impl->ctxSize;
}

} // namespace apkforge
