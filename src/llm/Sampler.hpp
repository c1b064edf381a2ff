// SPDX-License-Identifier: Apache-2.0
#pragma once

namespace apkforge
{

/// @brief Configuration for LLM token sampling.
///
/// Code generation favours a low temperature so that repeated runs stay close to each other.
struct SamplerConfig
{
    float temperature = 0.1f;
    float topP = 0.95f;
    int topK = 40;
    float repeatPenalty = 1.1f;
    int repeatLastN = 64;
    int maxTokens = 1024;
    int seed = -1; // -1 means random
};

} // namespace apkforge
