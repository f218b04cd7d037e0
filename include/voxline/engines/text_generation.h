#ifndef VOXLINE_ENGINES_TEXT_GENERATION_H
#define VOXLINE_ENGINES_TEXT_GENERATION_H

#include <functional>
#include <vector>

#include "voxline/core/error.h"
#include "voxline/engines/capability.h"
#include "voxline/features/llm/conversation_context.h"

namespace voxline {

// Streaming chat completion request
struct GenerationRequest {
    std::vector<Message> messages;  // full ordered history, System first
    std::string model;
    int max_tokens = 256;
    float temperature = 0.7f;
};

// Receives each content increment in order; return false to stop the stream
using TokenCallback = std::function<bool(const std::string& token)>;

// Text Generation engine interface
class ILanguageModel : public ICapability {
   public:
    CapabilityType type() const override { return CapabilityType::TEXT_GENERATION; }

    /**
     * Stream a completion for the message sequence.
     *
     * Returns once the stream completed, failed, or the callback returned
     * false. A stream stopped by the callback returns GenerationCancelled.
     */
    virtual Error generate_stream(const GenerationRequest& request,
                                  const TokenCallback& on_token) = 0;
};

}  // namespace voxline

#endif  // VOXLINE_ENGINES_TEXT_GENERATION_H
