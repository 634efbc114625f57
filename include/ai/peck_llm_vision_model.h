#ifndef PECK_LLM_VISION_MODEL_H_
#define PECK_LLM_VISION_MODEL_H_

#include <memory>
#include <string>
#include "peck_capabilities.h"
#include "peck_llm_client.h"

// IVisionModel backed by an OpenAI-compatible HTTP endpoint
class PeckLLMVisionModel : public IVisionModel {
 public:
  struct Options {
    std::string system_prompt;  // Empty uses PeckPromptProtocol::kSystemPrompt
    int max_tokens = 256;
    float temperature = 0.1f;
  };

  PeckLLMVisionModel(std::unique_ptr<PeckLLMClient> client, const Options& options);

  std::string GetName() const override;

  VisionQueryResult Query(const std::vector<uint8_t>& png_bytes,
                          const std::string& instruction) override;

 private:
  std::unique_ptr<PeckLLMClient> client_;
  Options options_;
};

#endif  // PECK_LLM_VISION_MODEL_H_
