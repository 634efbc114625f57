#include "peck_llm_vision_model.h"
#include "peck_encoding_utils.h"
#include "peck_prompt_protocol.h"
#include "logger.h"

PeckLLMVisionModel::PeckLLMVisionModel(std::unique_ptr<PeckLLMClient> client,
                                       const Options& options)
    : client_(std::move(client)), options_(options) {
  if (options_.system_prompt.empty()) {
    options_.system_prompt = PeckPromptProtocol::kSystemPrompt;
  }
}

std::string PeckLLMVisionModel::GetName() const {
  return "llm:" + (client_ ? client_->GetServerURL() : std::string("<none>"));
}

VisionQueryResult PeckLLMVisionModel::Query(const std::vector<uint8_t>& png_bytes,
                                            const std::string& instruction) {
  VisionQueryResult result;

  if (!client_) {
    result.error = "LLM client not available";
    return result;
  }
  if (png_bytes.empty()) {
    result.error = "No image to send";
    return result;
  }

  std::string image_base64 = PeckEncoding::Base64Encode(png_bytes);

  LOG_DEBUG("VisionModel", "Prompt: " + instruction.substr(0, 300) + "...");

  PeckLLMClient::CompletionResponse response = client_->CompleteWithImage(
      instruction, image_base64, options_.system_prompt,
      options_.max_tokens, options_.temperature);

  result.latency_ms = response.latency_ms;
  if (!response.success) {
    result.error = response.error;
    return result;
  }

  result.success = true;
  result.content = response.content;
  return result;
}
