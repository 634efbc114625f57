#ifndef PECK_LLM_CLIENT_H_
#define PECK_LLM_CLIENT_H_

#include <string>
#include <vector>

// OpenAI-compatible chat client (/v1/chat/completions) over libcurl.
// Supports vision models with multimodal messages (text + images).
class PeckLLMClient {
 public:
  // Content part for multimodal messages (vision support)
  struct ContentPart {
    std::string type;  // "text" or "image_url"
    std::string text;  // For type="text"
    struct ImageURL {
      std::string url;  // Base64 data URL or HTTP(S) URL
    } image_url;  // For type="image_url"
  };

  struct Message {
    std::string role;     // "system", "user", "assistant"
    std::string content;  // Simple text content
    std::vector<ContentPart> content_parts;  // Multimodal content (vision)
    bool is_multimodal = false;  // Set to true when using content_parts
  };

  struct CompletionRequest {
    std::vector<Message> messages;
    int max_tokens = 256;
    float temperature = 0.1f;
    float top_p = 0.9f;
    bool stream = false;
  };

  struct CompletionResponse {
    std::string content;
    int tokens_generated = 0;
    int tokens_prompt = 0;
    bool success = false;
    std::string error;
    long http_status = 0;
    double latency_ms = 0.0;
  };

  PeckLLMClient(const std::string& server_url, bool is_third_party = false);
  ~PeckLLMClient();

  // API key for hosted APIs, sent as a bearer token
  void SetApiKey(const std::string& api_key) { api_key_ = api_key; }

  // Model name (e.g., "gpt-4o", "qwen2.5-vl")
  void SetModel(const std::string& model) { model_name_ = model; }

  // Total request timeout; the connect timeout stays at 5 seconds
  void SetTimeoutSeconds(long timeout_sec) { timeout_sec_ = timeout_sec; }

  CompletionResponse ChatComplete(const CompletionRequest& request);

  // Text prompt + base64 PNG in one user message
  CompletionResponse CompleteWithImage(const std::string& prompt,
                                       const std::string& image_base64,
                                       const std::string& system_prompt = "",
                                       int max_tokens = 256,
                                       float temperature = 0.1f);

  std::string GetServerURL() const { return server_url_; }
  std::string GetChatURL() const;

  // True for hosted APIs; they reject local-only sampling parameters
  bool IsExternalAPI() const { return is_external_api_; }

  // OpenAI-compatible JSON payload
  std::string BuildOpenAIPayload(const CompletionRequest& request) const;

  // Fill response from an OpenAI-compatible JSON body
  static bool ParseOpenAIResponse(const std::string& json_str, CompletionResponse& response);

  // Remove <think>...</think> blocks emitted by reasoning models and trim
  static std::string CleanThinkingTags(const std::string& text);

 private:
  std::string server_url_;
  std::string api_key_;
  std::string model_name_;
  long timeout_sec_;
  bool is_external_api_;
};

#endif  // PECK_LLM_CLIENT_H_
