#include "peck_llm_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;

// Callback for curl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  ((std::string*)userp)->append((char*)contents, size * nmemb);
  return size * nmemb;
}

PeckLLMClient::PeckLLMClient(const std::string& server_url, bool is_third_party)
    : server_url_(server_url),
      timeout_sec_(60),
      is_external_api_(is_third_party) {

  // Anything that is not a loopback address is treated as a hosted API
  if (!is_external_api_) {
    if (server_url.find("localhost") == std::string::npos &&
        server_url.find("127.0.0.1") == std::string::npos &&
        server_url.find("0.0.0.0") == std::string::npos) {
      is_external_api_ = true;
      LOG_DEBUG("LLMClient", "Auto-detected external API from URL: " + server_url);
    }
  }

  LOG_DEBUG("LLMClient", "Initialized for server: " + server_url);
}

PeckLLMClient::~PeckLLMClient() {}

std::string PeckLLMClient::CleanThinkingTags(const std::string& text) {
  if (text.empty()) {
    return text;
  }

  // Each <think> is closed by the nearest </think>. An unclosed block is kept.
  static const std::string kOpenTag = "<think>";
  static const std::string kCloseTag = "</think>";

  std::string result;
  result.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = text.find(kOpenTag, pos);
    if (open == std::string::npos) {
      break;
    }
    size_t close = text.find(kCloseTag, open + kOpenTag.size());
    if (close == std::string::npos) {
      break;
    }
    result.append(text, pos, open - pos);
    pos = close + kCloseTag.size();
  }
  if (pos < text.size()) {
    result.append(text, pos, std::string::npos);
  }

  size_t start = result.find_first_not_of(" \t\n\r");
  size_t end = result.find_last_not_of(" \t\n\r");

  if (start == std::string::npos) {
    return "";
  }

  return result.substr(start, end - start + 1);
}

std::string PeckLLMClient::BuildOpenAIPayload(const CompletionRequest& request) const {
  json payload = json::object();
  json messages = json::array();

  for (const auto& message : request.messages) {
    json msg = json::object();
    msg["role"] = message.role;

    if (message.is_multimodal && !message.content_parts.empty()) {
      json content = json::array();
      for (const auto& part : message.content_parts) {
        json part_json = json::object();
        part_json["type"] = part.type;
        if (part.type == "text") {
          part_json["text"] = part.text;
        } else if (part.type == "image_url") {
          part_json["image_url"] = json{{"url", part.image_url.url}};
        }
        content.push_back(part_json);
      }
      msg["content"] = content;
    } else {
      msg["content"] = message.content;
    }

    messages.push_back(msg);
  }

  payload["messages"] = messages;

  // Required by hosted APIs
  if (!model_name_.empty()) {
    payload["model"] = model_name_;
  }

  payload["max_tokens"] = request.max_tokens;
  payload["temperature"] = request.temperature;

  // Hosted APIs reject top_p together with temperature
  if (!is_external_api_) {
    payload["top_p"] = request.top_p;
  }
  payload["stream"] = request.stream;

  // Replace invalid UTF-8 in model-facing text rather than throwing
  return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool PeckLLMClient::ParseOpenAIResponse(const std::string& json_str, CompletionResponse& response) {
  // {"choices": [{"message": {"content": "..."}}], "usage": {...}}
  json root = json::parse(json_str, nullptr, false);

  if (root.is_discarded() || !root.is_object()) {
    response.error = "Failed to parse JSON response";
    LOG_ERROR("LLMClient", "Invalid JSON response");
    return false;
  }

  auto choices = root.find("choices");
  if (choices != root.end() && choices->is_array() && !choices->empty()) {
    const json& choice = (*choices)[0];
    if (choice.is_object() && choice.contains("message") && choice["message"].is_object()) {
      const json& message = choice["message"];
      auto content = message.find("content");
      if (content != message.end() && content->is_string()) {
        response.content = CleanThinkingTags(content->get<std::string>());
        response.success = true;
      }
    }
  }

  auto usage = root.find("usage");
  if (usage != root.end() && usage->is_object()) {
    response.tokens_generated = usage->value("completion_tokens", 0);
    response.tokens_prompt = usage->value("prompt_tokens", 0);
  }

  if (!response.success) {
    // Surface an API error object when the server sent one
    auto error = root.find("error");
    if (error != root.end() && error->is_object() && error->contains("message") &&
        (*error)["message"].is_string()) {
      response.error = "API error: " + (*error)["message"].get<std::string>();
    } else {
      response.error = "No content in response";
    }
    return false;
  }

  return true;
}

std::string PeckLLMClient::GetChatURL() const {
  std::string url = server_url_;
  if (url.find("/v1/chat/completions") == std::string::npos) {
    if (!url.empty() && url.back() == '/') {
      url.pop_back();
    }
    url += "/v1/chat/completions";
  }
  return url;
}

PeckLLMClient::CompletionResponse PeckLLMClient::ChatComplete(
    const CompletionRequest& request) {
  CompletionResponse response;
  auto start_time = std::chrono::steady_clock::now();

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "Failed to initialize CURL";
    LOG_ERROR("LLMClient", response.error);
    return response;
  }

  std::string payload_json = BuildOpenAIPayload(request);
  std::string response_str;
  std::string url = GetChatURL();

  LOG_DEBUG("LLMClient", "Request URL: " + url);
  LOG_DEBUG("LLMClient", "Model: " + model_name_);

  struct curl_slist* headers = NULL;
  headers = curl_slist_append(headers, "Content-Type: application/json");

  if (!api_key_.empty()) {
    std::string auth_header = "Authorization: Bearer " + api_key_;
    headers = curl_slist_append(headers, auth_header.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload_json.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload_json.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_str);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec_);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe
  curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

  CURLcode res = curl_easy_perform(curl);

  auto end_time = std::chrono::steady_clock::now();
  response.latency_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  response.http_status = http_code;

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    response.error = "HTTP request failed: " + std::string(curl_easy_strerror(res));
    LOG_ERROR("LLMClient", response.error);
    return response;
  }

  if (http_code != 200) {
    response.error = "HTTP error " + std::to_string(http_code);
    LOG_ERROR("LLMClient", response.error);
    LOG_ERROR("LLMClient", "Response: " + response_str.substr(0, 200));
    return response;
  }

  if (!ParseOpenAIResponse(response_str, response)) {
    LOG_ERROR("LLMClient", "Failed to parse response: " + response.error);
    return response;
  }

  LOG_DEBUG("LLMClient", "Completion successful - " +
            std::to_string(response.tokens_generated) + " tokens in " +
            std::to_string(static_cast<long>(response.latency_ms)) + "ms");

  return response;
}

PeckLLMClient::CompletionResponse PeckLLMClient::CompleteWithImage(
    const std::string& prompt,
    const std::string& image_base64,
    const std::string& system_prompt,
    int max_tokens,
    float temperature) {

  CompletionRequest request;

  Message sys_msg;
  sys_msg.role = "system";
  sys_msg.content = system_prompt.empty()
      ? "You are a helpful AI vision assistant. Analyze images and answer questions about them."
      : system_prompt;
  request.messages.push_back(sys_msg);

  Message user_msg;
  user_msg.role = "user";
  user_msg.is_multimodal = true;

  ContentPart text_part;
  text_part.type = "text";
  text_part.text = prompt;
  user_msg.content_parts.push_back(text_part);

  ContentPart image_part;
  image_part.type = "image_url";
  image_part.image_url.url = "data:image/png;base64," + image_base64;
  user_msg.content_parts.push_back(image_part);

  request.messages.push_back(user_msg);

  request.max_tokens = max_tokens;
  request.temperature = temperature;

  LOG_DEBUG("LLMClient", "Sending vision request with image (" +
            std::to_string(image_base64.length()) + " bytes base64)");

  return ChatComplete(request);
}
