#include "peck_config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

// Read a numeric key into out. Absent keys are skipped; wrong types are an error.
template <typename T>
bool ReadNumber(const json& obj, const char* key, const std::string& path, T& out,
                std::string& error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number()) {
    error = "'" + path + "' must be a number";
    return false;
  }
  out = it->get<T>();
  return true;
}

bool ReadString(const json& obj, const char* key, const std::string& path, std::string& out,
                std::string& error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = "'" + path + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

const char* GetEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

bool ParseIntEnv(const char* name, int& out, std::string& error) {
  const char* value = GetEnv(name);
  if (!value) return true;
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0') {
    error = std::string(name) + " is not an integer: '" + value + "'";
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool ParseFloatEnv(const char* name, float& out, std::string& error) {
  const char* value = GetEnv(name);
  if (!value) return true;
  char* end = nullptr;
  float parsed = std::strtof(value, &end);
  if (end == value || *end != '\0') {
    error = std::string(name) + " is not a number: '" + value + "'";
    return false;
  }
  out = parsed;
  return true;
}

void ParseStringEnv(const char* name, std::string& out) {
  const char* value = GetEnv(name);
  if (value) out = value;
}

}  // namespace

bool PeckConfig::LoadFromFile(const std::string& path, std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "Cannot open config file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  if (!LoadFromString(buffer.str(), error)) {
    error = path + ": " + error;
    return false;
  }

  LOG_INFO("Config", "Loaded configuration from " + path);
  return true;
}

bool PeckConfig::LoadFromString(const std::string& json_text, std::string& error) {
  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded()) {
    error = "malformed JSON";
    return false;
  }
  if (!root.is_object()) {
    error = "top level must be a JSON object";
    return false;
  }

  if (!ReadNumber(root, "cell_size", "cell_size", cell_size, error)) return false;
  if (!ReadNumber(root, "settle_delay_ms", "settle_delay_ms", settle_delay_ms, error)) return false;
  if (!ReadString(root, "debug_dir", "debug_dir", debug_dir, error)) return false;
  if (!ReadString(root, "log_file", "log_file", log_file, error)) return false;
  if (!ReadString(root, "display", "display", display, error)) return false;

  auto vit = root.find("vision");
  if (vit != root.end() && !vit->is_null()) {
    if (!vit->is_object()) {
      error = "'vision' must be an object";
      return false;
    }
    const json& v = *vit;
    if (!ReadString(v, "url", "vision.url", vision.url, error)) return false;
    if (!ReadString(v, "api_key", "vision.api_key", vision.api_key, error)) return false;
    if (!ReadString(v, "model", "vision.model", vision.model, error)) return false;
    if (!ReadNumber(v, "temperature", "vision.temperature", vision.temperature, error)) return false;
    if (!ReadNumber(v, "max_tokens", "vision.max_tokens", vision.max_tokens, error)) return false;
    if (!ReadNumber(v, "timeout_sec", "vision.timeout_sec", vision.timeout_sec, error)) return false;
  }

  return true;
}

bool PeckConfig::ApplyEnvironment(std::string& error) {
  if (!ParseIntEnv("PECK_CELL_SIZE", cell_size, error)) return false;
  ParseStringEnv("PECK_VISION_URL", vision.url);
  ParseStringEnv("PECK_API_KEY", vision.api_key);
  ParseStringEnv("PECK_MODEL", vision.model);
  if (!ParseFloatEnv("PECK_TEMPERATURE", vision.temperature, error)) return false;
  if (!ParseIntEnv("PECK_MAX_TOKENS", vision.max_tokens, error)) return false;
  if (!ParseIntEnv("PECK_TIMEOUT_SEC", vision.timeout_sec, error)) return false;
  if (!ParseIntEnv("PECK_SETTLE_DELAY_MS", settle_delay_ms, error)) return false;
  ParseStringEnv("PECK_DEBUG_DIR", debug_dir);
  ParseStringEnv("PECK_LOG_FILE", log_file);
  ParseStringEnv("DISPLAY", display);
  return true;
}

bool PeckConfig::Validate(std::string& error) const {
  if (cell_size < 1 || cell_size > 0xFFFF) {
    error = "cell_size must be in [1, 65535], got " + std::to_string(cell_size);
    return false;
  }
  if (vision.temperature < 0.0f || vision.temperature > 2.0f) {
    error = "vision.temperature must be in [0, 2], got " + std::to_string(vision.temperature);
    return false;
  }
  if (vision.max_tokens <= 0) {
    error = "vision.max_tokens must be positive, got " + std::to_string(vision.max_tokens);
    return false;
  }
  if (vision.timeout_sec <= 0) {
    error = "vision.timeout_sec must be positive, got " + std::to_string(vision.timeout_sec);
    return false;
  }
  if (settle_delay_ms < 0) {
    error = "settle_delay_ms must not be negative, got " + std::to_string(settle_delay_ms);
    return false;
  }
  if (vision.url.empty()) {
    error = "vision.url must not be empty";
    return false;
  }
  return true;
}

void PeckConfig::PrintHelp() {
  printf("Configuration file (JSON):\n");
  printf("  {\n");
  printf("    \"cell_size\": 40,\n");
  printf("    \"settle_delay_ms\": 500,\n");
  printf("    \"debug_dir\": \"/tmp/peck\",\n");
  printf("    \"log_file\": \"\",\n");
  printf("    \"display\": \":0\",\n");
  printf("    \"vision\": {\n");
  printf("      \"url\": \"http://localhost:8095\",\n");
  printf("      \"api_key\": \"\",\n");
  printf("      \"model\": \"\",\n");
  printf("      \"temperature\": 0.1,\n");
  printf("      \"max_tokens\": 256,\n");
  printf("      \"timeout_sec\": 60\n");
  printf("    }\n");
  printf("  }\n\n");
  printf("Environment variables:\n");
  printf("  PECK_CELL_SIZE, PECK_VISION_URL, PECK_API_KEY, PECK_MODEL,\n");
  printf("  PECK_TEMPERATURE, PECK_MAX_TOKENS, PECK_TIMEOUT_SEC,\n");
  printf("  PECK_SETTLE_DELAY_MS, PECK_DEBUG_DIR, PECK_LOG_FILE, DISPLAY\n\n");
  printf("Priority: CLI args > environment > config file > defaults\n");
}
