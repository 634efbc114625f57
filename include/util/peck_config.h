/**
 * Peck - Configuration
 *
 * Priority order: CLI args > Environment variables > Config file > Defaults.
 * The CLI applies its own overrides after LoadFromFile and ApplyEnvironment,
 * then calls Validate.
 */

#ifndef PECK_CONFIG_H_
#define PECK_CONFIG_H_

#include <string>

struct PeckVisionConfig {
  std::string url = "http://localhost:8095";
  std::string api_key;
  std::string model;
  float temperature = 0.1f;
  int max_tokens = 256;
  int timeout_sec = 60;
};

struct PeckConfig {
  int cell_size = 40;
  PeckVisionConfig vision;
  int settle_delay_ms = 500;
  std::string debug_dir;   // Empty: no debug artifacts
  std::string log_file;    // Empty: stderr only
  std::string display;     // Empty: $DISPLAY

  /**
   * Load values from a JSON file. Keys missing from the file keep their
   * current value. A missing, unreadable, or malformed file is an error.
   *
   * @return true on success, false with error filled on failure
   */
  bool LoadFromFile(const std::string& path, std::string& error);

  /**
   * Same as LoadFromFile but reads JSON text directly
   */
  bool LoadFromString(const std::string& json_text, std::string& error);

  /**
   * Override values from PECK_* environment variables (and DISPLAY).
   * Unset or empty variables are ignored; unparsable numbers are an error.
   */
  bool ApplyEnvironment(std::string& error);

  /**
   * Range checks. Returns false with a message naming the offending key.
   */
  bool Validate(std::string& error) const;

  /**
   * Print the config file keys and environment variables
   */
  static void PrintHelp();
};

#endif  // PECK_CONFIG_H_
