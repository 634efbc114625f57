/**
 * peck - Click a described on-screen element
 *
 * Captures the display, overlays a labeled hex grid, asks a vision model for
 * the label of the cell holding the described element, and clicks its center.
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "logger.h"
#include "peck_config.h"
#include "peck_image_io.h"
#include "peck_input_injector.h"
#include "peck_llm_client.h"
#include "peck_llm_vision_model.h"
#include "peck_screen_capture.h"
#include "peck_targeting_pipeline.h"

namespace {

const int kExitActed = 0;
const int kExitRunFailed = 1;
const int kExitUsage = 2;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] \"<goal>\"\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config FILE         Load settings from a JSON config file\n";
  std::cout << "  --cell-size N         Grid cell size in physical pixels (default: 40)\n";
  std::cout << "  --vision-url URL      OpenAI-compatible server (default: http://localhost:8095)\n";
  std::cout << "  --model NAME          Vision model name\n";
  std::cout << "  --image FILE          Use a PNG screenshot instead of capturing the display\n";
  std::cout << "  --dry-run             Resolve the click point but do not click\n";
  std::cout << "  --logical-size WxH    Logical screen size for --dry-run\n";
  std::cout << "  --debug-dir DIR       Write capture.png, overlay.png, target_check.png\n";
  std::cout << "  --log-file FILE       Also append log lines to FILE\n";
  std::cout << "  --verbose             Debug logging and print the model reply\n";
  std::cout << "  --help                Show this help message\n";
  std::cout << "\n";
  std::cout << "Exit codes:\n";
  std::cout << "  0 - target clicked\n";
  std::cout << "  1 - targeting run failed\n";
  std::cout << "  2 - usage or configuration error\n";
  std::cout << "\n";
  PeckConfig::PrintHelp();
}

bool ParseInt(const char* text, int& out) {
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0') {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

// "1280x720"
bool ParseSize(const char* text, ScreenSize& out) {
  const char* sep = std::strchr(text, 'x');
  if (!sep) {
    sep = std::strchr(text, 'X');
  }
  if (!sep) {
    return false;
  }
  std::string width(text, sep - text);
  int w = 0;
  int h = 0;
  if (!ParseInt(width.c_str(), w) || !ParseInt(sep + 1, h)) {
    return false;
  }
  out.width = w;
  out.height = h;
  return out.IsValid();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string goal;
  std::string image_path;
  bool dry_run = false;
  bool verbose = false;
  ScreenSize logical_size;

  // CLI overrides, applied after file and environment
  int cell_size = 0;
  std::string vision_url;
  std::string model;
  std::string debug_dir;
  std::string log_file;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return kExitActed;
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (strcmp(argv[i], "--cell-size") == 0 && i + 1 < argc) {
      if (!ParseInt(argv[++i], cell_size)) {
        std::cerr << "Invalid --cell-size: " << argv[i] << std::endl;
        return kExitUsage;
      }
    } else if (strcmp(argv[i], "--vision-url") == 0 && i + 1 < argc) {
      vision_url = argv[++i];
    } else if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
      model = argv[++i];
    } else if (strcmp(argv[i], "--image") == 0 && i + 1 < argc) {
      image_path = argv[++i];
    } else if (strcmp(argv[i], "--dry-run") == 0) {
      dry_run = true;
    } else if (strcmp(argv[i], "--logical-size") == 0 && i + 1 < argc) {
      if (!ParseSize(argv[++i], logical_size)) {
        std::cerr << "Invalid --logical-size (expected WxH): " << argv[i] << std::endl;
        return kExitUsage;
      }
    } else if (strcmp(argv[i], "--debug-dir") == 0 && i + 1 < argc) {
      debug_dir = argv[++i];
    } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
      log_file = argv[++i];
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      verbose = true;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitUsage;
    } else if (goal.empty()) {
      goal = argv[i];
    } else {
      std::cerr << "Unexpected argument: " << argv[i] << std::endl;
      return kExitUsage;
    }
  }

  if (goal.empty()) {
    std::cerr << "Missing goal description" << std::endl;
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  // Defaults < file < environment < CLI
  PeckConfig config;
  std::string error;
  if (!config_path.empty() && !config.LoadFromFile(config_path, error)) {
    std::cerr << "[FATAL] " << error << std::endl;
    return kExitUsage;
  }
  if (!config.ApplyEnvironment(error)) {
    std::cerr << "[FATAL] " << error << std::endl;
    return kExitUsage;
  }
  if (cell_size != 0) config.cell_size = cell_size;
  if (!vision_url.empty()) config.vision.url = vision_url;
  if (!model.empty()) config.vision.model = model;
  if (!debug_dir.empty()) config.debug_dir = debug_dir;
  if (!log_file.empty()) config.log_file = log_file;

  if (!config.Validate(error)) {
    std::cerr << "[FATAL] Invalid configuration: " << error << std::endl;
    return kExitUsage;
  }

  if (config.log_file.empty()) {
    PeckLogger::Logger::Init();
  } else if (!PeckLogger::Logger::Init(config.log_file)) {
    std::cerr << "[FATAL] Cannot write log file: " << config.log_file << std::endl;
    return kExitUsage;
  }
  if (verbose) {
    PeckLogger::Logger::SetLevel(PeckLogger::DEBUG);
  }

  // Capture backend
  std::unique_ptr<IScreenCapture> capture;
  if (!image_path.empty()) {
    capture.reset(new PeckFileScreenCapture(image_path));
  } else {
    capture.reset(new PeckX11ScreenCapture(config.display));
  }

  // Input backend
  std::unique_ptr<IInputInjector> input;
  if (dry_run) {
    if (!logical_size.IsValid()) {
      // Without an explicit size, click space matches the source surface
      if (!image_path.empty()) {
        RasterImage dry_run_image;
        if (!PeckImageIO::LoadPNG(image_path, dry_run_image, error)) {
          std::cerr << "[FATAL] " << error << std::endl;
          PeckLogger::Logger::Shutdown();
          return kExitUsage;
        }
        logical_size.width = dry_run_image.width;
        logical_size.height = dry_run_image.height;
      } else {
        PeckX11InputInjector x11_input(config.display);
        logical_size = x11_input.LogicalScreenSize();
      }
    }
    input.reset(new PeckDryRunInputInjector(logical_size));
  } else {
    input.reset(new PeckX11InputInjector(config.display));
  }

  // Vision backend
  std::unique_ptr<PeckLLMClient> client(new PeckLLMClient(config.vision.url));
  client->SetApiKey(config.vision.api_key);
  client->SetModel(config.vision.model);
  client->SetTimeoutSeconds(config.vision.timeout_sec);

  PeckLLMVisionModel::Options vision_options;
  vision_options.max_tokens = config.vision.max_tokens;
  vision_options.temperature = config.vision.temperature;
  PeckLLMVisionModel vision(std::move(client), vision_options);

  PeckTargetingPipeline::Options options;
  options.grid.cell_size_px = config.cell_size;
  options.settle_delay_ms = config.settle_delay_ms;
  options.debug_dir = config.debug_dir;

  LOG_INFO("Main", "Capture: " + capture->GetName() + ", input: " + input->GetName() +
           ", vision: " + vision.GetName());

  PeckTargetingPipeline pipeline(capture.get(), &vision, input.get(), options);
  TargetingResult result = pipeline.Run(goal);

  if (verbose && !result.reply.empty()) {
    std::cout << "Model reply:\n" << result.reply << "\n";
  }
  std::cout << result.ToString() << std::endl;
  std::cout << "Elapsed: " << result.elapsed_ms / 1000.0 << "s" << std::endl;

  PeckLogger::Logger::Shutdown();
  return result.success ? kExitActed : kExitRunFailed;
}
