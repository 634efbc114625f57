#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "peck_types.h"

// Collaborators the targeting pipeline depends on. Each is a swappable
// backend: X11, PNG files, HTTP vision models, or in-memory fakes in tests.

struct CaptureResult {
  bool success = false;
  CaptureImage image;   // Physical pixels
  std::string error;
};

struct VisionQueryResult {
  bool success = false;
  std::string content;  // Free-form reply text
  std::string error;
  double latency_ms = 0.0;
};

struct InputResult {
  bool success = false;
  std::string error;
};

/**
 * IScreenCapture - Yields a raster of the full virtual display
 */
class IScreenCapture {
 public:
  virtual ~IScreenCapture() = default;

  virtual std::string GetName() const = 0;

  /**
   * Capture the whole display surface across all monitors
   * @return Capture result with the image in physical pixels
   */
  virtual CaptureResult Capture() = 0;
};

/**
 * IVisionModel - Answers an instruction about an image with free text
 */
class IVisionModel {
 public:
  virtual ~IVisionModel() = default;

  virtual std::string GetName() const = 0;

  /**
   * Ask the model about an image
   * @param png_bytes PNG-encoded image
   * @param instruction UTF-8 instruction text
   * @return Reply text, or an error on transport/API failure
   */
  virtual VisionQueryResult Query(const std::vector<uint8_t>& png_bytes,
                                  const std::string& instruction) = 0;
};

/**
 * IInputInjector - Moves the pointer and clicks in logical screen coordinates
 */
class IInputInjector {
 public:
  virtual ~IInputInjector() = default;

  virtual std::string GetName() const = 0;

  /**
   * Logical (DPI-independent) screen size
   */
  virtual ScreenSize LogicalScreenSize() = 0;

  /**
   * Move to (x, y), wait settle_delay_ms, then left-click
   */
  virtual InputResult MoveAndClick(int logical_x, int logical_y, int settle_delay_ms) = 0;
};
