#ifndef PECK_DEBUG_ARTIFACTS_H_
#define PECK_DEBUG_ARTIFACTS_H_

#include <string>
#include "peck_types.h"

// Optional per-run images for human inspection. Writing is best effort:
// failures are logged and never affect the targeting result.
class PeckDebugArtifacts {
 public:
  // Empty directory disables all output
  explicit PeckDebugArtifacts(const std::string& directory);

  bool IsEnabled() const { return !directory_.empty(); }
  const std::string& GetDirectory() const { return directory_; }

  void SaveCapture(const CaptureImage& capture);
  void SaveOverlay(const GridOverlayImage& overlay);

  // Capture with the chosen cell outlined in green and a red dot on the click point
  void SaveTargetCheck(const CaptureImage& capture, const GridCell& cell,
                       const TargetPoint& target);

  static RasterImage RenderTargetCheck(const CaptureImage& capture, const GridCell& cell,
                                       const TargetPoint& target);

 private:
  bool Save(const RasterImage& image, const std::string& file_name);

  std::string directory_;
};

#endif  // PECK_DEBUG_ARTIFACTS_H_
