#ifndef PECK_GRID_CODEC_H_
#define PECK_GRID_CODEC_H_

#include <optional>
#include <string>
#include "peck_types.h"

/**
 * PeckGridCodec - Hexadecimal coordinate grid for screenshots
 *
 * Partitions a capture into square cells of GridSpec::cell_size_px and labels
 * every cell with its top-left origin as "XXXX,YYYY" (uppercase 4-digit hex,
 * physical pixels). The vision model transcribes a label instead of
 * estimating pixel positions; ResolveLabel turns the label back into an origin.
 *
 * Cells at the right/bottom border may be smaller than the cell size but are
 * still labeled by their origin. Every pixel belongs to exactly one cell.
 */

enum class LabelStatus {
  OK,
  MALFORMED,     // Wrong digit count, non-hex characters, missing comma
  OUT_OF_RANGE   // Well-formed but outside [0, width) x [0, height)
};

struct LabelResolution {
  LabelStatus status = LabelStatus::MALFORMED;
  int x = 0;
  int y = 0;

  bool ok() const { return status == LabelStatus::OK; }
};

class PeckGridCodec {
 public:
  // Overlay styling. Defaults give cyan lines and white-on-dark labels.
  struct OverlayStyle {
    double line_r = 0.0, line_g = 0.86, line_b = 1.0, line_a = 0.45;
    double box_r = 0.0, box_g = 0.0, box_b = 0.0, box_a = 0.62;
    double text_r = 1.0, text_g = 1.0, text_b = 1.0;
    double max_font_size = 12.0;
    double min_font_size = 6.0;
    std::string font_family = "Monospace";
  };

  PeckGridCodec();
  explicit PeckGridCodec(const OverlayStyle& style);

  // Number of columns/rows for an image. A dimension smaller than one cell
  // still yields one column (or row).
  static GridLayout ComputeLayout(int width, int height, const GridSpec& spec);

  // Cell containing pixel (x, y). Returns nullopt for pixels outside the image.
  static std::optional<GridCell> CellAt(const GridLayout& layout, int x, int y);

  // Cell by index. Returns nullopt for indices outside the layout.
  static std::optional<GridCell> CellFor(const GridLayout& layout, int column, int row);

  // "XXXX,YYYY" for an origin. Empty string when a component is outside 0..65535.
  static std::string EncodeLabel(int x, int y);

  // Format-only parse of "XXXX,YYYY" (surrounding whitespace ignored,
  // hex digits case-insensitive)
  static std::optional<CoordinateLabel> ParseLabel(const std::string& label);

  // Parse and bounds-check a label against capture dimensions.
  // No snapping to cell boundaries: any in-range pair is accepted.
  static LabelResolution ResolveLabel(const std::string& label, int width, int height);

  // Bounds check for an already parsed label
  static LabelResolution ResolveLabel(const CoordinateLabel& label, int width, int height);

  // Draw grid lines and per-cell labels onto a copy of the capture.
  // The result has the same dimensions as the input. An invalid capture
  // or grid spec yields an empty image.
  GridOverlayImage RenderOverlay(const CaptureImage& capture, const GridSpec& spec) const;

 private:
  OverlayStyle style_;
};

#endif  // PECK_GRID_CODEC_H_
