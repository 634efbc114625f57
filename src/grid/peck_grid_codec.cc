#include "peck_grid_codec.h"
#include "logger.h"
#include <cairo/cairo.h>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {

// Longest label text; used to size the font so a label fits inside one cell
const char kWidestLabel[] = "DDDD,DDDD";
const double kLabelPadding = 2.0;

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

// Parse exactly four hex digits starting at pos
bool ParseHex4(const std::string& text, size_t pos, uint16_t& out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  unsigned value = 0;
  for (size_t i = pos; i < pos + 4; i++) {
    int digit = HexValue(text[i]);
    if (digit < 0) {
      return false;
    }
    value = (value << 4) | static_cast<unsigned>(digit);
  }
  out = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

PeckGridCodec::PeckGridCodec() {}

PeckGridCodec::PeckGridCodec(const OverlayStyle& style) : style_(style) {}

GridLayout PeckGridCodec::ComputeLayout(int width, int height, const GridSpec& spec) {
  GridLayout layout;
  layout.cell_size_px = spec.cell_size_px;
  layout.image_width = width;
  layout.image_height = height;

  if (!spec.IsValid() || width <= 0 || height <= 0) {
    return layout;
  }

  // ceil(width / cell), at least one
  layout.columns = std::max(1, (width + spec.cell_size_px - 1) / spec.cell_size_px);
  layout.rows = std::max(1, (height + spec.cell_size_px - 1) / spec.cell_size_px);
  return layout;
}

std::optional<GridCell> PeckGridCodec::CellFor(const GridLayout& layout, int column, int row) {
  if (column < 0 || row < 0 || column >= layout.columns || row >= layout.rows) {
    return std::nullopt;
  }

  GridCell cell;
  cell.column = column;
  cell.row = row;
  cell.origin_x = column * layout.cell_size_px;
  cell.origin_y = row * layout.cell_size_px;
  cell.width = std::min(layout.cell_size_px, layout.image_width - cell.origin_x);
  cell.height = std::min(layout.cell_size_px, layout.image_height - cell.origin_y);
  return cell;
}

std::optional<GridCell> PeckGridCodec::CellAt(const GridLayout& layout, int x, int y) {
  if (layout.cell_size_px <= 0 || x < 0 || y < 0 ||
      x >= layout.image_width || y >= layout.image_height) {
    return std::nullopt;
  }
  return CellFor(layout, x / layout.cell_size_px, y / layout.cell_size_px);
}

std::string PeckGridCodec::EncodeLabel(int x, int y) {
  if (x < 0 || y < 0 || x > 0xFFFF || y > 0xFFFF) {
    return "";
  }
  CoordinateLabel label;
  label.x = static_cast<uint16_t>(x);
  label.y = static_cast<uint16_t>(y);
  return label.ToString();
}

std::optional<CoordinateLabel> PeckGridCodec::ParseLabel(const std::string& label) {
  size_t start = label.find_first_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return std::nullopt;
  }
  size_t end = label.find_last_not_of(" \t\n\r");
  std::string trimmed = label.substr(start, end - start + 1);

  // Exactly XXXX,YYYY
  if (trimmed.size() != 9 || trimmed[4] != ',') {
    return std::nullopt;
  }

  CoordinateLabel parsed;
  if (!ParseHex4(trimmed, 0, parsed.x) || !ParseHex4(trimmed, 5, parsed.y)) {
    return std::nullopt;
  }
  return parsed;
}

LabelResolution PeckGridCodec::ResolveLabel(const CoordinateLabel& label, int width, int height) {
  LabelResolution resolution;
  resolution.x = label.x;
  resolution.y = label.y;
  if (resolution.x < width && resolution.y < height) {
    resolution.status = LabelStatus::OK;
  } else {
    resolution.status = LabelStatus::OUT_OF_RANGE;
  }
  return resolution;
}

LabelResolution PeckGridCodec::ResolveLabel(const std::string& label, int width, int height) {
  std::optional<CoordinateLabel> parsed = ParseLabel(label);
  if (!parsed) {
    LabelResolution malformed;
    malformed.status = LabelStatus::MALFORMED;
    return malformed;
  }
  return ResolveLabel(*parsed, width, height);
}

GridOverlayImage PeckGridCodec::RenderOverlay(const CaptureImage& capture,
                                              const GridSpec& spec) const {
  if (!capture.IsValid()) {
    LOG_ERROR("GridCodec", "Cannot render overlay on an empty capture");
    return GridOverlayImage();
  }
  if (!spec.IsValid()) {
    LOG_ERROR("GridCodec", "Invalid cell size: " + std::to_string(spec.cell_size_px));
    return GridOverlayImage();
  }

  GridOverlayImage overlay = capture;
  GridLayout layout = ComputeLayout(capture.width, capture.height, spec);

  cairo_surface_t* surface = cairo_image_surface_create_for_data(
      overlay.pixels.data(), CAIRO_FORMAT_ARGB32,
      overlay.width, overlay.height, overlay.stride);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    LOG_ERROR("GridCodec", "Failed to wrap capture in Cairo surface: " +
              std::string(cairo_status_to_string(cairo_surface_status(surface))));
    cairo_surface_destroy(surface);
    return GridOverlayImage();
  }

  cairo_t* cr = cairo_create(surface);

  // Grid lines on every cell boundary, outer border included. 1px lines are
  // centered on the pixel so they stay crisp; the closing boundary sits on
  // the last pixel column/row.
  cairo_set_line_width(cr, 1.0);
  cairo_set_source_rgba(cr, style_.line_r, style_.line_g, style_.line_b, style_.line_a);
  for (int col = 0; col <= layout.columns; col++) {
    double x = std::min(col * spec.cell_size_px, overlay.width - 1) + 0.5;
    cairo_move_to(cr, x, 0);
    cairo_line_to(cr, x, overlay.height);
  }
  for (int row = 0; row <= layout.rows; row++) {
    double y = std::min(row * spec.cell_size_px, overlay.height - 1) + 0.5;
    cairo_move_to(cr, 0, y);
    cairo_line_to(cr, overlay.width, y);
  }
  cairo_stroke(cr);

  // Fit the widest label into one cell
  cairo_select_font_face(cr, style_.font_family.c_str(),
                         CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_BOLD);
  cairo_set_font_size(cr, style_.max_font_size);
  cairo_text_extents_t widest;
  cairo_text_extents(cr, kWidestLabel, &widest);
  double font_size = style_.max_font_size;
  double available = spec.cell_size_px - 2 * kLabelPadding;
  if (widest.x_advance > 0 && widest.x_advance > available) {
    font_size = std::max(style_.min_font_size,
                         style_.max_font_size * available / widest.x_advance);
  }
  cairo_set_font_size(cr, font_size);
  if (widest.x_advance * font_size / style_.max_font_size > available + 0.5) {
    LOG_WARN("GridCodec", "Labels do not fit " + std::to_string(spec.cell_size_px) +
             "px cells at the minimum font size; they are clipped to their cell");
  }

  cairo_font_extents_t font_extents;
  cairo_font_extents(cr, &font_extents);
  double box_height = font_extents.ascent + font_extents.descent + kLabelPadding;

  for (int row = 0; row < layout.rows; row++) {
    for (int col = 0; col < layout.columns; col++) {
      std::optional<GridCell> cell = CellFor(layout, col, row);
      if (!cell) {
        continue;
      }
      std::string text = EncodeLabel(cell->origin_x, cell->origin_y);
      if (text.empty()) {
        continue;
      }

      cairo_text_extents_t extents;
      cairo_text_extents(cr, text.c_str(), &extents);
      double box_width = extents.x_advance + kLabelPadding;

      // Bottom-left of the cell, one pixel inside the grid line
      double box_x = cell->origin_x + 1;
      double box_y = cell->origin_y + cell->height - box_height - 1;
      if (box_y < cell->origin_y + 1) {
        box_y = cell->origin_y + 1;
      }

      // A label never paints outside its own cell
      cairo_save(cr);
      cairo_rectangle(cr, cell->origin_x, cell->origin_y, cell->width, cell->height);
      cairo_clip(cr);

      cairo_set_source_rgba(cr, style_.box_r, style_.box_g, style_.box_b, style_.box_a);
      cairo_rectangle(cr, box_x, box_y, box_width, box_height);
      cairo_fill(cr);

      cairo_set_source_rgb(cr, style_.text_r, style_.text_g, style_.text_b);
      cairo_move_to(cr, box_x + kLabelPadding / 2,
                    box_y + kLabelPadding / 2 + font_extents.ascent);
      cairo_show_text(cr, text.c_str());

      cairo_restore(cr);
    }
  }

  cairo_destroy(cr);
  cairo_surface_flush(surface);
  cairo_surface_destroy(surface);

  LOG_DEBUG("GridCodec", "Rendered " + std::to_string(layout.columns) + "x" +
            std::to_string(layout.rows) + " grid (cell " +
            std::to_string(spec.cell_size_px) + "px, font " +
            std::to_string(font_size) + ")");

  return overlay;
}
