#include "peck_prompt_protocol.h"
#include "peck_grid_codec.h"
#include <algorithm>
#include <sstream>

namespace PeckPromptProtocol {

const char kCoordinateField[] = "hex_coord";
const char kReasoningField[] = "reasoning";

const char kSystemPrompt[] =
    "You are a desktop UI grounding assistant. You locate UI elements in "
    "screenshots by reading the coordinate labels printed on them. "
    "You never guess pixel positions.";

std::string BuildInstruction(const std::string& goal, const GridSpec& spec,
                             int width, int height) {
  GridLayout layout = PeckGridCodec::ComputeLayout(width, height, spec);
  std::optional<GridCell> last = PeckGridCodec::CellFor(layout, layout.columns - 1, layout.rows - 1);
  std::string last_label = last ? PeckGridCodec::EncodeLabel(last->origin_x, last->origin_y)
                                : PeckGridCodec::EncodeLabel(0, 0);
  std::string example_label = PeckGridCodec::EncodeLabel(
      std::max(0, std::min(layout.columns - 1, 16)) * spec.cell_size_px,
      std::max(0, std::min(layout.rows - 1, 8)) * spec.cell_size_px);

  std::stringstream prompt_stream;

  prompt_stream << "GRID INFO: The screenshot is covered by a grid of "
                << spec.cell_size_px << "x" << spec.cell_size_px << " pixel cells ("
                << layout.columns << " columns x " << layout.rows << " rows, cyan lines).\n";
  prompt_stream << "Each cell has a label in its bottom-left corner (white text on a dark box).\n";
  prompt_stream << "The label is written as XXXX,YYYY: two 4-digit uppercase hexadecimal numbers.\n";
  prompt_stream << "XXXX is the x pixel and YYYY the y pixel of the cell's TOP-LEFT corner, "
                << "even though the label is drawn near the bottom of the cell.\n";
  prompt_stream << "Labels run from 0000,0000 (top-left cell) to " << last_label
                << " (bottom-right cell).\n\n";

  prompt_stream << "TASK: " << goal << "\n\n";

  prompt_stream << "IMPORTANT: This is a TRANSCRIPTION task, not an estimation task.\n";
  prompt_stream << "Find the cell that covers the center of the requested UI element and copy "
                << "its label EXACTLY as printed. Do not compute or invent coordinates.\n\n";

  prompt_stream << "OUTPUT: Reply with exactly one JSON object in a ```json block:\n";
  prompt_stream << "```json\n{\"" << kCoordinateField << "\": \"" << example_label
                << "\", \"" << kReasoningField << "\": \"short reason\"}\n```\n";
  prompt_stream << "If the element is not visible, set \"" << kCoordinateField
                << "\" to null:\n";
  prompt_stream << "```json\n{\"" << kCoordinateField << "\": null, \"" << kReasoningField
                << "\": \"why it was not found\"}\n```";

  return prompt_stream.str();
}

}  // namespace PeckPromptProtocol
