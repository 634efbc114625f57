#ifndef PECK_PROMPT_PROTOCOL_H_
#define PECK_PROMPT_PROTOCOL_H_

#include <string>
#include "peck_types.h"

// Instruction text sent to the vision model together with the grid overlay.
//
// Reply grammar requested from the model:
//   ```json
//   {"hex_coord": "XXXX,YYYY" | null, "reasoning": "<short justification>"}
//   ```
// A null hex_coord means the element is not visible, which is distinct from
// a malformed reply.
namespace PeckPromptProtocol {

// Field that carries the coordinate label in the structured reply
extern const char kCoordinateField[];

// Field that carries the model's short justification
extern const char kReasoningField[];

// Default system prompt used by the HTTP vision model
extern const char kSystemPrompt[];

// Build the full instruction: grid convention, reply grammar, then the goal.
// width/height are the physical capture size so the prompt can state the
// valid label range.
std::string BuildInstruction(const std::string& goal, const GridSpec& spec,
                             int width, int height);

}  // namespace PeckPromptProtocol

#endif  // PECK_PROMPT_PROTOCOL_H_
