#pragma once
#include "types.hpp"

namespace genai {

// True for finish reasons that end generation normally: natural stop,
// max-length truncation, or the server's unspecified default.
bool is_normal_finish(FinishReason reason);

// Turns a decoded response whose content signals failure into an exception:
//   block reason set, no candidates      -> PromptBlockedError
//   a candidate finished abnormally      -> ResponseStoppedError
//   no candidates and no block reason    -> SerializationError
// Returns the response unchanged otherwise. Applied to every item of a
// stream, since a later chunk can be blocked after earlier clean ones.
const GenerateContentResponse& classify_response(const GenerateContentResponse& response);

} // namespace genai
