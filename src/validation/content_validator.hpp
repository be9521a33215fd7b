#pragma once

#include <cstddef>
#include <string>
#include "core/errors/schema_errors.hpp"
#include "protocol/agentic_response.hpp"

namespace agentic::validation {

// Checks the single-populated-variant rule of the content model: a block's
// payload (and a tool-call output's payload) must be present and must be the
// alternative its declared type names.
class ContentValidator {
public:
    core::errors::Status validate_block(const protocol::ContentBlock& block) const;

    core::errors::Status validate_tool_call_output(
        const protocol::ContentBlockToolCallOutput& output) const;

    // Fails on the first invalid block; the message names its position.
    core::errors::Status validate_response(const protocol::AgenticResponse& response) const;

private:
    static std::string describe_payload(std::size_t payload_index);
};

// Free-function shorthands over a default ContentValidator.
core::errors::Status validate(const protocol::ContentBlock& block);
core::errors::Status validate(const protocol::ContentBlockToolCallOutput& output);
core::errors::Status validate(const protocol::AgenticResponse& response);

}  // namespace agentic::validation
