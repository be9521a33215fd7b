#include "validation/content_validator.hpp"

#include <variant>
#include "protocol/type_names.hpp"

namespace agentic::validation {

using core::errors::ErrorKind;
using core::errors::SchemaError;
using core::errors::Status;

std::string ContentValidator::describe_payload(const std::size_t payload_index) {
    if (payload_index == 0 || payload_index == std::variant_npos) {
        return "no payload";
    }
    return protocol::to_string(static_cast<protocol::ContentBlockType>(payload_index - 1)) +
           " payload";
}

Status ContentValidator::validate_tool_call_output(
    const protocol::ContentBlockToolCallOutput& output) const {
    if (std::holds_alternative<std::monostate>(output.output)) {
        return SchemaError{ErrorKind::VariantMismatch,
                           "Tool call output '" + output.tool_call_id +
                               "' has no output payload.",
                           "empty_tool_output"};
    }

    if (output.output.index() != protocol::output_index_for(output.type)) {
        const std::string held =
            std::holds_alternative<protocol::ToolCallOutputCustom>(output.output)
                ? "custom"
                : "mcp";
        return SchemaError{ErrorKind::VariantMismatch,
                           "Tool call output type " + protocol::to_string(output.type) +
                               " holds a " + held + " output.",
                           "tool_output_type_mismatch",
                           "Use make_tool_call_output_block so the type follows the output."};
    }
    return core::errors::ok();
}

Status ContentValidator::validate_block(const protocol::ContentBlock& block) const {
    const auto expected = protocol::payload_index_for(block.type);
    const auto actual = block.payload.index();

    if (actual == 0 || actual == std::variant_npos) {
        return SchemaError{ErrorKind::VariantMismatch,
                           "Content block of type " + protocol::to_string(block.type) +
                               " has no payload.",
                           "empty_block"};
    }
    if (actual != expected) {
        return SchemaError{ErrorKind::VariantMismatch,
                           "Content block of type " + protocol::to_string(block.type) +
                               " holds a " + describe_payload(actual) + ".",
                           "block_type_mismatch",
                           "Build blocks with the make_*_block helpers."};
    }

    if (const auto* output = std::get_if<protocol::ContentBlockToolCallOutput>(&block.payload)) {
        return validate_tool_call_output(*output);
    }
    return core::errors::ok();
}

Status ContentValidator::validate_response(const protocol::AgenticResponse& response) const {
    for (std::size_t i = 0; i < response.blocks.size(); ++i) {
        auto status = validate_block(response.blocks[i]);
        if (core::errors::is_error(status)) {
            auto err = core::errors::get_error(status);
            err.message = "Block " + std::to_string(i) + ": " + err.message;
            return err;
        }
    }
    return core::errors::ok();
}

Status validate(const protocol::ContentBlock& block) {
    return ContentValidator{}.validate_block(block);
}

Status validate(const protocol::ContentBlockToolCallOutput& output) {
    return ContentValidator{}.validate_tool_call_output(output);
}

Status validate(const protocol::AgenticResponse& response) {
    return ContentValidator{}.validate_response(response);
}

}  // namespace agentic::validation
