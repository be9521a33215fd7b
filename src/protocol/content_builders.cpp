#include "protocol/content_builders.hpp"

#include <utility>
#include <variant>
#include "core/config/codec_options.hpp"
#include "validation/content_validator.hpp"

namespace agentic::protocol {

namespace {

template <typename Payload>
ContentBlock make_block(const ContentBlockType type, Payload payload) {
    ContentBlock block;
    block.type = type;
    block.payload = std::move(payload);
    return block;
}

ContentBlockMessage message_with(const Role role, MessageContent content,
                                 const std::optional<int> index) {
    ContentBlockMessage message;
    message.role = role;
    message.content = std::move(content);
    message.index = index;
    return message;
}

ContentBlockToolCallOutput output_with(std::string tool_call_id, std::string tool_name,
                                       const std::optional<int> index) {
    ContentBlockToolCallOutput output;
    output.tool_call_id = std::move(tool_call_id);
    output.tool_name = std::move(tool_name);
    output.index = index;
    return output;
}

}  // namespace

AgenticResponse make_response(std::string id) {
    AgenticResponse response;
    response.id = id.empty() ? core::config::generate_response_id() : std::move(id);
    return response;
}

ContentBlock make_message_block(ContentBlockMessage message) {
    return make_block(ContentBlockType::Message, std::move(message));
}

ContentBlock make_text_message_block(const Role role, std::string text,
                                     const std::optional<int> index) {
    return make_message_block(message_with(role, std::move(text), index));
}

ContentBlock make_user_message_block(std::vector<InputPart> parts,
                                     const std::optional<int> index) {
    return make_message_block(message_with(Role::User, std::move(parts), index));
}

ContentBlock make_assistant_message_block(std::vector<OutputPart> parts,
                                          const std::optional<int> index) {
    return make_message_block(message_with(Role::Assistant, std::move(parts), index));
}

ContentBlock make_reasoning_block(ContentBlockReasoning reasoning) {
    return make_block(ContentBlockType::Reasoning, std::move(reasoning));
}

ContentBlock make_tool_call_block(ContentBlockToolCall tool_call) {
    return make_block(ContentBlockType::ToolCall, std::move(tool_call));
}

ContentBlock make_tool_call_output_block(std::string tool_call_id, std::string tool_name,
                                         ToolCallOutputCustom output,
                                         const std::optional<int> index) {
    auto block_output = output_with(std::move(tool_call_id), std::move(tool_name), index);
    block_output.type = ToolCallOutputType::Custom;
    block_output.output = std::move(output);
    return make_block(ContentBlockType::ToolCallOutput, std::move(block_output));
}

ContentBlock make_tool_call_output_block(std::string tool_call_id, std::string tool_name,
                                         ToolCallOutputMcp output,
                                         const std::optional<int> index) {
    auto block_output = output_with(std::move(tool_call_id), std::move(tool_name), index);
    block_output.type = ToolCallOutputType::Mcp;
    block_output.output = std::move(output);
    return make_block(ContentBlockType::ToolCallOutput, std::move(block_output));
}

core::errors::Result<ContentBlock> make_tool_call_output_block(
    ContentBlockToolCallOutput output) {
    if (std::holds_alternative<ToolCallOutputCustom>(output.output)) {
        output.type = ToolCallOutputType::Custom;
    } else if (std::holds_alternative<ToolCallOutputMcp>(output.output)) {
        output.type = ToolCallOutputType::Mcp;
    }

    auto status = validation::validate(output);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return make_block(ContentBlockType::ToolCallOutput, std::move(output));
}

ContentBlock make_mcp_list_tools_block(ContentBlockMCPListTools list_tools) {
    return make_block(ContentBlockType::McpListTools, std::move(list_tools));
}

ContentBlock make_mcp_approval_request_block(ContentBlockMCPToolApprovalRequest request) {
    return make_block(ContentBlockType::McpToolApprovalRequest, std::move(request));
}

ContentBlock make_mcp_approval_response_block(ContentBlockMCPToolApprovalResponse response) {
    return make_block(ContentBlockType::McpToolApprovalResponse, std::move(response));
}

}  // namespace agentic::protocol
