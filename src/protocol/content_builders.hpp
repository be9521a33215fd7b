#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/schema_errors.hpp"
#include "protocol/agentic_response.hpp"

// Builders that set a block's type tag and its payload together.
namespace agentic::protocol {

// Generates an id when `id` is empty.
AgenticResponse make_response(std::string id = "");

ContentBlock make_message_block(ContentBlockMessage message);
ContentBlock make_text_message_block(Role role, std::string text,
                                     std::optional<int> index = std::nullopt);
ContentBlock make_user_message_block(std::vector<InputPart> parts,
                                     std::optional<int> index = std::nullopt);
ContentBlock make_assistant_message_block(std::vector<OutputPart> parts,
                                          std::optional<int> index = std::nullopt);

ContentBlock make_reasoning_block(ContentBlockReasoning reasoning);
ContentBlock make_tool_call_block(ContentBlockToolCall tool_call);

ContentBlock make_tool_call_output_block(std::string tool_call_id, std::string tool_name,
                                         ToolCallOutputCustom output,
                                         std::optional<int> index = std::nullopt);
ContentBlock make_tool_call_output_block(std::string tool_call_id, std::string tool_name,
                                         ToolCallOutputMcp output,
                                         std::optional<int> index = std::nullopt);
// Takes the output type from the held payload, then validates.
core::errors::Result<ContentBlock> make_tool_call_output_block(
    ContentBlockToolCallOutput output);

ContentBlock make_mcp_list_tools_block(ContentBlockMCPListTools list_tools);
ContentBlock make_mcp_approval_request_block(ContentBlockMCPToolApprovalRequest request);
ContentBlock make_mcp_approval_response_block(ContentBlockMCPToolApprovalResponse response);

}  // namespace agentic::protocol
