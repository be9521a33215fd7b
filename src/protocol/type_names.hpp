#pragma once

#include <optional>
#include <string>
#include "protocol/agentic_response.hpp"

// Stable wire names for every tag in the content model. Parsers return
// std::nullopt for names outside the known set.
namespace agentic::protocol {

std::string to_string(ContentBlockType type);
std::optional<ContentBlockType> parse_content_block_type(const std::string& name);

std::string to_string(Role role);
std::optional<Role> parse_role(const std::string& name);

std::string to_string(MessagePartType type);
std::optional<MessagePartType> parse_message_part_type(const std::string& name);

std::string to_string(ImageUrlDetail detail);
std::optional<ImageUrlDetail> parse_image_url_detail(const std::string& name);

std::string to_string(ToolCallType type);
std::optional<ToolCallType> parse_tool_call_type(const std::string& name);

std::string to_string(ToolCallOutputType type);
std::optional<ToolCallOutputType> parse_tool_call_output_type(const std::string& name);

std::string to_string(McpToolCallStatus status);
std::optional<McpToolCallStatus> parse_mcp_tool_call_status(const std::string& name);

std::string to_string(FinishStatus status);
std::optional<FinishStatus> parse_finish_status(const std::string& name);

}  // namespace agentic::protocol
