#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/schema_errors.hpp"
#include "protocol/content_builders.hpp"
#include "protocol/type_names.hpp"
#include "validation/content_validator.hpp"
#include "sample_responses.hpp"

namespace {

using agentic::core::errors::ErrorKind;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::validation::validate;
using namespace agentic::protocol;

TEST(ContentValidatorTest, BuiltBlocksAreValid) {
    const auto response = sample::full_response();
    for (const auto& block : response.blocks) {
        EXPECT_FALSE(is_error(validate(block))) << to_string(block.type);
    }
    EXPECT_FALSE(is_error(validate(response)));
}

TEST(ContentValidatorTest, McpOutputOnMcpTypedOutputIsValid) {
    ToolCallOutputMcp mcp;
    mcp.content = "done";
    const auto block = make_tool_call_output_block("call_1", "search", mcp);

    ASSERT_EQ(block.type, ContentBlockType::ToolCallOutput);
    const auto& output = std::get<ContentBlockToolCallOutput>(block.payload);
    EXPECT_EQ(output.type, ToolCallOutputType::Mcp);
    EXPECT_TRUE(std::holds_alternative<ToolCallOutputMcp>(output.output));
    EXPECT_FALSE(is_error(validate(block)));
}

TEST(ContentValidatorTest, OutputPayloadMustMatchOutputType) {
    ContentBlockToolCallOutput output;
    output.tool_call_id = "call_1";
    output.type = ToolCallOutputType::Custom;
    output.output = ToolCallOutputMcp{};

    auto status = validate(output);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::VariantMismatch);
    EXPECT_EQ(get_error(status).code, "tool_output_type_mismatch");

    // Same output inside a block fails the block too.
    ContentBlock block;
    block.type = ContentBlockType::ToolCallOutput;
    block.payload = output;
    EXPECT_EQ(get_error(validate(block)).kind, ErrorKind::VariantMismatch);
}

TEST(ContentValidatorTest, OutputWithoutPayloadFails) {
    ContentBlockToolCallOutput output;
    output.type = ToolCallOutputType::Mcp;

    auto status = validate(output);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::VariantMismatch);
    EXPECT_EQ(get_error(status).code, "empty_tool_output");
}

TEST(ContentValidatorTest, BlockWithoutPayloadFails) {
    ContentBlock block;
    block.type = ContentBlockType::Reasoning;

    auto status = validate(block);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::VariantMismatch);
    EXPECT_EQ(get_error(status).code, "empty_block");
}

TEST(ContentValidatorTest, BlockTypeMustMatchPayload) {
    auto block = sample::lookup_tool_call_block();
    block.type = ContentBlockType::Message;

    auto status = validate(block);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::VariantMismatch);
    EXPECT_EQ(get_error(status).code, "block_type_mismatch");
    EXPECT_NE(get_error(status).message.find("tool_call payload"), std::string::npos);
}

TEST(ContentValidatorTest, ResponseErrorNamesBlockPosition) {
    auto response = sample::hello_lookup_response();
    response.blocks.push_back(ContentBlock{ContentBlockType::McpListTools, {}});

    auto status = validate(response);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::VariantMismatch);
    EXPECT_EQ(get_error(status).message.rfind("Block 2:", 0), 0u);
}

TEST(ContentValidatorTest, TokenTotalsAndMediaSourcesAreNotEnforced) {
    auto response = make_response("resp-lenient");
    TokenUsageMeta usage;
    usage.input_tokens = 10;
    usage.output_tokens = 5;
    usage.total_tokens = 99;
    response.usage = usage;

    OutputImage both;
    both.url = "https://example.com/a.png";
    both.base64_data = "iVBORw0KGgo=";
    both.mime_type = "image/png";
    response.blocks.push_back(make_assistant_message_block({both}));

    EXPECT_FALSE(is_error(validate(response)));
}

TEST(ContentBuildersTest, GenericOutputBuilderDerivesType) {
    ContentBlockToolCallOutput output;
    output.tool_call_id = "call_9";
    output.tool_name = "lookup";
    output.type = ToolCallOutputType::Mcp;
    output.output = ToolCallOutputCustom{"ok"};

    auto built = make_tool_call_output_block(output);
    ASSERT_FALSE(is_error(built));
    const auto& block = get_value(built);
    EXPECT_EQ(block.type, ContentBlockType::ToolCallOutput);
    EXPECT_EQ(std::get<ContentBlockToolCallOutput>(block.payload).type,
              ToolCallOutputType::Custom);
}

TEST(ContentBuildersTest, GenericOutputBuilderRejectsEmptyOutput) {
    ContentBlockToolCallOutput output;
    output.tool_call_id = "call_9";

    auto built = make_tool_call_output_block(output);
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).kind, ErrorKind::VariantMismatch);
}

TEST(ContentBuildersTest, MessageBuildersPickRepresentation) {
    const auto text = make_text_message_block(Role::System, "Be brief.");
    const auto& message = std::get<ContentBlockMessage>(text.payload);
    EXPECT_EQ(message.role, Role::System);
    ASSERT_TRUE(std::holds_alternative<std::string>(message.content));
    EXPECT_EQ(std::get<std::string>(message.content), "Be brief.");
    EXPECT_FALSE(message.index.has_value());

    const auto user = make_user_message_block({InputText{"hi"}, InputFile{}}, 7);
    const auto& user_message = std::get<ContentBlockMessage>(user.payload);
    EXPECT_EQ(user_message.role, Role::User);
    EXPECT_EQ(user_message.index, 7);
    const auto& parts = std::get<std::vector<InputPart>>(user_message.content);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(message_part_type(parts[0]), MessagePartType::Text);
    EXPECT_EQ(message_part_type(parts[1]), MessagePartType::File);
}

TEST(ContentBuildersTest, MakeResponseGeneratesIdWhenEmpty) {
    const auto generated = make_response();
    EXPECT_EQ(generated.id.rfind("resp-", 0), 0u);
    EXPECT_EQ(generated.id.size(), 21u);
    EXPECT_TRUE(generated.blocks.empty());

    EXPECT_EQ(make_response("resp-fixed").id, "resp-fixed");
}

TEST(TypeNamesTest, TagsRoundTripThroughNames) {
    EXPECT_EQ(to_string(ContentBlockType::McpToolApprovalResponse), "mcp_tool_approval_response");
    EXPECT_EQ(parse_content_block_type("tool_call_output"), ContentBlockType::ToolCallOutput);
    EXPECT_EQ(to_string(ToolCallType::Custom), "custom_tool_call");
    EXPECT_EQ(to_string(ToolCallOutputType::Mcp), "mcp_tool_call_output");
    EXPECT_FALSE(parse_role("tool").has_value());
    EXPECT_FALSE(parse_content_block_type("web_search").has_value());
}

TEST(TypeNamesTest, PartTypeFollowsHeldAlternative) {
    EXPECT_EQ(message_part_type(InputPart{InputText{"hi"}}), MessagePartType::Text);
    EXPECT_EQ(message_part_type(InputPart{InputImage{}}), MessagePartType::Image);
    EXPECT_EQ(message_part_type(InputPart{InputAudio{}}), MessagePartType::Audio);
    EXPECT_EQ(message_part_type(InputPart{InputVideo{}}), MessagePartType::Video);
    EXPECT_EQ(message_part_type(InputPart{InputFile{}}), MessagePartType::File);

    EXPECT_EQ(message_part_type(OutputPart{OutputText{}}), MessagePartType::Text);
    EXPECT_EQ(message_part_type(OutputPart{OutputImage{}}), MessagePartType::Image);
    EXPECT_EQ(message_part_type(OutputPart{OutputAudio{}}), MessagePartType::Audio);
    EXPECT_EQ(message_part_type(OutputPart{OutputVideo{}}), MessagePartType::Video);
}

}  // namespace
