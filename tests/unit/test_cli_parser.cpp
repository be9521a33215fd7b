#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/schema_errors.hpp"

namespace {

using agentic::app::cli::InspectCommand;
using agentic::app::cli::InspectRequest;
using agentic::app::cli::parse_and_validate;
using agentic::core::errors::ErrorKind;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;

agentic::core::errors::Result<InspectRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("agentic_inspect");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        input_ = std::filesystem::temp_directory_path() / "agentic_cli_parser_test.agr";
        std::ofstream out(input_, std::ios::binary);
        out << "AGR\x01";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(input_, ec);
    }

    std::filesystem::path input_;
};

TEST_F(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST_F(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"decode"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST_F(CliParserTest, FailsWhenInputMissing) {
    auto result = parse_tokens({"inspect"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST_F(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"inspect", "--input"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST_F(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"inspect", "--input", input_.string(), "--pretty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST_F(CliParserTest, FailsWhenMaxBytesNotNumeric) {
    auto result = parse_tokens({"validate", "--input", input_.string(), "--max-bytes", "1k"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST_F(CliParserTest, FailsWhenMaxBytesOutOfBounds) {
    auto zero = parse_tokens({"validate", "--input", input_.string(), "--max-bytes", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge =
        parse_tokens({"validate", "--input", input_.string(), "--max-bytes", "2147483648"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST_F(CliParserTest, FailsWhenInputIsNotAFile) {
    const auto missing =
        std::filesystem::temp_directory_path() / "__definitely_missing_agentic_input__.agr";
    auto result = parse_tokens({"inspect", "--input", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");

    auto directory =
        parse_tokens({"inspect", "--input", std::filesystem::temp_directory_path().string()});
    ASSERT_TRUE(is_error(directory));
    EXPECT_EQ(get_error(directory).code, "invalid_path");
}

TEST_F(CliParserTest, ParsesInspectRequestWithDefaults) {
    auto result = parse_tokens({"inspect", "--input", input_.string()});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, InspectCommand::Inspect);
    EXPECT_EQ(req.input, input_);
    EXPECT_EQ(req.codec_options.max_payload_bytes, 64u * 1024u * 1024u);
    EXPECT_FALSE(req.verbose);
}

TEST_F(CliParserTest, ParsesValidateRequestWithAllFlags) {
    auto result = parse_tokens(
        {"validate", "--verbose", "--input", input_.string(), "--max-bytes", "4096"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, InspectCommand::Validate);
    EXPECT_EQ(req.codec_options.max_payload_bytes, 4096u);
    EXPECT_TRUE(req.verbose);
}

}  // namespace
