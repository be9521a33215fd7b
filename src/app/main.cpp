#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "codec/response_codec.hpp"
#include "core/errors/schema_errors.hpp"
#include "core/logging/logger.hpp"
#include "registry/type_registry.hpp"

namespace {

agentic::core::errors::Result<std::vector<std::uint8_t>> read_payload(
    const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return agentic::core::errors::SchemaError{
            agentic::core::errors::ErrorKind::Input,
            "Unable to open input file: " + path.string(), "input_open_failed"};
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        return agentic::core::errors::SchemaError{
            agentic::core::errors::ErrorKind::Input,
            "Unable to read input file: " + path.string(), "input_read_failed"};
    }
    return bytes;
}

void report(const agentic::core::errors::SchemaError& err) {
    LOG_ERROR(agentic::core::errors::to_string(err.kind) + " [" + err.code + "]: " +
              err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto& logger = agentic::core::logging::Logger::get();
    logger.set_min_level(agentic::core::logging::LogLevel::INFO);

    // 1. Parse CLI input and return normalized input errors
    auto parsed = agentic::app::cli::parse_and_validate(argc, argv);
    if (agentic::core::errors::is_error(parsed)) {
        report(agentic::core::errors::get_error(parsed));
        return 2;
    }

    const auto& req = agentic::core::errors::get_value(parsed);
    if (req.verbose) {
        logger.set_min_level(agentic::core::logging::LogLevel::DEBUG);
    }
    logger.set_context(req.input.filename().string());

    // 2. Load the encoded response
    auto payload = read_payload(req.input);
    if (agentic::core::errors::is_error(payload)) {
        report(agentic::core::errors::get_error(payload));
        return 3;
    }
    const auto& bytes = agentic::core::errors::get_value(payload);
    LOG_DEBUG("Read " + std::to_string(bytes.size()) + " bytes");

    // 3. Only primitive extras can be resolved here; custom types stay opaque in `inspect`
    agentic::codec::ResponseCodec codec(
        std::make_shared<agentic::registry::TypeRegistry>(), req.codec_options);

    if (req.command == agentic::app::cli::InspectCommand::Inspect) {
        auto wire = codec.inspect(bytes);
        if (agentic::core::errors::is_error(wire)) {
            report(agentic::core::errors::get_error(wire));
            return 4;
        }
        std::cout << agentic::core::errors::get_value(wire).dump(
                         2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return 0;
    }

    auto decoded = codec.decode(bytes);
    if (agentic::core::errors::is_error(decoded)) {
        report(agentic::core::errors::get_error(decoded));
        return 4;
    }

    const auto& response = agentic::core::errors::get_value(decoded);
    LOG_INFO("Valid response " + response.id + " with " +
             std::to_string(response.blocks.size()) + " blocks");
    return 0;
}
