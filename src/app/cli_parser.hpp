#pragma once
#include <cstddef>
#include <filesystem>
#include "core/config/codec_options.hpp"
#include "core/errors/schema_errors.hpp"

namespace agentic::app::cli {

    enum class InspectCommand {
        Inspect,   // Print the wire tree of an encoded response
        Validate   // Fully decode and validate it
    };

    // Validated input for one agentic_inspect invocation
    struct InspectRequest {
        InspectCommand command = InspectCommand::Inspect;
        std::filesystem::path input;
        core::config::CodecOptions codec_options;
        bool verbose = false;
    };

    agentic::core::errors::Result<InspectRequest> parse_and_validate(int argc, char* argv[]);
}
