#pragma once
#include <cstddef>
#include <string>
#include <random>
#include <sstream>

namespace agentic::core::config {

    // Tunables for codec::ResponseCodec
    struct CodecOptions {
        // Run validation over every block before writing any bytes.
        bool validate_on_encode = true;
        // Decode refuses inputs larger than this.
        std::size_t max_payload_bytes = 64u * 1024u * 1024u;
        // Decode refuses bodies whose arrays and maps nest deeper than this.
        std::size_t max_nesting_depth = 512;
    };

    // Generates a 16-character hex ID prefixed with "resp-"
    inline std::string generate_response_id() {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "resp-";
        for (int i = 0; i < 16; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace agentic::core::config
