#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace BouncePit {

/**
 * @brief Error reported when caller input is rejected at the sandbox boundary.
 */
struct SandboxError {
    enum class Code : uint8_t {
        InvalidArgument, // Non-finite or out-of-domain value.
        StaleHandle,     // Body handle no longer refers to a live body.
        ConfigFile       // Config file missing, unreadable or malformed.
    };

    Code code = Code::InvalidArgument;
    std::string message;

    SandboxError() : message("Unknown error") {}
    SandboxError(Code c, std::string msg) : code(c), message(std::move(msg)) {}

    static SandboxError invalidArgument(std::string msg)
    {
        return SandboxError(Code::InvalidArgument, std::move(msg));
    }

    static SandboxError staleHandle(std::string msg)
    {
        return SandboxError(Code::StaleHandle, std::move(msg));
    }
};

const char* getErrorCodeName(SandboxError::Code code);

// Success payload for operations that only report failure.
using Okay = std::monostate;

} // namespace BouncePit
