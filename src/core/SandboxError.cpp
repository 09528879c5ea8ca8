#include "SandboxError.h"

namespace BouncePit {

const char* getErrorCodeName(SandboxError::Code code)
{
    switch (code) {
        case SandboxError::Code::InvalidArgument:
            return "InvalidArgument";
        case SandboxError::Code::StaleHandle:
            return "StaleHandle";
        case SandboxError::Code::ConfigFile:
            return "ConfigFile";
    }
    return "Unknown";
}

} // namespace BouncePit
