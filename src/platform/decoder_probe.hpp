#pragma once

#include <expected>
#include <string>

class DecoderProbe {
public:
    virtual ~DecoderProbe() = default;
    // Succeeds when the decoding executable exists and passes its health check.
    virtual std::expected<void, std::string> check() = 0;
};
