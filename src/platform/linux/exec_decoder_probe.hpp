#pragma once

#include "platform/decoder_probe.hpp"

#include <string>

// Runs `<executable> -version` and requires a zero exit status.
class ExecDecoderProbe : public DecoderProbe {
public:
    explicit ExecDecoderProbe(std::string executable);

    std::expected<void, std::string> check() override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};
