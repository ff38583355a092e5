#pragma once

#include "nav/guidance.hpp"

#include <string>

namespace wg::service {

/// Voice backend for headless runs: every message goes to the log as
/// "[TTS] <text>".
class LogVoiceOutput : public nav::VoiceOutput {
public:
    void speak(const std::string& text) override;
};

} // namespace wg::service
