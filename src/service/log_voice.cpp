#include "service/log_voice.hpp"

#include <spdlog/spdlog.h>

namespace wg::service {

void LogVoiceOutput::speak(const std::string& text) {
    spdlog::info("[TTS] {}", text);
}

} // namespace wg::service
