#include "valtime/core/logging_input_sink.hpp"

#include <ostream>

namespace valtime {

LoggingInputSink::LoggingInputSink(std::ostream& out, bool realTime)
    : out_(out)
    , realTime_(realTime)
{
}

void LoggingInputSink::setClipboard(std::string_view utf8Text) {
    out_ << "[DryRun] clipboard <- \"" << utf8Text << "\"\n";
}

void LoggingInputSink::sendKey(KeyCode key, bool down) {
    out_ << "[DryRun] " << (down ? "down " : "up   ") << keyName(key) << '\n';
}

void LoggingInputSink::pause(std::chrono::milliseconds delay) {
    if (realTime_) {
        InputSink::pause(delay);
    }
}

}  // namespace valtime
