#pragma once

/**
 * @file logging_input_sink.hpp
 * @brief Dry-run InputSink that prints events instead of synthesizing them
 *
 * Used where no OS backend exists, or when injector.dry_run is set.
 */

#include "valtime/core/input_sink.hpp"

#include <iosfwd>

namespace valtime {

class LoggingInputSink : public InputSink {
public:
    /// @param out       Stream to print to
    /// @param realTime  Honour pauses (true) or skip them (false)
    explicit LoggingInputSink(std::ostream& out, bool realTime = true);

    void setClipboard(std::string_view utf8Text) override;
    void sendKey(KeyCode key, bool down) override;
    void pause(std::chrono::milliseconds delay) override;

private:
    std::ostream& out_;
    bool realTime_;
};

}  // namespace valtime
