#pragma once

#include "ir.hpp"

#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Collects what std::cout and std::cerr receive while a test runs.
 *
 * The first capture puts a routing buffer in front of each stream. The routing buffers live
 * for the rest of the process: outside a capture they forward to the buffers they replaced,
 * so a timed-out worker that is still printing never writes into freed memory.
 *
 * Disabled instances are no-ops. stop() is idempotent and also runs from the destructor.
 */
class OutputCapture {
public:
    explicit OutputCapture(bool enabled) : enabled_{enabled} {}
    ~OutputCapture();

    OutputCapture(const OutputCapture&) = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;

    void start();

    /// Ends the capture and returns one block per non-empty stream (`stdout` first).
    std::vector<OutputBlock> stop();

private:
    bool enabled_;
    bool active_{false};
};

/// Renders blocks as `[stdout]\n...` log entries.
[[nodiscard]] std::vector<std::string> as_logs(const std::vector<OutputBlock>& blocks);

}  // namespace babel::testing
