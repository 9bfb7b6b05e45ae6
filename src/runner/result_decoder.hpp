/**
 * @file result_decoder.hpp
 * @brief Turns raw child output into an ExecutionResult.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "launcher/process_launcher.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_exec {

/**
 * @brief The sentinel line split out of one captured stream.
 */
struct LocatedRecord {
    std::string payload;    ///< Text after the sentinel, up to end of line
    std::string residue;    ///< The stream with the record line removed
};

/**
 * @brief Find the last sentinel line in `text`.
 */
[[nodiscard]] std::optional<LocatedRecord> locate_record(std::string_view text);

/**
 * @brief Decodes the result channel; never fails.
 *
 * Every outcome, including timeouts, missing or corrupt records and
 * crashed interpreters, yields a complete ExecutionResult. Synthetic
 * failure records keep the raw stdout/stderr verbatim.
 */
class ResultDecoder {
public:
    explicit ResultDecoder(Logger& logger);

    [[nodiscard]] ExecutionResult decode(const ProcessOutput& output,
                                         const std::vector<std::string>& files_written) const;

    /// Result for a child that never started.
    [[nodiscard]] static ExecutionResult spawn_failure(const Error& error,
                                                       const std::vector<std::string>& files_written);

private:
    [[nodiscard]] static ExecutionResult synthesize(std::string_view kind,
                                                    std::string message,
                                                    const ProcessOutput& output,
                                                    const std::vector<std::string>& files_written);

    Logger& logger_;
};

}  // namespace sandbox_exec
