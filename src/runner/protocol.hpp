/**
 * @file protocol.hpp
 * @brief The child→parent result channel.
 *
 * The entry program reports back over its own stdout with exactly one
 * line, written last:
 *
 *   <kResultSentinel><JSON object>\n
 *
 * JSON object fields:
 *   stdout          string   captured sys.stdout of the executed code
 *   stderr          string   captured sys.stderr of the executed code
 *   value           any      return of main(); key absent if not called
 *   exception       object|null  {kind, message, trace}
 *   locals          object   name → str(value), dunder names excluded
 *   files_written   array    pre-written request files
 *   execution_time  number   seconds, measured inside the child
 *
 * Submitted code must not print the sentinel itself. The decoder takes
 * the *last* occurrence, so an early stray copy only costs the stdout
 * residue, not the record.
 */

#pragma once

#include <string_view>

namespace sandbox_exec::protocol {

inline constexpr std::string_view kResultSentinel = "\x1e==SANDBOX_EXEC_RESULT:7c1f09d4==\x1e";

namespace field {
inline constexpr const char* kStdout = "stdout";
inline constexpr const char* kStderr = "stderr";
inline constexpr const char* kValue = "value";
inline constexpr const char* kException = "exception";
inline constexpr const char* kLocals = "locals";
inline constexpr const char* kFilesWritten = "files_written";
inline constexpr const char* kExecutionTime = "execution_time";
inline constexpr const char* kKind = "kind";
inline constexpr const char* kMessage = "message";
inline constexpr const char* kTrace = "trace";
}  // namespace field

}  // namespace sandbox_exec::protocol
