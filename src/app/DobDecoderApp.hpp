/**
 * @file DobDecoderApp.hpp
 * @brief Process glue for the dob_decoder binary.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dobdecoder::app {

/**
 * @class DobDecoderApp
 * @brief Collects the two input buffers from argv, runs the RenderService and writes the result.
 *
 * Usage: dob_decoder <trait-output> <trait-schema> [--config <dir>]
 * A positional argument starting with '@' names a file holding the buffer.
 */
class DobDecoderApp {
public:
    DobDecoderApp(int argc, char** argv);

    /**
     * @brief Runs one decoding pass.
     * @return Exit code: 0 on success, otherwise the numeric DecodeError.
     */
    int Run();

private:
    /**
     * @brief Splits argv into buffers and options.
     * @return False if argv is unusable (help requested, unknown or dangling option).
     */
    bool ParseArguments();

    /** @brief Resolves an "@file" argument into its content. */
    std::string LoadBuffer(const std::string& argument) const;

    static void PrintUsage(const char* program);

    std::vector<std::string> m_args; ///< argv[1..].
    std::string m_program;
    std::vector<std::string> m_buffers; ///< Raw input buffers, in order.
    std::optional<std::string> m_configDir; ///< --config override.
};

} // namespace dobdecoder::app
