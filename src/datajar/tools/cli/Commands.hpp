#pragma once
#include "DataJar.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DJ::Tools::CLI {

inline constexpr int ExitSuccess = 0;
inline constexpr int ExitFailure = 1;
inline constexpr int ExitUsage   = 2;

inline constexpr std::string_view DefaultExportFile = "data_jar_backup.json";
inline constexpr std::string_view DefaultTriggerBase = "datajar://trigger";

struct CommandOptions {
    std::optional<std::filesystem::path> storeDirectory;
    std::string                          command;
    std::vector<std::string>             arguments;
    std::optional<std::string>           key;
    std::optional<std::string>           value;
    std::optional<std::string>           type;
    std::optional<std::string>           out;
    std::optional<std::string>           base;
    int                                  indent = 2;
    bool                                 help   = false;
};

void printUsage(std::ostream& stream);

// Parses "[--store <dir>] <command> [args]". Errors are written to `err`.
[[nodiscard]] auto parseCommandLine(int argc, char const* const* argv, std::ostream& err) -> std::optional<CommandOptions>;

/**
 * Runs one command against `jar`. Results go to `out`, diagnostics to `err`.
 * Returns ExitSuccess, ExitFailure for a reported error or ExitUsage for bad
 * arguments.
 */
[[nodiscard]] auto runCommand(CommandOptions const& options, DataJar& jar, std::ostream& out, std::ostream& err) -> int;

} // namespace DJ::Tools::CLI
