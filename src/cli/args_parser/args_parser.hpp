#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace gtxfer::args_parser {
    struct CLIArgs
{
    std::vector<std::string> files;             // -f, --file (повторяемый)
    std::optional<std::string> directory;       // --dir
    std::string destination;                    // --dest s3://bucket/prefix/
    std::optional<std::string> download;        // -d, --download s3://bucket/key
    std::string output{"."};                    // -o, --output
    std::vector<std::string> include_patterns;  // --include GLOB
    std::vector<std::string> exclude_patterns;  // --exclude GLOB
    std::optional<int> max_retries;             // --max-retries=N
    std::optional<std::string> profile;         // -p, --profile
    std::optional<std::string> set_profile;     // --set-profile
    std::optional<std::string> state_file;      // --state-file
    bool verify{false};                         // --verify
    bool checksum{false};                       // --checksum
    bool resume{false};                         // --resume
    bool no_resume{false};                      // --no-resume
    bool dry_run{false};                        // --dry-run
    bool clean_state{false};                    // --clean-state
    bool show_config{false};                    // --show-config
    bool progress{true};                        // --no-progress
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // --verbose
    bool version{false};                        // -v, --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// nullopt: --help was printed or the arguments were rejected.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace gtxfer::args_parser

using __CLI = gtxfer::args_parser::CLIArgs;
