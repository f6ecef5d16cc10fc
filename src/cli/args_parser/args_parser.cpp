#include "args_parser.hpp"
#include <CLI/CLI.hpp>

namespace gtxfer::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"gtxfer - resumable batch transfers to and from S3 via the aws cli"};
    app.add_option("-f,--file", args.files, "File to upload (repeatable)")
        ->check(CLI::ExistingFile);
    app.add_option("--dir", args.directory, "Upload every file under this directory");
    app.add_option("--dest", args.destination, "Destination prefix, e.g. s3://bucket/path/");
    app.add_option("-d,--download", args.download, "Download an object or prefix (s3://bucket/key)");
    app.add_option("-o,--output", args.output, "Local directory for downloads")
        ->capture_default_str();

    app.add_option("--include", args.include_patterns, "Only files matching this glob (repeatable)");
    app.add_option("--exclude", args.exclude_patterns, "Skip files and directories matching this glob (repeatable)");

    app.add_option("--max-retries", args.max_retries, "Attempts per file")
        ->check(CLI::PositiveNumber);
    app.add_flag("--verify", args.verify, "Compare remote and local size after each transfer");
    app.add_flag("--checksum", args.checksum, "Store an xxh64 checksum of every completed file");

    auto* resume = app.add_flag("--resume", args.resume, "Resume the previous interrupted operation");
    auto* no_resume = app.add_flag("--no-resume", args.no_resume, "Ignore any saved state and start fresh");
    resume->excludes(no_resume);

    app.add_flag("--dry-run", args.dry_run, "Show what would be transferred and exit");
    app.add_flag("--clean-state", args.clean_state, "Delete the saved operation state and exit");
    app.add_option("--state-file", args.state_file, "Path of the state (checkpoint) file");

    app.add_option("-p,--profile", args.profile, "AWS profile passed to the aws cli");
    app.add_option("--set-profile", args.set_profile, "Save a default AWS profile and exit");
    app.add_flag("--show-config", args.show_config, "Print the effective configuration and exit");

    bool no_progress = false;
    app.add_flag("--no-progress", no_progress, "Disable the live progress bar");
    auto* quiet = app.add_flag("-q,--quiet", args.quiet, "Only print warnings and the summary");
    auto* verbose = app.add_flag("--verbose", args.verbose, "Debug logging");
    quiet->excludes(verbose);
    app.add_flag("-v,--version", args.version, "Print version and build information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    args.progress = !no_progress;
    return args;
}

} // namespace gtxfer::args_parser
