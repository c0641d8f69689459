#include "config/config.hpp"
#include "output/report.hpp"
#include "processing/candidate.hpp"
#include "processing/check_run.hpp"
#include "processing/diff_labeler.hpp"
#include "processing/policy.hpp"
#include "util/log.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitIssues = 1,
    kExitError = 2,
};

// Reads all of `path`, or of stdin for "-".
bool
read_input(const std::string& path, std::string& contents, std::string& error) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        contents = buffer.str();
        return true;
    }

    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        error = fmt::format("Failed to open '{}' for reading", path);
        return false;
    }
    buffer << ifs.rdbuf();
    contents = buffer.str();
    return true;
}

// One path per line, as handed over by a version control hook.
std::vector<std::string>
read_paths(std::istream& stream) {
    std::vector<std::string> paths;
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            paths.push_back(line);
        }
    }
    return paths;
}

}  // namespace

int
main(int argc, char* argv[]) {
    checkfiles::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format((R"(
Usage: {} [options] [path...]

Check files for tabs, trailing whitespace and whitespace-only lines

Options:
    -f, --fixup                  fix the files with problems in place
    -t, --tabsize N              set the tab length (default: 8 or checkfiles.tab_size)
    -s, --spaces                 indent with spaces; any tab is a problem
    -T, --tabs                   indent with tabs; spaces in the indentation are a problem

    -d, --diff FILE              only check the lines a unified diff inserts ('-' for stdin)
    -p, --parents N              parent count of the change in --diff mode (default: 1);
                                 merges and root changes are skipped
    -r, --revision NAME          name of the checked revision, used in the summary

    -C, --root DIR               working directory root (default: .)
    -c, --config FILE            load an extra config file

    -v, --verbose                show the location of offending characters in each line
    -q, --quiet                  hide file names and only show summary information
        --debug                  show settings and details about each file considered
        --no-color               don't color the output

    -h, --help                   show this help and exit
        --version                show program version and exit

Without paths, the paths to check are read from stdin, one per line.
If problems are found, the exit code is 1, on errors 2, otherwise 0.
)"),
                                       argv[0]);

        help += "\n";
        help += "Config files:\n    " + checkfiles::config_user_file() + "\n    <root>/.checkfiles.conf\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"fixup", no_argument, 0, 'f'},
                                               {"tabsize", required_argument, 0, 't'},
                                               {"spaces", no_argument, 0, 's'},
                                               {"tabs", no_argument, 0, 'T'},
                                               {"diff", required_argument, 0, 'd'},
                                               {"parents", required_argument, 0, 'p'},
                                               {"revision", required_argument, 0, 'r'},
                                               {"root", required_argument, 0, 'C'},
                                               {"config", required_argument, 0, 'c'},
                                               {"verbose", no_argument, 0, 'v'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"debug", no_argument, 0, 'D'},
                                               {"no-color", no_argument, 0, 'N'},
                                               {"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'V'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "ft:sTd:p:r:C:c:vqh", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'V':
                    opts.version = true;
                    return true;
                case 'h':
                    opts.help = true;
                    return true;
                case 'f':
                    opts.fixup = true;
                    break;
                case 't':
                    opts.tab_size = optarg;
                    break;
                case 's':
                    opts.indent = "spaces";
                    break;
                case 'T':
                    opts.indent = "tabs";
                    break;
                case 'd':
                    opts.diff_file = optarg;
                    break;
                case 'p': {
                    std::string value = optarg;
                    auto parsed = std::from_chars(value.data(), value.data() + value.size(), opts.parent_count);
                    if (value.empty() || parsed.ec != std::errc() || parsed.ptr != value.data() + value.size() ||
                        opts.parent_count < 0) {
                        show_help(fmt::format("error: invalid value for -p ({})\n", value));
                        return false;
                    }
                } break;
                case 'r':
                    opts.revision = optarg;
                    break;
                case 'C':
                    opts.root = optarg;
                    break;
                case 'c':
                    opts.config_file = optarg;
                    break;
                case 'v':
                    opts.verbosity = checkfiles::Verbosity::kVerbose;
                    break;
                case 'q':
                    opts.verbosity = checkfiles::Verbosity::kQuiet;
                    break;
                case 'D':
                    opts.verbosity = checkfiles::Verbosity::kDebug;
                    break;
                case 'N':
                    opts.color = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        for (int i = optind; i < in_argc; i++) {
            opts.paths.push_back(in_argv[i]);
        }
        return true;
    };

    if (!parse_args(argc, argv)) {
        return kExitError;
    }

    if (opts.help) {
        show_help("");
        return kExitOk;
    }

    if (opts.version) {
        fmt::print("version: {}\n", CHECKFILES_VERSION);
        fmt::print("vcs hash: {}\n", CHECKFILES_BUILD_HASH);
        return kExitOk;
    }

    checkfiles::Log log(opts.verbosity);

    checkfiles::PolicySettings settings;
    if (auto loaded = checkfiles::config_load_settings(opts, settings, log); !loaded.ok) {
        log.warn("{}", loaded.error);
        return kExitError;
    }

    checkfiles::Policy policy;
    if (auto built = checkfiles::policy_build(settings, policy); !built.ok) {
        log.warn("checkfiles: {}", built.error);
        return kExitError;
    }
    log.debug("checkfiles: {}", checkfiles::policy_describe(policy));

    bool diff_mode = !opts.diff_file.empty() || policy.diff_only;
    if (diff_mode && opts.fixup) {
        show_help("error: --fixup can't be combined with --diff or diff_only\n");
        return kExitError;
    }

    auto style = checkfiles::report_style_default(opts.color && checkfiles::tty_supports_color(stdout));
    checkfiles::WorkingDirectorySource working_directory(opts.root);
    checkfiles::RunResult result;

    if (diff_mode) {
        std::string diff_path = opts.diff_file.empty() ? "-" : opts.diff_file;
        std::string diff_text;
        std::string error;
        if (!read_input(diff_path, diff_text, error)) {
            log.warn("checkfiles: {}", error);
            return kExitError;
        }

        log.note("checkfiles: checking {} for tabs or trailing whitespace...",
                 opts.revision.empty() ? "changed lines" : opts.revision);

        auto tokens = checkfiles::label_unified_diff(diff_text);
        checkfiles::ChangeInfo change{opts.revision, opts.parent_count};
        result = checkfiles::check_diff(change, tokens, working_directory, policy, log, style);
    } else {
        auto paths = opts.paths.empty() ? read_paths(std::cin) : opts.paths;

        log.note("checkfiles: checking modified files in working directory for tabs or trailing whitespace...");
        result = checkfiles::check_working_directory(paths, working_directory, policy, opts.fixup, log, style);
    }

    switch (result.status) {
        case checkfiles::RunStatus::kError:
            log.warn("checkfiles: error: {}", result.error);
            return kExitError;
        case checkfiles::RunStatus::kSkipped:
            return kExitOk;
        case checkfiles::RunStatus::kOk:
            break;
    }

    return result.had_issues ? kExitIssues : kExitOk;
}
