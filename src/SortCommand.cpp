#include "SortCommand.hpp"

#include <cstdlib>
#include <filesystem>

#include "FileMover.hpp"
#include "SortConfig.hpp"
#include "Sorter.hpp"

namespace {
constexpr char kProgramName[] = "extension_sorter";
constexpr char kDefaultDestination[] = "dist";

void printUsage(std::ostream& out) {
    out << "Usage: " << kProgramName << " SOURCE [DESTINATION] [--config FILE]\n"
        << "\n"
        << "Recursively move every file under SOURCE into DESTINATION/<extension>.\n"
        << "Files without an extension go to DESTINATION/no_extension.\n"
        << "\n"
        << "  DESTINATION      target directory (default: ./" << kDefaultDestination << ")\n"
        << "  --config FILE    JSON settings (collision_policy, max_collision_attempts, verbose)\n"
        << "  -h, --help       show this message" << std::endl;
}

// Report a single move the way the janitor always has.
void printMove(std::ostream& out, const std::filesystem::path& from, const MoveResult& result) {
    switch (result.status) {
    case MoveResult::Status::Moved:
        out << "Moved `" << from.string() << "` -> `" << result.target.string() << "`" << std::endl;
        break;
    case MoveResult::Status::MovedCrossDevice:
        out << "Copied `" << from.string() << "` -> `" << result.target.string() << "` (cross-device move)" << std::endl;
        break;
    case MoveResult::Status::Renamed:
        out << "Moved `" << from.string() << "` -> `" << result.target.string() << "` (renamed to avoid collision)" << std::endl;
        break;
    case MoveResult::Status::Skipped:
        out << "Skipped `" << from.string() << "`: `" << result.target.string() << "` already exists" << std::endl;
        break;
    case MoveResult::Status::AlreadyInPlace:
        out << "Already sorted `" << from.string() << "`" << std::endl;
        break;
    case MoveResult::Status::Failed:
        break;
    }
}
} // namespace

int runSorter(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::vector<std::string> positional;
    std::string configPath;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(out);
            return EXIT_SUCCESS;
        }
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                err << "`--config` requires a file path." << std::endl;
                return EXIT_FAILURE;
            }
            configPath = args[++i];
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-') {
            err << "Unknown option `" << arg << "`." << std::endl;
            printUsage(err);
            return EXIT_FAILURE;
        }
        positional.push_back(arg);
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage(err);
        return EXIT_FAILURE;
    }

    SortConfig config;
    if (!configPath.empty() && !config.load(configPath)) {
        err << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    // The source is checked before anything is created on disk.
    std::string error;
    std::filesystem::path source;
    if (!Sorter::validateSource(positional[0], source, error)) {
        err << error << std::endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path requestedDestination = positional.size() > 1 ? positional[1] : kDefaultDestination;
    std::filesystem::path destination;
    if (!Sorter::prepareDestination(requestedDestination, destination, error)) {
        err << error << std::endl;
        return EXIT_FAILURE;
    }

    Sorter sorter(destination, config.makeMover());
    if (config.isVerbose()) {
        sorter.setMoveObserver([&out](const std::filesystem::path& from, const MoveResult& result) {
            printMove(out, from, result);
        });
    }

    out << "Sorting `" << source.string() << "` into `" << destination.string() << "`..." << std::endl;
    const SortReport report = sorter.sort(source);

    for (const auto& diagnostic : report.diagnostics) {
        err << "Error (" << diagnosticKindName(diagnostic.kind) << ") `" << diagnostic.path.string()
            << "`: " << diagnostic.message << std::endl;
    }

    out << "Done: moved " << report.moved << " file(s)";
    if (report.renamed > 0) {
        out << " (" << report.renamed << " renamed)";
    }
    if (report.skipped > 0) {
        out << ", skipped " << report.skipped;
    }
    if (report.alreadyInPlace > 0) {
        out << ", " << report.alreadyInPlace << " already sorted";
    }
    out << " across " << report.directoriesVisited << " director" << (report.directoriesVisited == 1 ? "y" : "ies")
        << " into `" << destination.string() << "`." << std::endl;

    if (!report.succeeded()) {
        err << report.diagnostics.size() << " problem(s) reported; affected files were left in place." << std::endl;
    }

    return EXIT_SUCCESS;
}
