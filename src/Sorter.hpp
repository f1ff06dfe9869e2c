#ifndef SORTER_HPP
#define SORTER_HPP

#include "FileMover.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

// A non-fatal problem met during the walk; the offending path is left as it was.
struct Diagnostic {
    enum class Kind {
        DirectoryReadFailure,
        BucketCreateFailure,
        MoveFailure
    };

    Kind kind;
    std::filesystem::path path;
    std::string message;
};

const char* diagnosticKindName(Diagnostic::Kind kind);

struct SortReport {
    // Includes files that were renamed to avoid a collision.
    std::size_t moved = 0;
    std::size_t renamed = 0;
    std::size_t skipped = 0;
    std::size_t alreadyInPlace = 0;
    std::size_t directoriesVisited = 0;
    std::size_t directoriesExcluded = 0;
    std::vector<Diagnostic> diagnostics;

    bool succeeded() const { return diagnostics.empty(); }
};

// Walks a source tree and moves every regular file into destinationRoot/<extension>.
class Sorter {
public:
    using MoveObserver = std::function<void(const std::filesystem::path&, const MoveResult&)>;

    static constexpr const char* kNoExtensionBucket = "no_extension";

    Sorter(std::filesystem::path destinationRoot, FileMover mover);

    // Walk sourceRoot depth-first and sort every file found; never throws for filesystem errors.
    SortReport sort(const std::filesystem::path& sourceRoot) const;

    // Called after every attempted move, including failures and skips.
    void setMoveObserver(MoveObserver observer);

    // Lowercased extension without the dot, or "no_extension".
    static std::string bucketNameFor(const std::filesystem::path& file);

    // Source must exist and be a directory; on success resolved holds its canonical path.
    static bool validateSource(const std::filesystem::path& source, std::filesystem::path& resolved, std::string& error);
    // Create the destination (relative paths resolve against the working directory).
    static bool prepareDestination(const std::filesystem::path& destination, std::filesystem::path& resolved, std::string& error);

private:
    // True when directory resolves to the same canonical path as the destination root.
    bool isDestinationRoot(const std::filesystem::path& directory) const;
    void sortFile(const std::filesystem::path& file, SortReport& report) const;

    std::filesystem::path m_destinationRoot;
    FileMover m_mover;
    MoveObserver m_observer;
};

#endif
