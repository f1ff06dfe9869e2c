#include "Sorter.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

const char* diagnosticKindName(Diagnostic::Kind kind) {
    switch (kind) {
    case Diagnostic::Kind::DirectoryReadFailure:
        return "directory read failure";
    case Diagnostic::Kind::BucketCreateFailure:
        return "bucket create failure";
    case Diagnostic::Kind::MoveFailure:
        return "move failure";
    }
    return "unknown";
}

Sorter::Sorter(std::filesystem::path destinationRoot, FileMover mover)
    : m_destinationRoot(std::move(destinationRoot)), m_mover(mover) {}

void Sorter::setMoveObserver(MoveObserver observer) {
    m_observer = std::move(observer);
}

SortReport Sorter::sort(const std::filesystem::path& sourceRoot) const {
    SortReport report;
    std::vector<std::filesystem::path> pending{sourceRoot};

    while (!pending.empty()) {
        const std::filesystem::path current = std::move(pending.back());
        pending.pop_back();
        ++report.directoriesVisited;

        std::error_code ec;
        std::filesystem::directory_iterator iter(current, ec);
        if (ec) {
            report.diagnostics.push_back({Diagnostic::Kind::DirectoryReadFailure, current, ec.message()});
            continue;
        }

        // Snapshot the listing first; files are moved out of this directory below.
        std::vector<std::filesystem::directory_entry> children;
        const std::filesystem::directory_iterator end{};
        while (iter != end) {
            children.push_back(*iter);
            iter.increment(ec);
            if (ec) {
                break;
            }
        }
        if (ec) {
            report.diagnostics.push_back({Diagnostic::Kind::DirectoryReadFailure, current, ec.message()});
            continue;
        }

        std::vector<std::filesystem::path> subdirectories;
        for (const auto& entry : children) {
            std::error_code typeErr;
            if (entry.is_directory(typeErr) && !typeErr) {
                if (isDestinationRoot(entry.path())) {
                    ++report.directoriesExcluded;
                    continue;
                }
                subdirectories.push_back(entry.path());
                continue;
            }

            typeErr.clear();
            if (entry.is_regular_file(typeErr) && !typeErr) {
                sortFile(entry.path(), report);
            }
        }

        // Reverse so the first listed subdirectory is walked next.
        pending.insert(pending.end(), subdirectories.rbegin(), subdirectories.rend());
    }

    return report;
}

bool Sorter::isDestinationRoot(const std::filesystem::path& directory) const {
    std::error_code ec;
    const auto candidate = std::filesystem::canonical(directory, ec);
    if (ec) {
        return false;
    }

    const auto destination = std::filesystem::canonical(m_destinationRoot, ec);
    if (ec) {
        return false;
    }

    return candidate == destination;
}

void Sorter::sortFile(const std::filesystem::path& file, SortReport& report) const {
    const auto targetDir = m_destinationRoot / bucketNameFor(file);

    std::error_code mkdirErr;
    std::filesystem::create_directories(targetDir, mkdirErr);
    if (!mkdirErr && !std::filesystem::is_directory(targetDir, mkdirErr) && !mkdirErr) {
        mkdirErr = std::make_error_code(std::errc::not_a_directory);
    }
    if (mkdirErr) {
        report.diagnostics.push_back({Diagnostic::Kind::BucketCreateFailure, file,
                                      "cannot create `" + targetDir.string() + "`: " + mkdirErr.message()});
        return;
    }

    const MoveResult result = m_mover.moveFile(file, targetDir);
    switch (result.status) {
    case MoveResult::Status::Moved:
    case MoveResult::Status::MovedCrossDevice:
        ++report.moved;
        break;
    case MoveResult::Status::Renamed:
        ++report.moved;
        ++report.renamed;
        break;
    case MoveResult::Status::Skipped:
        ++report.skipped;
        break;
    case MoveResult::Status::AlreadyInPlace:
        ++report.alreadyInPlace;
        break;
    case MoveResult::Status::Failed:
        report.diagnostics.push_back({Diagnostic::Kind::MoveFailure, file, result.message});
        break;
    }

    if (m_observer) {
        m_observer(file, result);
    }
}

std::string Sorter::bucketNameFor(const std::filesystem::path& file) {
    // "name." yields "." and dotfiles like ".bashrc" yield nothing.
    const std::string extension = file.filename().extension().string();
    if (extension.size() <= 1) {
        return kNoExtensionBucket;
    }

    std::string bucket = extension.substr(1);
    std::transform(bucket.begin(), bucket.end(), bucket.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return bucket;
}

bool Sorter::validateSource(const std::filesystem::path& source, std::filesystem::path& resolved, std::string& error) {
    std::error_code ec;
    const auto status = std::filesystem::status(source, ec);
    if (!std::filesystem::exists(status)) {
        error = "Source `" + source.string() + "` does not exist";
        if (ec && ec != std::errc::no_such_file_or_directory) {
            error += ": " + ec.message();
        }
        return false;
    }

    if (!std::filesystem::is_directory(status)) {
        error = "Source `" + source.string() + "` is not a directory";
        return false;
    }

    resolved = std::filesystem::canonical(source, ec);
    if (ec) {
        error = "Unable to resolve source `" + source.string() + "`: " + ec.message();
        return false;
    }

    return true;
}

bool Sorter::prepareDestination(const std::filesystem::path& destination, std::filesystem::path& resolved, std::string& error) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(destination, ec);
    if (ec) {
        error = "Unable to resolve destination `" + destination.string() + "`: " + ec.message();
        return false;
    }

    std::filesystem::create_directories(absolute, ec);
    if (ec) {
        error = "Failed to create destination directory `" + absolute.string() + "`: " + ec.message();
        return false;
    }

    if (!std::filesystem::is_directory(absolute, ec) || ec) {
        error = "Destination `" + absolute.string() + "` is not a directory";
        return false;
    }

    resolved = std::filesystem::canonical(absolute, ec);
    if (ec) {
        error = "Unable to resolve destination `" + absolute.string() + "`: " + ec.message();
        return false;
    }

    return true;
}
