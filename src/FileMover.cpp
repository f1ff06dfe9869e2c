#include "FileMover.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>

namespace {
MoveResult failure(std::filesystem::path target, std::error_code ec, std::string message) {
    MoveResult result;
    result.status = MoveResult::Status::Failed;
    result.target = std::move(target);
    result.error = ec;
    result.message = std::move(message);
    return result;
}

// True when sourcePath already is the directory entry destinationFolder/filename.
bool isSameEntry(const std::filesystem::path& sourcePath, const std::filesystem::path& destinationFolder) {
    std::error_code ec;
    const auto sourceParent = std::filesystem::canonical(sourcePath.parent_path().empty() ? std::filesystem::path(".") : sourcePath.parent_path(), ec);
    if (ec) {
        return false;
    }

    const auto folder = std::filesystem::canonical(destinationFolder, ec);
    if (ec) {
        return false;
    }

    return sourceParent == folder;
}
} // namespace

bool parseCollisionPolicy(const std::string& text, CollisionPolicy& policy) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (lowered == "overwrite") {
        policy = CollisionPolicy::Overwrite;
    } else if (lowered == "rename") {
        policy = CollisionPolicy::Rename;
    } else if (lowered == "skip") {
        policy = CollisionPolicy::Skip;
    } else {
        return false;
    }
    return true;
}

const char* collisionPolicyName(CollisionPolicy policy) {
    switch (policy) {
    case CollisionPolicy::Overwrite:
        return "overwrite";
    case CollisionPolicy::Rename:
        return "rename";
    case CollisionPolicy::Skip:
        return "skip";
    }
    return "unknown";
}

FileMover::FileMover(CollisionPolicy policy, std::size_t maxCollisionAttempts)
    : m_policy(policy), m_maxCollisionAttempts(maxCollisionAttempts) {}

MoveResult FileMover::moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& destinationFolder) const {
    auto targetPath = destinationFolder / sourcePath.filename();
    bool renamedForCollision = false;

    // Sorting a folder in place revisits files that already sit in their bucket.
    if (isSameEntry(sourcePath, destinationFolder)) {
        MoveResult result;
        result.status = MoveResult::Status::AlreadyInPlace;
        result.target = targetPath;
        return result;
    }

    if (m_policy != CollisionPolicy::Overwrite) {
        std::error_code existsErr;
        const bool targetExists = std::filesystem::exists(std::filesystem::symlink_status(targetPath, existsErr));
        if (existsErr && existsErr != std::errc::no_such_file_or_directory) {
            return failure(targetPath, existsErr, "Failed to check for existing file `" + targetPath.string() + "`");
        }

        if (targetExists && m_policy == CollisionPolicy::Skip) {
            MoveResult result;
            result.status = MoveResult::Status::Skipped;
            result.target = targetPath;
            result.message = "target already exists";
            return result;
        }

        if (targetExists) {
            std::error_code freeErr;
            auto uniquePath = findFreeName(targetPath, freeErr);
            if (freeErr) {
                return failure(targetPath, freeErr, "Failed to check for existing file near `" + targetPath.string() + "`");
            }
            if (uniquePath.empty()) {
                return failure(targetPath, std::make_error_code(std::errc::file_exists),
                               "No free name after " + std::to_string(m_maxCollisionAttempts) + " attempt(s)");
            }
            targetPath = std::move(uniquePath);
            renamedForCollision = true;
        }
    }

    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        MoveResult result;
        result.status = renamedForCollision ? MoveResult::Status::Renamed : MoveResult::Status::Moved;
        result.target = targetPath;
        return result;
    }

    if (renameErr == std::errc::cross_device_link) {
        MoveResult result = copyAcrossDevices(sourcePath, targetPath);
        if (result.ok() && renamedForCollision) {
            result.status = MoveResult::Status::Renamed;
        }
        return result;
    }

    return failure(targetPath, renameErr, renameErr.message());
}

std::filesystem::path FileMover::findFreeName(const std::filesystem::path& targetPath, std::error_code& ec) const {
    const auto folder = targetPath.parent_path();
    const auto stem = targetPath.stem().string();
    const auto extension = targetPath.extension().string();

    for (std::size_t attempt = 1; attempt <= m_maxCollisionAttempts; ++attempt) {
        auto candidate = folder / (stem + "_" + std::to_string(attempt) + extension);
        ec.clear();
        const auto status = std::filesystem::symlink_status(candidate, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return {};
        }
        ec.clear();
        if (!std::filesystem::exists(status)) {
            return candidate;
        }
    }

    return {};
}

MoveResult FileMover::copyAcrossDevices(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) const {
    const auto options = m_policy == CollisionPolicy::Overwrite
        ? std::filesystem::copy_options::overwrite_existing
        : std::filesystem::copy_options::none;

    std::error_code copyErr;
    std::filesystem::copy_file(sourcePath, targetPath, options, copyErr);
    if (copyErr) {
        return failure(targetPath, copyErr, "Failed to copy to `" + targetPath.string() + "`: " + copyErr.message());
    }

    std::error_code removeErr;
    std::filesystem::remove(sourcePath, removeErr);
    if (removeErr) {
        return failure(targetPath, removeErr, "Copied to `" + targetPath.string() +
                                                  "` but failed to remove original: " + removeErr.message());
    }

    MoveResult result;
    result.status = MoveResult::Status::MovedCrossDevice;
    result.target = targetPath;
    return result;
}
