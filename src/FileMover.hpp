#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

// What to do when the target file name is already taken inside the bucket.
enum class CollisionPolicy {
    Overwrite,
    Rename,
    Skip
};

constexpr std::size_t kDefaultMaxCollisionAttempts = 50;

// Parse "overwrite", "rename" or "skip" (case-insensitive); returns false for anything else.
bool parseCollisionPolicy(const std::string& text, CollisionPolicy& policy);
const char* collisionPolicyName(CollisionPolicy policy);

// Outcome of a single move, reported back to the caller instead of printed.
struct MoveResult {
    enum class Status {
        Moved,
        MovedCrossDevice,
        Renamed,
        Skipped,
        AlreadyInPlace,
        Failed
    };

    Status status = Status::Failed;
    std::filesystem::path target;
    std::error_code error;
    std::string message;

    bool ok() const { return status != Status::Failed; }
};

// Moves single files into a destination folder, handling collisions and cross-device copies.
class FileMover {
public:
    explicit FileMover(CollisionPolicy policy = CollisionPolicy::Overwrite,
                       std::size_t maxCollisionAttempts = kDefaultMaxCollisionAttempts);

    // Move sourcePath to destinationFolder/filename according to the collision policy.
    MoveResult moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& destinationFolder) const;

    // Copy + delete fallback used when a rename crosses a filesystem boundary.
    MoveResult copyAcrossDevices(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) const;

    CollisionPolicy policy() const { return m_policy; }
    std::size_t maxCollisionAttempts() const { return m_maxCollisionAttempts; }

private:
    // Pick stem_N.ext inside destinationFolder that does not exist yet; empty when none is free.
    std::filesystem::path findFreeName(const std::filesystem::path& targetPath, std::error_code& ec) const;

    CollisionPolicy m_policy;
    std::size_t m_maxCollisionAttempts;
};

#endif
