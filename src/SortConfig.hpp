#ifndef SORT_CONFIG_HPP
#define SORT_CONFIG_HPP

#include "FileMover.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

// Parses the optional JSON settings file that tunes how files are moved.
class SortConfig {
public:
    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::string& filePath);
    // Same validation as load, for an already parsed document.
    bool loadFromJson(const nlohmann::json& data);

    CollisionPolicy getCollisionPolicy() const;
    std::size_t getMaxCollisionAttempts() const;
    // Print every move, not just failures and the summary.
    bool isVerbose() const;

    // Build a mover that applies the loaded collision settings.
    FileMover makeMover() const;

private:
    CollisionPolicy m_collisionPolicy = CollisionPolicy::Overwrite;
    std::size_t m_maxCollisionAttempts = kDefaultMaxCollisionAttempts;
    bool m_verbose = false;
};

#endif
