#include "SortConfig.hpp"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

CollisionPolicy SortConfig::getCollisionPolicy() const {
    return m_collisionPolicy;
}

std::size_t SortConfig::getMaxCollisionAttempts() const {
    return m_maxCollisionAttempts;
}

bool SortConfig::isVerbose() const {
    return m_verbose;
}

FileMover SortConfig::makeMover() const {
    return FileMover(m_collisionPolicy, m_maxCollisionAttempts);
}

bool SortConfig::load(const std::string& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: `" << filePath << "`" << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!loadFromJson(data)) {
        return false;
    }

    std::cout << "Loaded configuration from `" << filePath << "` (collision policy: "
              << collisionPolicyName(m_collisionPolicy) << ")" << std::endl;
    return true;
}

bool SortConfig::loadFromJson(const json& data) {
    if (!data.is_object()) {
        std::cerr << "Invalid configuration: top level must be an object." << std::endl;
        return false;
    }

    // Apply nothing until every field has validated.
    CollisionPolicy policy = m_collisionPolicy;
    std::size_t maxAttempts = m_maxCollisionAttempts;
    bool verbose = m_verbose;

    if (auto it = data.find("collision_policy"); it != data.end()) {
        if (!it->is_string()) {
            std::cerr << "`collision_policy` must be a string." << std::endl;
            return false;
        }
        const std::string name = it->get<std::string>();
        if (!parseCollisionPolicy(name, policy)) {
            std::cerr << "Unknown `collision_policy` `" << name << "`; expected overwrite, rename or skip." << std::endl;
            return false;
        }
    }

    if (auto it = data.find("max_collision_attempts"); it != data.end()) {
        if (!it->is_number_integer() || it->get<long long>() <= 0) {
            std::cerr << "`max_collision_attempts` must be a positive integer." << std::endl;
            return false;
        }
        maxAttempts = static_cast<std::size_t>(it->get<long long>());
    }

    if (auto it = data.find("verbose"); it != data.end()) {
        if (!it->is_boolean()) {
            std::cerr << "`verbose` must be a boolean value." << std::endl;
            return false;
        }
        verbose = it->get<bool>();
    }

    m_collisionPolicy = policy;
    m_maxCollisionAttempts = maxAttempts;
    m_verbose = verbose;
    return true;
}
