#pragma once

#include <stdexcept>
#include <string>

namespace ag {

// ============================================================================
// Error hierarchy
// ============================================================================

class AssetGraphError : public std::runtime_error {
public:
    explicit AssetGraphError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Invalid field values when an Asset or RegulatoryEvent is created
 */
class ConstructionError : public AssetGraphError {
public:
    explicit ConstructionError(const std::string& msg)
        : AssetGraphError("Construction error: " + msg) {}
};

/**
 * @brief Malformed relationship or visualization data entering the core
 *
 * Raised only where external or cached data re-enters (index building,
 * overlays, scene composition, snapshot hydration).
 */
class StructuralValidationError : public AssetGraphError {
public:
    explicit StructuralValidationError(const std::string& msg)
        : AssetGraphError("Structural validation error: " + msg) {}
};

class ConfigError : public AssetGraphError {
public:
    explicit ConfigError(const std::string& msg)
        : AssetGraphError("Config error: " + msg) {}
};

/**
 * @brief Bad command line: unknown option, missing value, unparsable number
 */
class UsageError : public AssetGraphError {
public:
    explicit UsageError(const std::string& msg) : AssetGraphError(msg) {}
};

} // namespace ag
