#pragma once

#include <lexpath/core/Error.hpp>

#include <span>
#include <string>

namespace LP {

struct PathJsonOptions {
    enum class Style { Windows, Posix };

    Style style      = Style::Windows;
    // Passed to nlohmann::json::dump; -1 is compact.
    int   dumpIndent = 2;
};

/**
 * Describe each path as JSON: how it classifies, how it splits, what it
 * cleans to and how it walks. Fails only when the result cannot be
 * serialized (input that is not UTF-8).
 */
class PathJsonExporter {
public:
    static auto Export(std::span<std::string const> paths, PathJsonOptions const& options = PathJsonOptions{})
        -> Expected<std::string>;
};

} // namespace LP
