#pragma once

#include "ir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace babel::testing {

/**
 * \brief Loads persisted IR documents produced by the test-definition compiler.
 *
 * The document is JSON:
 * \code{.json}
 * {
 *   "version": "0.1",
 *   "suites": [
 *     {"name": "users", "target": "example.services.UserService",
 *      "tests": [{"target": ".get_user", "given": {"user_id": 1},
 *                 "expect": {"type": "contains", "value": {"name": "Alice"}}}]}
 *   ],
 *   "tests": [{"target": "example.math.add", "given": {"a": 2, "b": 3},
 *              "expect": {"type": "exact", "value": 5}}]
 * }
 * \endcode
 *
 * No DSL-level validation happens here; the loader only rejects documents that cannot be
 * mapped onto the IR model (missing targets, unknown expectation kinds, non-positive timeouts).
 */
class IrLoader {
public:
    IrLoader() = default;

    [[nodiscard]] IrDocument load(const std::filesystem::path& file) const;

    /// A file yields one document; a directory yields every `*.json` file below it, in path order.
    [[nodiscard]] std::vector<IrDocument> load_directory(const std::filesystem::path& root) const;

    /// \a origin is used in error messages only.
    [[nodiscard]] IrDocument parse(const json& document, const std::string& origin = "<memory>") const;
};

}  // namespace babel::testing
