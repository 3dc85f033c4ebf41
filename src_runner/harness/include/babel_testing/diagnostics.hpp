#pragma once

#include <string>
#include <utility>
#include <vector>

namespace babel::testing {

/**
 * \brief Record of one place searched while resolving a target or constructing an instance.
 */
struct SearchAttempt {
    std::string location;
    bool found{false};
    std::string reason;  ///< why the search failed; empty when found
};

/**
 * \brief Accumulated search history and remediation hints for one resolution attempt.
 *
 * Rendered as:
 * \code{.txt}
 * Cannot construct UserService
 *
 * Searched:
 *   x babel/factories/example/services::user_service() (nested structure) (factory module not registered)
 *   x UserService() (zero-arg constructor) (no zero-argument constructor registered)
 *
 * Suggestions:
 *   1. Register a factory ...
 * \endcode
 */
class DiagnosticTrail {
public:
    DiagnosticTrail() = default;
    explicit DiagnosticTrail(std::string target) : target_{std::move(target)} {}

    void add_search(std::string location, bool found, std::string reason = {});
    void add_suggestion(std::string suggestion);

    /// Appends another trail's searches and suggestions (nested construction inside a resolution).
    void merge(const DiagnosticTrail& other);

    [[nodiscard]] const std::string& target() const noexcept { return target_; }
    [[nodiscard]] const std::vector<SearchAttempt>& searches() const noexcept { return searches_; }
    [[nodiscard]] const std::vector<std::string>& suggestions() const noexcept { return suggestions_; }

    [[nodiscard]] std::string format(const std::string& summary) const;

private:
    std::string target_;
    std::vector<SearchAttempt> searches_;
    std::vector<std::string> suggestions_;
};

/// `UserService` -> `user_service`
[[nodiscard]] std::string to_snake_case(const std::string& name);

/// Suggestion text with a registration sketch for a missing factory.
[[nodiscard]] std::string suggest_factory_creation(const std::string& type_name,
                                                   const std::string& module_path,
                                                   const std::string& factories_root);

}  // namespace babel::testing
