/**
 * @file scenario_injector.hpp
 * @brief Rewrites user source with synthetic fault fragments
 *
 * Code-level faults (delays, crashes, CPU burn, memory growth) are produced
 * by wrapping the submitted snippet with small language-specific fragments.
 * A FragmentPlan lists which fragments apply and where they go; a
 * LanguageRenderer supplies the source text of each fragment.
 *
 * **Layout of injected source**:
 * ```
 * ┌──────────────────────────────┐
 * │ pre fragments (plan order)   │
 * ├──────────────────────────────┤
 * │ user code (unchanged)        │
 * ├──────────────────────────────┤
 * │ post fragments (plan order)  │
 * └──────────────────────────────┘
 * ```
 *
 * The scenario is operator input; injection is not a security boundary.
 *
 * @date 2025
 */

#pragma once

#include "chaosbox/core/job.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chaosbox {
namespace scenario {

/**
 * @enum FragmentKind
 * @brief Named fault fragments, in rendering order
 */
enum class FragmentKind {
    ARTIFICIAL_DELAY,       ///< Sleep before user code
    SIMULATE_CRASH,         ///< Exit with status 1 after user code
    SIMULATE_HIGH_CPU,      ///< Concurrent busy loop
    SIMULATE_MEMORY_LEAK,   ///< Grow a list by 10^7 elements
    DEPENDENCY_BOOTSTRAP    ///< Install a third-party library the code imports
};

enum class Placement {
    PRE,   ///< Before user code
    POST   ///< After user code
};

std::string ToString(FragmentKind kind);

/**
 * @struct Fragment
 * @brief One planned fragment
 */
struct Fragment {
    FragmentKind kind;
    Placement placement;
    std::optional<std::int64_t> delay_ms;   ///< ARTIFICIAL_DELAY only
};

/**
 * @class LanguageRenderer
 * @brief Source text for each fragment in one language
 */
class LanguageRenderer {
public:
    virtual ~LanguageRenderer() = default;

    virtual core::Language GetLanguage() const = 0;

    virtual std::string ArtificialDelay(std::int64_t delay_ms) const = 0;
    virtual std::string Crash() const = 0;
    virtual std::string HighCpu() const = 0;
    virtual std::string MemoryLeak() const = 0;

    /**
     * @brief Install step for libraries the code imports
     * @return Fragment text, or nullopt if the code needs nothing
     */
    virtual std::optional<std::string> DependencyBootstrap(const std::string& code) const = 0;

    /**
     * @brief Render a planned fragment
     * @param fragment Planned fragment
     * @param code User source (inspected by DEPENDENCY_BOOTSTRAP)
     */
    std::string Render(const Fragment& fragment, const std::string& code) const;
};

/// python3 renderer (daemon thread CPU load, pip bootstrap for requests)
class PythonRenderer : public LanguageRenderer {
public:
    core::Language GetLanguage() const override { return core::Language::PYTHON; }

    std::string ArtificialDelay(std::int64_t delay_ms) const override;
    std::string Crash() const override;
    std::string HighCpu() const override;
    std::string MemoryLeak() const override;
    std::optional<std::string> DependencyBootstrap(const std::string& code) const override;
};

/// Node.js renderer (CommonJS, worker_threads CPU load)
class JavaScriptRenderer : public LanguageRenderer {
public:
    core::Language GetLanguage() const override { return core::Language::JAVASCRIPT; }

    std::string ArtificialDelay(std::int64_t delay_ms) const override;
    std::string Crash() const override;
    std::string HighCpu() const override;
    std::string MemoryLeak() const override;
    std::optional<std::string> DependencyBootstrap(const std::string& code) const override;
};

/**
 * @class FragmentPlan
 * @brief Ordered fragments for one scenario
 */
class FragmentPlan {
public:
    /**
     * @brief Plan the code-level fragments of a scenario
     *
     * Network fields are ignored; they are served by the proxy.
     */
    static FragmentPlan FromScenario(const core::Scenario& scenario);

    void Add(const Fragment& fragment) { fragments_.push_back(fragment); }

    const std::vector<Fragment>& Fragments() const { return fragments_; }
    bool Empty() const { return fragments_.empty(); }

private:
    std::vector<Fragment> fragments_;
};

/**
 * @class ScenarioInjector
 * @brief Wraps user code with the fragments a scenario asks for
 *
 * **Usage Example**:
 * @code
 * ScenarioInjector injector;
 *
 * core::Scenario scenario;
 * scenario.artificial_delay_ms = 500;
 * scenario.simulate_crash = true;
 *
 * std::string wrapped = injector.Inject("print('hi')", scenario,
 *                                       core::Language::PYTHON);
 * @endcode
 *
 * Returns the code unchanged when no fragment applies.
 */
class ScenarioInjector {
public:
    ScenarioInjector();

    /**
     * @brief Inject fragments into user code
     * @param code User source
     * @param scenario Requested faults
     * @param language Target language
     * @return Wrapped source
     */
    std::string Inject(const std::string& code, const core::Scenario& scenario,
                       core::Language language) const;

    /**
     * @brief Full plan for a snippet, including dependency bootstrap
     */
    FragmentPlan Plan(const std::string& code, const core::Scenario& scenario,
                      core::Language language) const;

    const LanguageRenderer& RendererFor(core::Language language) const;

private:
    std::map<core::Language, std::unique_ptr<LanguageRenderer>> renderers_;
};

} // namespace scenario
} // namespace chaosbox
