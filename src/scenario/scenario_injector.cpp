/**
 * @file scenario_injector.cpp
 * @brief Fragment planning and per-language rendering
 *
 * Injected identifiers carry a `_cb_` / `__chaosbox_` prefix so they do not
 * collide with names in the user's snippet.
 *
 * @date 2025
 */

#include "chaosbox/scenario/scenario_injector.hpp"
#include "chaosbox/core/errors.hpp"
#include "chaosbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace chaosbox {
namespace scenario {

using utils::StringUtils;

std::string ToString(FragmentKind kind) {
    switch (kind) {
        case FragmentKind::ARTIFICIAL_DELAY: return "artificial_delay";
        case FragmentKind::SIMULATE_CRASH: return "simulate_crash";
        case FragmentKind::SIMULATE_HIGH_CPU: return "simulate_high_cpu";
        case FragmentKind::SIMULATE_MEMORY_LEAK: return "simulate_memory_leak";
        case FragmentKind::DEPENDENCY_BOOTSTRAP: return "dependency_bootstrap";
        default: return "unknown";
    }
}

// ============================================================================
// RENDERER DISPATCH
// ============================================================================

std::string LanguageRenderer::Render(const Fragment& fragment, const std::string& code) const {
    switch (fragment.kind) {
        case FragmentKind::ARTIFICIAL_DELAY:
            return ArtificialDelay(fragment.delay_ms.value_or(0));
        case FragmentKind::SIMULATE_CRASH:
            return Crash();
        case FragmentKind::SIMULATE_HIGH_CPU:
            return HighCpu();
        case FragmentKind::SIMULATE_MEMORY_LEAK:
            return MemoryLeak();
        case FragmentKind::DEPENDENCY_BOOTSTRAP:
            return DependencyBootstrap(code).value_or("");
        default:
            return "";
    }
}

// ============================================================================
// PYTHON
// ============================================================================

std::string PythonRenderer::ArtificialDelay(std::int64_t delay_ms) const {
    std::ostringstream oss;
    oss << "import time\n"
        << "print(\"Simulating artificial delay...\")\n"
        << "time.sleep(" << delay_ms << " / 1000)\n";
    return oss.str();
}

std::string PythonRenderer::Crash() const {
    return "\nimport sys\nsys.exit(1)\n";
}

std::string PythonRenderer::HighCpu() const {
    return "import threading as _cb_threading\n"
           "def _cb_cpu_load():\n"
           "    while True:\n"
           "        pass\n"
           "_cb_threading.Thread(target=_cb_cpu_load, daemon=True).start()\n"
           "print(\"Simulating high CPU load...\")\n";
}

std::string PythonRenderer::MemoryLeak() const {
    return "print(\"Simulating memory leak...\")\n"
           "_cb_leak = []\n"
           "for _ in range(10**7):\n"
           "    _cb_leak.append('leak')\n";
}

std::optional<std::string> PythonRenderer::DependencyBootstrap(const std::string& code) const {
    for (const auto& line : StringUtils::SplitLines(code)) {
        std::string stripped = StringUtils::TrimLeft(line);
        if (StringUtils::StartsWith(stripped, "import requests") ||
            StringUtils::StartsWith(stripped, "from requests")) {
            return std::string("import os\n"
                               "os.system('pip install --quiet requests')\n");
        }
    }
    return std::nullopt;
}

// ============================================================================
// JAVASCRIPT
// ============================================================================

std::string JavaScriptRenderer::ArtificialDelay(std::int64_t delay_ms) const {
    // Synchronous sleep; CommonJS scripts have no top-level await
    std::ostringstream oss;
    oss << "console.log(\"Simulating artificial delay...\");\n"
        << "Atomics.wait(new Int32Array(new SharedArrayBuffer(4)), 0, 0, "
        << delay_ms << ");\n";
    return oss.str();
}

std::string JavaScriptRenderer::Crash() const {
    return "\nprocess.exit(1);\n";
}

std::string JavaScriptRenderer::HighCpu() const {
    return "console.log(\"Simulating high CPU load...\");\n"
           "new (require('worker_threads').Worker)('while (true) {}', { eval: true }).unref();\n";
}

std::string JavaScriptRenderer::MemoryLeak() const {
    return "console.log(\"Simulating memory leak...\");\n"
           "const __chaosbox_leak = [];\n"
           "for (let i = 0; i < 1e7; i++) { __chaosbox_leak.push('leak'); }\n";
}

std::optional<std::string> JavaScriptRenderer::DependencyBootstrap(const std::string&) const {
    return std::nullopt;
}

// ============================================================================
// FRAGMENT PLAN
// ============================================================================

FragmentPlan FragmentPlan::FromScenario(const core::Scenario& scenario) {
    FragmentPlan plan;

    if (scenario.artificial_delay_ms && *scenario.artificial_delay_ms > 0) {
        plan.Add({FragmentKind::ARTIFICIAL_DELAY, Placement::PRE, scenario.artificial_delay_ms});
    }
    if (scenario.simulate_crash) {
        plan.Add({FragmentKind::SIMULATE_CRASH, Placement::POST, std::nullopt});
    }
    if (scenario.simulate_high_cpu) {
        plan.Add({FragmentKind::SIMULATE_HIGH_CPU, Placement::PRE, std::nullopt});
    }
    if (scenario.simulate_memory_leak) {
        plan.Add({FragmentKind::SIMULATE_MEMORY_LEAK, Placement::PRE, std::nullopt});
    }

    return plan;
}

// ============================================================================
// INJECTOR
// ============================================================================

ScenarioInjector::ScenarioInjector() {
    renderers_[core::Language::PYTHON] = std::make_unique<PythonRenderer>();
    renderers_[core::Language::JAVASCRIPT] = std::make_unique<JavaScriptRenderer>();
}

const LanguageRenderer& ScenarioInjector::RendererFor(core::Language language) const {
    auto it = renderers_.find(language);
    if (it == renderers_.end()) {
        throw core::UnsupportedLanguageError(core::ToString(language));
    }
    return *it->second;
}

FragmentPlan ScenarioInjector::Plan(const std::string& code, const core::Scenario& scenario,
                                    core::Language language) const {
    FragmentPlan plan = FragmentPlan::FromScenario(scenario);

    if (RendererFor(language).DependencyBootstrap(code)) {
        plan.Add({FragmentKind::DEPENDENCY_BOOTSTRAP, Placement::PRE, std::nullopt});
    }

    return plan;
}

std::string ScenarioInjector::Inject(const std::string& code, const core::Scenario& scenario,
                                     core::Language language) const {
    const LanguageRenderer& renderer = RendererFor(language);
    FragmentPlan plan = Plan(code, scenario, language);

    if (plan.Empty()) {
        return code;
    }

    std::string pre;
    std::string post;

    for (const auto& fragment : plan.Fragments()) {
        std::string text = renderer.Render(fragment, code);

        if (fragment.placement == Placement::PRE) {
            pre += text;
        } else {
            post += text;
        }
        spdlog::debug("Injected fragment: {} ({})", ToString(fragment.kind),
                      core::ToString(language));
    }

    return pre + code + post;
}

} // namespace scenario
} // namespace chaosbox
