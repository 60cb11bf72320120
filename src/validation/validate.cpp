#include "validation/validate.hpp"

#include <thread>
#include <atomic>
#include <algorithm>
#include <vector>
#include <exception>
#include <stdexcept>
#include "internal.hpp"
#include "util/log.hpp"
#include "util/timer.hpp"

using namespace hpl;

static constexpr std::size_t FALLBACK_THREAD_COUNT = 4;


//
// Slots
//

const PatternRule& hpl::GetRule(const Pattern& pattern, const ValidationConfig& config) {
    const auto& catalog = config.GetPatternCatalog();
    if (catalog.Contains(pattern.kind)) return catalog.Get(pattern.kind);
    return PatternCatalog::Builtin().Get(pattern.kind);
}

std::deque<EventSlot> hpl::GetSlots(const Property& property, const ValidationConfig& config) {
    std::deque<EventSlot> result;
    auto add = [&result](const std::string& name, const std::unique_ptr<Event>& event) {
        if (event) result.push_back({ name, event.get() });
    };
    if (property.scope) add("activator", property.scope->activator);
    if (property.pattern) {
        if (GetRule(*property.pattern, config).triggerBindsFirst) {
            add("trigger", property.pattern->trigger);
            add("behaviour", property.pattern->behaviour);
        } else {
            add("behaviour", property.pattern->behaviour);
            add("trigger", property.pattern->trigger);
        }
    }
    if (property.scope) add("terminator", property.scope->terminator);
    return result;
}


//
// Properties
//

ValidationReport hpl::Validate(const Property& property, const ValidationConfig& config) {
    MEASURE("hpl::Validate")
    DEBUG("Validating property " << property.Uid().value_or(std::to_string(property.Id())) << std::endl)
    config.GetFunctionRegistry().Freeze();

    auto aliases = ComputeAliasTable(property);
    auto fields = ResolveFields(property, config, aliases);

    ValidationReport report;
    for (auto& diagnostic : CheckStructure(property, config, fields)) report.Add(std::move(diagnostic));
    for (auto& diagnostic : CheckBindings(property, config, fields)) report.Add(std::move(diagnostic));
    for (auto& diagnostic : CheckPatternSanity(property, config)) report.Add(std::move(diagnostic));

    DEBUG("Validation found " << report.errors.size() << " error(s) and " << report.warnings.size() << " warning(s)" << std::endl)
    return report;
}

ValidationReport hpl::Validate(const Property& property) {
    DefaultValidationConfig config;
    return Validate(property, config);
}


//
// Specifications
//

inline const Property& GetProperty(const Specification& specification, std::size_t index) {
    const auto& property = specification.properties.at(index);
    if (!property) throw std::logic_error("Internal error: specification contains an empty property.");
    return *property;
}

std::deque<ValidationReport> hpl::Validate(const Specification& specification, const ValidationConfig& config) {
    std::deque<ValidationReport> result;
    for (std::size_t index = 0; index < specification.properties.size(); ++index) {
        result.push_back(Validate(GetProperty(specification, index), config));
    }
    return result;
}

std::deque<ValidationReport> hpl::Validate(const Specification& specification) {
    DefaultValidationConfig config;
    return Validate(specification, config);
}

std::deque<ValidationReport> hpl::ValidateParallel(const Specification& specification, const ValidationConfig& config,
                                                   std::size_t threads) {
    MEASURE("hpl::ValidateParallel")
    config.GetFunctionRegistry().Freeze();
    auto count = specification.properties.size();
    if (threads == 0) threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = FALLBACK_THREAD_COUNT;
    threads = std::min(threads, count);

    std::vector<ValidationReport> reports(count);
    std::vector<std::exception_ptr> failures(threads);
    std::atomic<std::size_t> next{0};
    auto worker = [&](std::size_t id) {
        try {
            for (auto index = next++; index < count; index = next++) {
                reports.at(index) = Validate(GetProperty(specification, index), config);
            }
        } catch (...) {
            failures.at(id) = std::current_exception();
        }
    };

    DEBUG("Validating " << count << " properties with " << threads << " threads" << std::endl)
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (std::size_t id = 0; id < threads; ++id) pool.emplace_back(worker, id);
    for (auto& thread : pool) thread.join();
    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    return std::deque<ValidationReport>(std::make_move_iterator(reports.begin()), std::make_move_iterator(reports.end()));
}
