//
// Created by gregorian-rayne on 1/15/26.
//

#include "lpa/analyzers/analyzer.hpp"

#include <algorithm>

namespace lpa::analyzers
{
    AnalyzerRegistry& AnalyzerRegistry::instance() {
        static AnalyzerRegistry registry;
        return registry;
    }

    void AnalyzerRegistry::register_analyzer(AnalyzerFactory factory) {
        auto prototype = factory();
        const auto existing = std::ranges::find_if(analyzers_, [&](const Entry& entry) {
            return entry.prototype->id() == prototype->id();
        });

        if (existing != analyzers_.end()) {
            existing->factory = std::move(factory);
            existing->prototype = std::move(prototype);
            return;
        }
        analyzers_.push_back(Entry{std::move(factory), std::move(prototype)});
    }

    const IAnalyzer* AnalyzerRegistry::get_analyzer(const std::string_view id) const {
        for (const auto& entry : analyzers_) {
            if (entry.prototype->id() == id) {
                return entry.prototype.get();
            }
        }
        return nullptr;
    }

    std::vector<const IAnalyzer*> AnalyzerRegistry::list_analyzers() const {
        std::vector<const IAnalyzer*> result;
        result.reserve(analyzers_.size());

        for (const auto& entry : analyzers_) {
            result.push_back(entry.prototype.get());
        }

        return result;
    }

    std::unique_ptr<IAnalyzer> AnalyzerRegistry::create(const std::string_view id) const {
        for (const auto& entry : analyzers_) {
            if (entry.prototype->id() == id) {
                return entry.factory();
            }
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<IAnalyzer>> AnalyzerRegistry::create_all() const {
        std::vector<std::unique_ptr<IAnalyzer>> result;
        result.reserve(analyzers_.size());

        for (const auto& entry : analyzers_) {
            result.push_back(entry.factory());
        }

        return result;
    }

}  // namespace lpa::analyzers
