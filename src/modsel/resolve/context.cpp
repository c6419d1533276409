#include "./context.hpp"

#include <modsel/util/log.hpp>

#include <neo/assert.hpp>

using namespace modsel;

void resolution_context::defer_all(std::vector<diagnostic> ds) {
    for (auto& d : ds) {
        defer(std::move(d));
    }
}

void resolution_context::report(diagnostic d, strictness s) {
    switch (s) {
    case strictness::off:
        modsel_log(info, "{}", d.message);
        notices.push_back(std::move(d));
        return;
    case strictness::warning:
        if (d.remediation.empty()) {
            modsel_log(warn, "{}", d.message);
        } else {
            modsel_log(warn, "{}\n{}", d.message, d.remediation);
        }
        notices.push_back(std::move(d));
        return;
    case strictness::error:
        defer(std::move(d));
        return;
    }
    neo::unreachable();
}
