// ---------------------------------------------------------------------------
// responses.cpp
// ---------------------------------------------------------------------------

#include "common/responses.hpp"

#include <algorithm>
#include <tuple>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

void Response::sort() {
    std::stable_sort(results.begin(), results.end(), [](const Result& a, const Result& b) {
        const auto key_a = std::make_tuple(unstructured::get_kind(a.constraint),
                                           unstructured::get_name(a.constraint),
                                           a.msg, a.target);
        const auto key_b = std::make_tuple(unstructured::get_kind(b.constraint),
                                           unstructured::get_name(b.constraint),
                                           b.msg, b.target);
        return key_a < key_b;
    });
}

std::vector<Result> Responses::results() const {
    std::vector<Result> all;
    for (const auto& [target, response] : by_target) {
        all.insert(all.end(), response.results.begin(), response.results.end());
    }
    return all;
}

std::string Responses::trace_dump() const {
    std::string out;
    for (const auto& [target, response] : by_target) {
        out += fmt::format("Target: {}\n", target);
        if (response.trace.has_value()) {
            out += fmt::format("Trace:\n{}\n", *response.trace);
        } else {
            out += "Trace: TRACING DISABLED\n";
        }
        out += '\n';
    }
    return out;
}

std::string Responses::to_string() const {
    std::string out;
    for (const auto& [target, response] : by_target) {
        out += fmt::format("target={} results={}\n", target, response.results.size());
        for (const auto& r : response.results) {
            out += fmt::format("  kind={} name={} action={} msg={} metadata={}\n",
                               unstructured::get_kind(r.constraint),
                               unstructured::get_name(r.constraint),
                               r.enforcement_action,
                               r.msg,
                               unstructured::canonical_string(r.metadata));
        }
    }
    return out;
}
