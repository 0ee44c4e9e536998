#include "limcalc/api.h"

#include <emscripten/emscripten.h>
#include <emscripten/bind.h>
#include <emscripten/val.h>

#include <cstdint>
#include <string>

using emscripten::val;

// Export the C API for WASM (low-level access)
extern "C" {

EMSCRIPTEN_KEEPALIVE
limcalc_context_handle wasm_context_create() {
    return limcalc_context_create();
}

EMSCRIPTEN_KEEPALIVE
void wasm_context_destroy(limcalc_context_handle ctx) {
    limcalc_context_destroy(ctx);
}

EMSCRIPTEN_KEEPALIVE
limcalc_error_t wasm_analyze(
    limcalc_context_handle ctx,
    const char* expression,
    const char* second_expression,
    const char* approach,
    const char* direction,
    limcalc_report_handle* out_report) {
    return limcalc_analyze(ctx, expression, second_expression, approach, direction, out_report);
}

EMSCRIPTEN_KEEPALIVE
void wasm_report_destroy(limcalc_report_handle report) {
    limcalc_report_destroy(report);
}

EMSCRIPTEN_KEEPALIVE
const char* wasm_error_string(limcalc_error_t error) {
    return limcalc_error_string(error);
}

EMSCRIPTEN_KEEPALIVE
const char* wasm_get_last_error_message(limcalc_context_handle ctx) {
    return limcalc_get_last_error_message(ctx);
}

} // extern "C"

namespace {

inline limcalc_context_handle to_context(uintptr_t value) {
    return reinterpret_cast<limcalc_context_handle>(value);
}

inline uintptr_t from_context(limcalc_context_handle ctx) {
    return reinterpret_cast<uintptr_t>(ctx);
}

std::string to_string_or_empty(const char* text) {
    return text ? std::string(text) : std::string();
}

val make_steps(limcalc_report_handle report, size_t index) {
    val steps = val::array();
    const size_t count = limcalc_report_step_count(report, index);
    for (size_t i = 0; i < count; ++i) {
        val step = val::object();
        step.set("text", to_string_or_empty(limcalc_report_step_text(report, index, i)));
        step.set("emphasized", limcalc_report_step_emphasized(report, index, i) != 0);
        step.set("result", to_string_or_empty(limcalc_report_step_result(report, index, i)));
        steps.set(i, step);
    }
    return steps;
}

val make_continuity(limcalc_report_handle report, size_t index) {
    val continuity = val::object();
    continuity.set("functionValue", to_string_or_empty(limcalc_report_function_value(report, index)));
    continuity.set("left", to_string_or_empty(limcalc_report_left_limit(report, index)));
    continuity.set("right", to_string_or_empty(limcalc_report_right_limit(report, index)));
    continuity.set("twoSided", to_string_or_empty(limcalc_report_two_sided_limit(report, index)));
    continuity.set("continuous", limcalc_report_is_continuous(report, index) != 0);
    continuity.set("kind", static_cast<int>(limcalc_report_discontinuity(report, index)));
    continuity.set("kindName", to_string_or_empty(limcalc_report_discontinuity_name(report, index)));

    val steps = val::array();
    const size_t count = limcalc_report_continuity_step_count(report, index);
    for (size_t i = 0; i < count; ++i) {
        steps.set(i, to_string_or_empty(limcalc_report_continuity_step_text(report, index, i)));
    }
    continuity.set("steps", steps);
    return continuity;
}

val make_expression_object(limcalc_report_handle report, size_t index) {
    val obj = val::object();
    obj.set("canonical", to_string_or_empty(limcalc_report_canonical(report, index)));
    obj.set("display", to_string_or_empty(limcalc_report_display(report, index)));
    obj.set("notation", to_string_or_empty(limcalc_report_notation(report, index)));
    obj.set("direction", static_cast<int>(limcalc_report_direction(report, index)));
    obj.set("limit", to_string_or_empty(limcalc_report_limit(report, index)));
    obj.set("limitKind", static_cast<int>(limcalc_report_limit_kind(report, index)));
    obj.set("steps", make_steps(report, index));
    obj.set("continuity", make_continuity(report, index));
    return obj;
}

} // namespace

uintptr_t context_create_binding() {
    return from_context(limcalc_context_create());
}

void context_destroy_binding(uintptr_t ctx_value) {
    limcalc_context_destroy(to_context(ctx_value));
}

val analyze_binding(uintptr_t ctx_value,
                    const std::string& expression,
                    const std::string& second_expression,
                    const std::string& approach,
                    const std::string& direction) {
    limcalc_context_handle ctx = to_context(ctx_value);
    limcalc_report_handle report = nullptr;
    limcalc_error_t error = limcalc_analyze(
        ctx,
        expression.c_str(),
        second_expression.c_str(),
        approach.c_str(),
        direction.c_str(),
        &report
    );

    val result = val::object();
    result.set("error", static_cast<int>(error));
    if (error == LIMCALC_OK) {
        val expressions = val::array();
        const size_t count = limcalc_report_expression_count(report);
        for (size_t i = 0; i < count; ++i) {
            expressions.set(i, make_expression_object(report, i));
        }
        result.set("expressions", expressions);
        result.set("message", std::string());
    } else {
        result.set("expressions", val::null());
        result.set("message", to_string_or_empty(limcalc_get_last_error_message(ctx)));
    }

    limcalc_report_destroy(report);
    return result;
}

val normalize_binding(uintptr_t ctx_value, const std::string& expression) {
    limcalc_context_handle ctx = to_context(ctx_value);
    limcalc_owned_string canonical{};
    limcalc_error_t error = limcalc_normalize(ctx, expression.c_str(), &canonical);

    val result = val::object();
    result.set("error", static_cast<int>(error));
    if (error == LIMCALC_OK && canonical.data) {
        result.set("value", std::string(canonical.data, canonical.length));
        result.set("message", std::string());
    } else {
        result.set("value", val::undefined());
        result.set("message", to_string_or_empty(limcalc_get_last_error_message(ctx)));
    }

    limcalc_free_string(&canonical);
    return result;
}

val catalog_binding() {
    val entries = val::array();
    const size_t count = limcalc_catalog_size();
    for (size_t i = 0; i < count; ++i) {
        val entry = val::object();
        entry.set("name", to_string_or_empty(limcalc_catalog_name(i)));
        entry.set("expression", to_string_or_empty(limcalc_catalog_expression(i)));
        entry.set("approach", to_string_or_empty(limcalc_catalog_approach(i)));
        entry.set("description", to_string_or_empty(limcalc_catalog_description(i)));
        entries.set(i, entry);
    }
    return entries;
}

void set_max_input_length_binding(uintptr_t ctx_value, std::size_t length) {
    limcalc_set_max_input_length(to_context(ctx_value), length);
}

void set_decimal_places_binding(uintptr_t ctx_value, int places) {
    limcalc_set_decimal_places(to_context(ctx_value), places);
}

void set_max_denominator_binding(uintptr_t ctx_value, double denominator) {
    limcalc_set_max_denominator(to_context(ctx_value), static_cast<int64_t>(denominator));
}

void set_sampling_levels_binding(uintptr_t ctx_value, std::size_t levels) {
    limcalc_set_sampling_levels(to_context(ctx_value), levels);
}

void set_comparison_tolerance_binding(uintptr_t ctx_value, double tolerance) {
    limcalc_set_comparison_tolerance(to_context(ctx_value), tolerance);
}

void set_solver_tolerance_binding(uintptr_t ctx_value, double tolerance) {
    limcalc_set_solver_tolerance(to_context(ctx_value), tolerance);
}

std::string error_string_binding(int error) {
    return limcalc_error_string(static_cast<limcalc_error_t>(error));
}

std::string get_last_error_binding(uintptr_t ctx_value) {
    return to_string_or_empty(limcalc_get_last_error_message(to_context(ctx_value)));
}

EMSCRIPTEN_BINDINGS(limcalc_module_bindings) {
    emscripten::function("contextCreate", &context_create_binding);
    emscripten::function("contextDestroy", &context_destroy_binding);
    emscripten::function("analyze", &analyze_binding);
    emscripten::function("normalize", &normalize_binding);
    emscripten::function("catalog", &catalog_binding);
    emscripten::function("setMaxInputLength", &set_max_input_length_binding);
    emscripten::function("setDecimalPlaces", &set_decimal_places_binding);
    emscripten::function("setMaxDenominator", &set_max_denominator_binding);
    emscripten::function("setSamplingLevels", &set_sampling_levels_binding);
    emscripten::function("setComparisonTolerance", &set_comparison_tolerance_binding);
    emscripten::function("setSolverTolerance", &set_solver_tolerance_binding);
    emscripten::function("errorString", &error_string_binding);
    emscripten::function("getLastErrorMessage", &get_last_error_binding);
}
