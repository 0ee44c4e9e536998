#include "limcalc/api.h"
#include "limcalc/analysis.h"
#include "limcalc/catalog.h"
#include "limcalc/engine.h"
#include "limcalc/errors.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

struct limcalc_context_t {
    std::string last_error;
    limcalc::AnalysisOptions options;
    limcalc::SolverSettings solver;
};

struct limcalc_report_t {
    limcalc::AnalysisResult result;
};

namespace {

// Rational recognition scans every denominator up to this bound
constexpr int64_t kMaxDenominatorLimit = 1000000;

limcalc_error_t to_error_code(limcalc::InputErrorCode code) {
    switch (code) {
        case limcalc::InputErrorCode::INPUT_TOO_LONG:
            return LIMCALC_ERROR_INPUT_TOO_LONG;
        case limcalc::InputErrorCode::UNPARSABLE_EXPRESSION:
            return LIMCALC_ERROR_UNPARSABLE;
        case limcalc::InputErrorCode::EMPTY_INPUT:
            return LIMCALC_ERROR_EMPTY_INPUT;
        case limcalc::InputErrorCode::INVALID_NUMBER:
            return LIMCALC_ERROR_INVALID_NUMBER;
        case limcalc::InputErrorCode::INVALID_DIRECTION:
            return LIMCALC_ERROR_INVALID_DIRECTION;
    }
    return LIMCALC_ERROR_INTERNAL;
}

const limcalc::ExpressionAnalysis* expression_at(limcalc_report_handle report, size_t index) {
    if (!report || index >= report->result.expressions.size()) {
        return nullptr;
    }
    return &report->result.expressions[index];
}

const limcalc::Step* step_at(limcalc_report_handle report, size_t index, size_t step) {
    const auto* analysis = expression_at(report, index);
    if (!analysis || step >= analysis->steps.size()) {
        return nullptr;
    }
    return &analysis->steps[step];
}

const limcalc::CatalogEntry* catalog_at(size_t index) {
    const auto& catalog = limcalc::example_catalog();
    return index < catalog.size() ? &catalog[index] : nullptr;
}

} // namespace

// Context management
limcalc_context_handle limcalc_context_create(void) {
    return new limcalc_context_t();
}

void limcalc_context_destroy(limcalc_context_handle ctx) {
    delete ctx;
}

// Analysis
limcalc_error_t limcalc_analyze(
    limcalc_context_handle ctx,
    const char* expression,
    const char* second_expression,
    const char* approach,
    const char* direction,
    limcalc_report_handle* out_report) {

    if (!ctx || !expression || !approach || !out_report) {
        if (ctx) ctx->last_error = "Null pointer argument";
        return LIMCALC_ERROR_NULL_POINTER;
    }

    try {
        limcalc::NumericEngine engine(ctx->solver);
        engine.set_max_denominator(ctx->options.max_denominator);
        limcalc::Analyzer analyzer(engine, ctx->options);

        limcalc::AnalysisRequest request;
        request.expression = expression;
        request.second_expression = second_expression ? second_expression : "";
        request.approach = approach;
        request.direction = direction ? direction : "";

        auto report = std::make_unique<limcalc_report_t>();
        report->result = analyzer.analyze(request);

        ctx->last_error.clear();
        *out_report = report.release();
        return LIMCALC_OK;

    } catch (const limcalc::InputError& e) {
        ctx->last_error = std::string(limcalc::input_error_name(e.code)) + ": " + e.what();
        return to_error_code(e.code);
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return LIMCALC_ERROR_INTERNAL;
    }
}

void limcalc_report_destroy(limcalc_report_handle report) {
    delete report;
}

size_t limcalc_report_expression_count(limcalc_report_handle report) {
    return report ? report->result.expressions.size() : 0;
}

const char* limcalc_report_canonical(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->canonical.c_str() : nullptr;
}

const char* limcalc_report_display(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->display.c_str() : nullptr;
}

const char* limcalc_report_notation(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->notation.c_str() : nullptr;
}

limcalc_direction_t limcalc_report_direction(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    if (!analysis) {
        return LIMCALC_DIRECTION_BOTH;
    }
    switch (analysis->direction) {
        case limcalc::Direction::LEFT:
            return LIMCALC_DIRECTION_LEFT;
        case limcalc::Direction::RIGHT:
            return LIMCALC_DIRECTION_RIGHT;
        case limcalc::Direction::BOTH:
            break;
    }
    return LIMCALC_DIRECTION_BOTH;
}

const char* limcalc_report_limit(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->limit.text.c_str() : nullptr;
}

limcalc_limit_kind_t limcalc_report_limit_kind(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    if (!analysis) {
        return LIMCALC_LIMIT_FAILED;
    }
    // Enumerators share the declaration order of LimitValue::Kind
    return static_cast<limcalc_limit_kind_t>(static_cast<int>(analysis->limit.kind));
}

size_t limcalc_report_step_count(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->steps.size() : 0;
}

const char* limcalc_report_step_text(limcalc_report_handle report, size_t index, size_t step) {
    const auto* entry = step_at(report, index, step);
    return entry ? entry->text.c_str() : nullptr;
}

int limcalc_report_step_emphasized(limcalc_report_handle report, size_t index, size_t step) {
    const auto* entry = step_at(report, index, step);
    return entry && entry->emphasized ? 1 : 0;
}

const char* limcalc_report_step_result(limcalc_report_handle report, size_t index, size_t step) {
    const auto* entry = step_at(report, index, step);
    return entry ? entry->result.c_str() : nullptr;
}

const char* limcalc_report_function_value(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->continuity.function_value.text.c_str() : nullptr;
}

const char* limcalc_report_left_limit(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->continuity.left.text.c_str() : nullptr;
}

const char* limcalc_report_right_limit(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->continuity.right.text.c_str() : nullptr;
}

const char* limcalc_report_two_sided_limit(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->continuity.two_sided.text.c_str() : nullptr;
}

int limcalc_report_is_continuous(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis && analysis->continuity.continuous ? 1 : 0;
}

limcalc_discontinuity_t limcalc_report_discontinuity(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    if (!analysis) {
        return LIMCALC_DISCONTINUITY_ESSENTIAL;
    }
    switch (analysis->continuity.kind) {
        case limcalc::DiscontinuityKind::NONE:
            return LIMCALC_CONTINUOUS;
        case limcalc::DiscontinuityKind::REMOVABLE:
            return LIMCALC_DISCONTINUITY_REMOVABLE;
        case limcalc::DiscontinuityKind::JUMP:
            return LIMCALC_DISCONTINUITY_JUMP;
        case limcalc::DiscontinuityKind::ESSENTIAL:
            return LIMCALC_DISCONTINUITY_ESSENTIAL;
        case limcalc::DiscontinuityKind::POINT_AT_INFINITY:
            return LIMCALC_POINT_AT_INFINITY;
    }
    return LIMCALC_DISCONTINUITY_ESSENTIAL;
}

const char* limcalc_report_discontinuity_name(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? limcalc::discontinuity_name(analysis->continuity.kind) : nullptr;
}

size_t limcalc_report_continuity_step_count(limcalc_report_handle report, size_t index) {
    const auto* analysis = expression_at(report, index);
    return analysis ? analysis->continuity.steps.size() : 0;
}

const char* limcalc_report_continuity_step_text(limcalc_report_handle report, size_t index, size_t step) {
    const auto* analysis = expression_at(report, index);
    if (!analysis || step >= analysis->continuity.steps.size()) {
        return nullptr;
    }
    return analysis->continuity.steps[step].text.c_str();
}

// Normalization only
limcalc_error_t limcalc_normalize(
    limcalc_context_handle ctx,
    const char* expression,
    limcalc_owned_string* out_canonical) {

    if (!ctx || !expression || !out_canonical) {
        if (ctx) ctx->last_error = "Null pointer argument";
        return LIMCALC_ERROR_NULL_POINTER;
    }
    out_canonical->data = nullptr;
    out_canonical->length = 0;

    try {
        limcalc::NumericEngine engine(ctx->solver);
        limcalc::Analyzer analyzer(engine, ctx->options);
        const std::string canonical = analyzer.prepare_expression(expression);

        char* buffer = static_cast<char*>(std::malloc(canonical.size() + 1));
        if (!buffer) {
            ctx->last_error = "Out of memory";
            return LIMCALC_ERROR_INTERNAL;
        }
        std::memcpy(buffer, canonical.c_str(), canonical.size() + 1);
        out_canonical->data = buffer;
        out_canonical->length = canonical.size();

        ctx->last_error.clear();
        return LIMCALC_OK;

    } catch (const limcalc::InputError& e) {
        ctx->last_error = std::string(limcalc::input_error_name(e.code)) + ": " + e.what();
        return to_error_code(e.code);
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return LIMCALC_ERROR_INTERNAL;
    }
}

void limcalc_free_string(limcalc_owned_string* str) {
    if (!str || !str->data) {
        return;
    }
    std::free(str->data);
    str->data = nullptr;
    str->length = 0;
}

// Example catalog
size_t limcalc_catalog_size(void) {
    return limcalc::example_catalog().size();
}

const char* limcalc_catalog_name(size_t index) {
    const auto* entry = catalog_at(index);
    return entry ? entry->name.c_str() : nullptr;
}

const char* limcalc_catalog_expression(size_t index) {
    const auto* entry = catalog_at(index);
    return entry ? entry->expression.c_str() : nullptr;
}

const char* limcalc_catalog_approach(size_t index) {
    const auto* entry = catalog_at(index);
    return entry ? entry->approach.c_str() : nullptr;
}

const char* limcalc_catalog_description(size_t index) {
    const auto* entry = catalog_at(index);
    return entry ? entry->description.c_str() : nullptr;
}

// Configuration
void limcalc_set_max_input_length(limcalc_context_handle ctx, size_t length) {
    if (ctx) {
        ctx->options.max_input_length = length;
    }
}

void limcalc_set_decimal_places(limcalc_context_handle ctx, int places) {
    if (ctx && places >= 0) {
        ctx->options.decimal_places = places;
    }
}

void limcalc_set_max_denominator(limcalc_context_handle ctx, int64_t denominator) {
    if (ctx && denominator >= 1) {
        ctx->options.max_denominator = static_cast<long long>(std::min(denominator, kMaxDenominatorLimit));
    }
}

void limcalc_set_comparison_tolerance(limcalc_context_handle ctx, double tolerance) {
    if (ctx && tolerance >= 0.0) {
        ctx->options.comparison_tolerance = tolerance;
    }
}

void limcalc_set_solver_tolerance(limcalc_context_handle ctx, double tolerance) {
    if (ctx && tolerance > 0.0) {
        ctx->solver.tolerance = tolerance;
    }
}

void limcalc_set_sampling_levels(limcalc_context_handle ctx, size_t levels) {
    if (ctx && levels >= ctx->solver.tail_window) {
        ctx->solver.sampling_levels = levels;
    }
}

// Error handling
const char* limcalc_error_string(limcalc_error_t error) {
    switch (error) {
        case LIMCALC_OK:
            return "Success";
        case LIMCALC_ERROR_INPUT_TOO_LONG:
            return "Input too long";
        case LIMCALC_ERROR_UNPARSABLE:
            return "Unparsable expression";
        case LIMCALC_ERROR_EMPTY_INPUT:
            return "Empty input";
        case LIMCALC_ERROR_INVALID_NUMBER:
            return "Invalid number";
        case LIMCALC_ERROR_INVALID_DIRECTION:
            return "Invalid direction";
        case LIMCALC_ERROR_NULL_POINTER:
            return "Null pointer";
        case LIMCALC_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

const char* limcalc_get_last_error_message(limcalc_context_handle ctx) {
    if (!ctx) return "Invalid context";
    return ctx->last_error.c_str();
}
