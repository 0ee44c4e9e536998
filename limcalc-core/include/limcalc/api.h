#ifndef LIMCALC_API_H
#define LIMCALC_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

// Error codes
typedef enum {
    LIMCALC_OK = 0,
    LIMCALC_ERROR_INPUT_TOO_LONG = 1,
    LIMCALC_ERROR_UNPARSABLE = 2,
    LIMCALC_ERROR_EMPTY_INPUT = 3,
    LIMCALC_ERROR_INVALID_NUMBER = 4,
    LIMCALC_ERROR_INVALID_DIRECTION = 5,
    LIMCALC_ERROR_NULL_POINTER = 6,
    LIMCALC_ERROR_INTERNAL = 7
} limcalc_error_t;

typedef enum {
    LIMCALC_DIRECTION_BOTH = 0,
    LIMCALC_DIRECTION_LEFT = 1,
    LIMCALC_DIRECTION_RIGHT = 2
} limcalc_direction_t;

typedef enum {
    LIMCALC_LIMIT_INTEGER = 0,
    LIMCALC_LIMIT_RATIONAL = 1,
    LIMCALC_LIMIT_DECIMAL = 2,
    LIMCALC_LIMIT_POSITIVE_INFINITY = 3,
    LIMCALC_LIMIT_NEGATIVE_INFINITY = 4,
    LIMCALC_LIMIT_COMPLEX_INFINITY = 5,
    LIMCALC_LIMIT_UNDEFINED = 6,
    LIMCALC_LIMIT_NAN = 7,
    LIMCALC_LIMIT_FAILED = 8
} limcalc_limit_kind_t;

typedef enum {
    LIMCALC_CONTINUOUS = 0,
    LIMCALC_DISCONTINUITY_REMOVABLE = 1,
    LIMCALC_DISCONTINUITY_JUMP = 2,
    LIMCALC_DISCONTINUITY_ESSENTIAL = 3,
    LIMCALC_POINT_AT_INFINITY = 4
} limcalc_discontinuity_t;

// Owned UTF-8 string container
typedef struct {
    char* data;
    size_t length;
} limcalc_owned_string;

// Opaque handle types
typedef struct limcalc_context_t* limcalc_context_handle;
typedef struct limcalc_report_t* limcalc_report_handle;

// Context management
limcalc_context_handle limcalc_context_create(void);
void limcalc_context_destroy(limcalc_context_handle ctx);

// Full analysis: limit, derivation steps and continuity per expression.
// second_expression and direction may be NULL.
limcalc_error_t limcalc_analyze(
    limcalc_context_handle ctx,
    const char* expression,
    const char* second_expression,
    const char* approach,
    const char* direction,
    limcalc_report_handle* out_report
);

void limcalc_report_destroy(limcalc_report_handle report);

// Report accessors. Strings stay valid until the report is destroyed;
// an out-of-range index yields NULL (or 0).
size_t limcalc_report_expression_count(limcalc_report_handle report);
const char* limcalc_report_canonical(limcalc_report_handle report, size_t index);
const char* limcalc_report_display(limcalc_report_handle report, size_t index);
const char* limcalc_report_notation(limcalc_report_handle report, size_t index);
limcalc_direction_t limcalc_report_direction(limcalc_report_handle report, size_t index);
const char* limcalc_report_limit(limcalc_report_handle report, size_t index);
limcalc_limit_kind_t limcalc_report_limit_kind(limcalc_report_handle report, size_t index);

size_t limcalc_report_step_count(limcalc_report_handle report, size_t index);
const char* limcalc_report_step_text(limcalc_report_handle report, size_t index, size_t step);
int limcalc_report_step_emphasized(limcalc_report_handle report, size_t index, size_t step);
const char* limcalc_report_step_result(limcalc_report_handle report, size_t index, size_t step);

const char* limcalc_report_function_value(limcalc_report_handle report, size_t index);
const char* limcalc_report_left_limit(limcalc_report_handle report, size_t index);
const char* limcalc_report_right_limit(limcalc_report_handle report, size_t index);
const char* limcalc_report_two_sided_limit(limcalc_report_handle report, size_t index);
int limcalc_report_is_continuous(limcalc_report_handle report, size_t index);
limcalc_discontinuity_t limcalc_report_discontinuity(limcalc_report_handle report, size_t index);
const char* limcalc_report_discontinuity_name(limcalc_report_handle report, size_t index);

size_t limcalc_report_continuity_step_count(limcalc_report_handle report, size_t index);
const char* limcalc_report_continuity_step_text(limcalc_report_handle report, size_t index, size_t step);

// Sanitize + normalize only; release the result with limcalc_free_string
limcalc_error_t limcalc_normalize(
    limcalc_context_handle ctx,
    const char* expression,
    limcalc_owned_string* out_canonical
);

void limcalc_free_string(limcalc_owned_string* str);

// Example catalog
size_t limcalc_catalog_size(void);
const char* limcalc_catalog_name(size_t index);
const char* limcalc_catalog_expression(size_t index);
const char* limcalc_catalog_approach(size_t index);
const char* limcalc_catalog_description(size_t index);

// Configuration
void limcalc_set_max_input_length(limcalc_context_handle ctx, size_t length);
void limcalc_set_decimal_places(limcalc_context_handle ctx, int places);
// Clamped to 1000000
void limcalc_set_max_denominator(limcalc_context_handle ctx, int64_t denominator);
void limcalc_set_comparison_tolerance(limcalc_context_handle ctx, double tolerance);
void limcalc_set_solver_tolerance(limcalc_context_handle ctx, double tolerance);
void limcalc_set_sampling_levels(limcalc_context_handle ctx, size_t levels);

// Error handling
const char* limcalc_error_string(limcalc_error_t error);
const char* limcalc_get_last_error_message(limcalc_context_handle ctx);

#ifdef __cplusplus
}
#endif

#endif // LIMCALC_API_H
