// SPDX-License-Identifier: MIT
/**
 * @file papaya_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the papaya library
 *
 * Tracing points that can be enabled at runtime with bpftrace, systemtap
 * or perf. When tracing is disabled (default), probes compile to single NOP
 * instructions.
 *
 * Example usage with bpftrace:
 *   # Watch every rejected input across modules
 *   sudo bpftrace -e 'usdt:./lib*.so:papaya:validation_error { ... }'
 *
 *   # Watch quotes dropped for a negative price
 *   sudo bpftrace -e 'usdt:./lib*.so:papaya:quote_rejected { printf("%f\n", arg0); }'
 */

#ifndef PAPAYA_TRACE_H
#define PAPAYA_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

/**
 * Provider name for all papaya probes
 */
#define PAPAYA_PROVIDER papaya

/**
 * Module identifiers, passed as the first parameter to shared probes
 */
#define MODULE_EUROPEAN_OPTION  1
#define MODULE_VALIDATION       2
#define MODULE_QUOTE            3
#define MODULE_RETURNS          4
#define MODULE_ACCOUNT          5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a computation begins
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., spot)
 * @param param2: Module-specific parameter (e.g., strike)
 * @param param3: Module-specific parameter (e.g., maturity)
 */
#define PAPAYA_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(PAPAYA_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when a computation completes
 * @param module_id: Module identifier
 * @param count: Number of items processed
 * @param final_metric: Result value (e.g., price)
 */
#define PAPAYA_TRACE_ALGO_COMPLETE(module_id, count, final_metric) \
    DTRACE_PROBE3(PAPAYA_PROVIDER, algo_complete, module_id, count, final_metric)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode cast to int
 * @param param1: Offending value
 * @param param2: Index or threshold (0 if not applicable)
 */
#define PAPAYA_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(PAPAYA_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Module-Specific Probes: Quotes
 * ============================================================================
 */

/**
 * Fired when a quote with a negative price is dropped
 * @param price: Rejected quote price
 */
#define PAPAYA_TRACE_QUOTE_REJECTED(price) \
    DTRACE_PROBE2(PAPAYA_PROVIDER, quote_rejected, MODULE_QUOTE, price)

/**
 * Fired when a quote older than the last quote is filed into history only
 * @param price: Quote price
 * @param history_size: History length after insertion
 */
#define PAPAYA_TRACE_QUOTE_OUT_OF_ORDER(price, history_size) \
    DTRACE_PROBE3(PAPAYA_PROVIDER, quote_out_of_order, MODULE_QUOTE, price, history_size)

#endif // PAPAYA_TRACE_H
