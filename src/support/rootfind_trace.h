// SPDX-License-Identifier: MIT
/**
 * @file rootfind_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the rootfind library
 *
 * Tracing points that can be enabled at runtime with bpftrace, systemtap
 * or perf. When tracing is disabled (default), probes compile to single NOP
 * instructions and capture nothing.
 *
 * All solvers and the bracket scanner share the same generic probes and
 * identify themselves through a module id.
 *
 * Example usage with bpftrace:
 *   # Trace every solver start
 *   sudo bpftrace -e 'usdt:./lib*.so:rootfind:algo_start { printf("%d\n", arg0); }'
 *
 *   # Watch solvers that give up
 *   sudo bpftrace -e 'usdt:./lib*.so:rootfind:convergence_failed { ... }'
 */

#ifndef ROOTFIND_TRACE_H
#define ROOTFIND_TRACE_H

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
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all rootfind probes
 */
#define ROOTFIND_PROVIDER rootfind

/**
 * Module identifiers, passed as the first parameter to the generic probes
 */
#define MODULE_BRACKET_SCAN     1
#define MODULE_BISECTION        2
#define MODULE_FALSE_POSITION   3
#define MODULE_ILLINOIS         4
#define MODULE_NEWTON_RAPHSON   5
#define MODULE_HALLEY           6
#define MODULE_VALIDATION       7

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when a solver begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param max_iter: Iteration cap
 * @param param1: Lower bracket end or initial guess
 * @param param2: Upper bracket end (initial guess again for open methods)
 */
#define ROOTFIND_TRACE_ALGO_START(module_id, max_iter, param1, param2) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, algo_start, module_id, max_iter, param1, param2)

/**
 * Fired when a solver produced a root
 * @param module_id: Module identifier
 * @param iterations: Iterations completed
 * @param root: Root estimate returned to the caller
 */
#define ROOTFIND_TRACE_ALGO_COMPLETE(module_id, iterations, root) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, algo_complete, module_id, iterations, root)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each solver iteration
 * @param module_id: Module identifier
 * @param iter: Current iteration number (1-based)
 * @param x: Current iterate
 * @param fx: f(x)
 */
#define ROOTFIND_TRACE_CONVERGENCE_ITER(module_id, iter, x, fx) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, convergence_iter, module_id, iter, x, fx)

/**
 * Fired when the convergence policy accepted an iterate
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param residual: |f(root)|
 */
#define ROOTFIND_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, residual) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, convergence_success, module_id, final_iter, residual)

/**
 * Fired when a solver gives up
 * @param module_id: Module identifier
 * @param error_code: RootFindingErrorCode as int
 * @param iterations: Iterations completed before the failure
 * @param last_x: Last x value tried
 */
#define ROOTFIND_TRACE_CONVERGENCE_FAILED(module_id, error_code, iterations, last_x) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, convergence_failed, module_id, error_code, iterations, last_x)

/**
 * ============================================================================
 * Validation Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: RootFindingErrorCode as int
 * @param param1: Offending value
 * @param param2: Limit or companion value
 */
#define ROOTFIND_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * ============================================================================
 * Module-Specific Probes: Bracket Scan
 * ============================================================================
 */

/**
 * Fired when a pass over the bounds begins
 * @param lo: Lower end of the scan
 * @param hi: Upper end of the scan
 * @param window: Window width
 */
#define ROOTFIND_TRACE_SCAN_START(lo, hi, window) \
    DTRACE_PROBE4(ROOTFIND_PROVIDER, scan_start, MODULE_BRACKET_SCAN, lo, hi, window)

/**
 * Fired for each bracket emitted by the scanner
 * @param lo: Bracket lower end
 * @param hi: Bracket upper end (equal to lo for an exact boundary zero)
 */
#define ROOTFIND_TRACE_BRACKET_FOUND(lo, hi) \
    DTRACE_PROBE3(ROOTFIND_PROVIDER, bracket_found, MODULE_BRACKET_SCAN, lo, hi)

/**
 * Fired when a pass reaches the upper bound
 * @param windows: Number of windows evaluated
 */
#define ROOTFIND_TRACE_SCAN_COMPLETE(windows) \
    DTRACE_PROBE2(ROOTFIND_PROVIDER, scan_complete, MODULE_BRACKET_SCAN, windows)

#endif // ROOTFIND_TRACE_H
