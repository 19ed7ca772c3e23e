/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port must provide this header defining:
 * - BRAINRT_PORT_CONTEXT_SIZE: Size of brainrt_port_context_t in bytes
 * - BRAINRT_PORT_CONTEXT_ALIGN: Alignment requirement for brainrt_port_context_t
 * - BRAINRT_STACK_ALIGN: Stack alignment requirement
 *
 * These values are used by the runtime to reserve context storage inside
 * each async task. The port implementation must static_assert that the
 * actual sizes match.
 */

#ifndef BRAINRT_PORT_TRAITS_H
#define BRAINRT_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation)
 * ========================================================================= */

/**
 * @brief Size of brainrt_port_context_t structure in bytes
 */
#define BRAINRT_PORT_CONTEXT_SIZE  48

/**
 * @brief Alignment requirement for brainrt_port_context_t
 */
#define BRAINRT_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment requirement in bytes (x86-64 SysV: 16)
 */
#define BRAINRT_STACK_ALIGN 16

#define BRAINRT_PORT_CACHE_LINE 64

/**
 * @brief Smallest OS task stack the simulation hands to pthreads
 *
 * Requested stack depths are sized for the target; host code (libc,
 * iostreams, gtest) needs more.
 */
#define BRAINRT_PORT_MIN_TASK_STACK (256u * 1024u)

#define BRAINRT_PORT_SIMULATION 1

#endif // BRAINRT_PORT_TRAITS_H
