/**
 * @file port.h
 * @brief brainrt Port Layer API (C ABI)
 *
 * This is the boundary between the brainrt runtime and the underlying
 * real-time OS / hardware. All functions use C linkage so a port can be
 * written against a vendor SDK in C.
 *
 * A port provides:
 * - OS tasks (preemptively scheduled units) with a notification primitive
 * - A millisecond clock and delay primitives
 * - A per-OS-task TLS pointer
 * - Stackful execution contexts used by the async executor
 * - A diagnostic output channel
 */

#ifndef BRAINRT_PORT_H
#define BRAINRT_PORT_H

#include "brainrt/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Port Configuration
 * ========================================================================= */
#ifndef BRAINRT_PORT_SIMULATION
# define BRAINRT_PORT_SIMULATION 0
#endif

#define BRAINRT_PORT_TIMEOUT_MAX UINT32_MAX

/**
 * @brief Opaque execution context (platform-specific size/alignment)
 *
 * The runtime reserves BRAINRT_PORT_CONTEXT_SIZE bytes for it and treats
 * it as opaque.
 */
typedef struct brainrt_port_context brainrt_port_context_t;

/**
 * @brief Opaque OS task record
 */
typedef struct brainrt_port_task* brainrt_port_task_t;

/**
 * @brief Entry point signature for OS tasks and execution contexts
 */
typedef void (*brainrt_port_entry_t)(void* arg);

/**
 * @brief Destructor signature for the TLS block
 */
typedef void (*brainrt_port_tls_dtor_t)(void* tls);

/* ============================================================================
 * OS Tasks
 * ========================================================================= */

/**
 * @brief Create and start an OS task
 * @param entry Task entry point
 * @param arg Argument passed to entry (the captured payload)
 * @param priority Scheduling priority (higher runs first)
 * @param stack_depth Stack size in bytes
 * @param name Task name (copied), may be NULL
 * @return Task record with one reference owned by the caller, or NULL on
 *         failure (errno set)
 */
brainrt_port_task_t brainrt_port_task_create(brainrt_port_entry_t entry,
                                             void* arg,
                                             uint32_t priority,
                                             uint32_t stack_depth,
                                             char const* name);

/**
 * @brief Wait for a task created by brainrt_port_task_create() to finish
 *
 * Can only be called once per task. Does not drop the caller's reference.
 */
void brainrt_port_task_join(brainrt_port_task_t task);

/**
 * @brief Get the record of the calling OS task
 *
 * Tasks not created through the port (e.g. the main thread) are adopted on
 * first call. The returned pointer is borrowed: retain it to keep it.
 */
brainrt_port_task_t brainrt_port_task_current(void);

/**
 * @brief Reference counting for task records
 *
 * A record stays valid while at least one reference exists, even after the
 * task itself has terminated.
 */
void brainrt_port_task_retain(brainrt_port_task_t task);
void brainrt_port_task_release(brainrt_port_task_t task);

/**
 * @brief Get a task's name
 */
char const* brainrt_port_task_get_name(brainrt_port_task_t task);

/**
 * @brief Unique identifier of a task (never reused within a process)
 */
uint32_t brainrt_port_task_get_id(brainrt_port_task_t task);

/**
 * @brief Increment a task's notification value and wake it if it waits
 *
 * Safe to call from any OS task and from timer context.
 */
void brainrt_port_task_notify(brainrt_port_task_t task);

/**
 * @brief Wait for a notification on the calling task
 * @param clear_on_exit true: reset the value to 0, false: decrement it
 * @param timeout_ms Upper bound on the wait (BRAINRT_PORT_TIMEOUT_MAX = forever)
 * @return Notification value before it was cleared/decremented (0 on timeout)
 */
uint32_t brainrt_port_task_notify_take(bool clear_on_exit, uint32_t timeout_ms);

/* ============================================================================
 * Time
 * ========================================================================= */

/**
 * @brief Milliseconds since the port was initialised (monotonic)
 */
uint32_t brainrt_port_millis(void);

/**
 * @brief Block the calling OS task for at least ms milliseconds
 */
void brainrt_port_delay(uint32_t ms);

/**
 * @brief Block until *prev_time + delta, then advance *prev_time by delta
 *
 * Overruns are not accumulated: if the deadline already passed the call
 * returns immediately.
 */
void brainrt_port_delay_until(uint32_t* prev_time, uint32_t delta);

/* ============================================================================
 * Thread-Local Storage (TLS)
 * ========================================================================= */

/**
 * @brief Set the TLS block for the current OS task
 * @param tls_base Pointer to the task's TLS block
 * @param dtor Called with tls_base when the task terminates (may be NULL)
 */
void brainrt_port_set_tls_pointer(void* tls_base, brainrt_port_tls_dtor_t dtor);

/**
 * @brief Get the current OS task's TLS block (NULL if never set)
 */
void* brainrt_port_get_tls_pointer(void);

/* ============================================================================
 * Execution Contexts (stackful, used by async tasks)
 * ========================================================================= */

/**
 * @brief Initialize an execution context
 * @param context Pointer to context storage (pre-allocated by the runtime)
 * @param stack_base Pointer to the base (lowest address) of the stack
 * @param stack_size Size of the stack in bytes
 * @param entry Entry point run on first switch
 * @param arg Argument to pass to entry
 */
void brainrt_port_context_init(brainrt_port_context_t* context,
                               void* stack_base,
                               size_t stack_size,
                               brainrt_port_entry_t entry,
                               void* arg);

/**
 * @brief Run a context until it yields or its entry returns
 *
 * Nested switches are allowed: the caller's own context (if any) is
 * restored on return.
 */
void brainrt_port_context_switch(brainrt_port_context_t* to);

/**
 * @brief Yield from the running context back to whoever switched into it
 *
 * No-op when not called from inside a context.
 */
void brainrt_port_context_yield(void);

/**
 * @brief Check whether a context's entry function has returned
 */
bool brainrt_port_context_finished(brainrt_port_context_t const* context);

/**
 * @brief Check whether the caller is running inside a context
 */
bool brainrt_port_in_context(void);

/**
 * @brief Destroy a context
 *
 * A context that has not finished is unwound first, running destructors of
 * objects on its stack.
 */
void brainrt_port_context_destroy(brainrt_port_context_t* context);

/* ============================================================================
 * Misc
 * ========================================================================= */

/**
 * @brief CPU hint for busy-wait loops
 */
void brainrt_port_cpu_relax(void);

/**
 * @brief Initialize the port layer
 *
 * Called once at system startup. Resets the millisecond clock origin.
 */
void brainrt_port_init(void);

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

/**
 * @brief Write one diagnostic line to the platform's error channel
 *
 * Used for panic reports. Must not allocate on the caller's behalf beyond
 * what the sink needs and must be safe from any OS task.
 */
void brainrt_port_diagnostic_write(char const* message);

#ifdef __cplusplus
}
#endif

#endif /* BRAINRT_PORT_H */
