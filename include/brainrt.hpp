/**
 * brainrt Application Programming Interface
 *
 * One include for applications: the async executor and its futures,
 * task-local storage, port ownership and the hardware error convention.
 *
 *   int main()
 *   {
 *      auto peripherals = brainrt::Peripherals::take().value();
 *      brainrt::block_on([&] { ... });
 *   }
*/
#ifndef BRAINRT_HPP
#define BRAINRT_HPP

#include "brainrt/kernel.hpp"
#include "brainrt/executor.hpp"
#include "brainrt/event.hpp"
#include "brainrt/task_local.hpp"
#include "brainrt/peripherals.hpp"
#include "brainrt/hardware.hpp"

#endif // BRAINRT_HPP
