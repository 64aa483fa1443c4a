/**
 * @file Steps.hpp
 * @brief Counted training-step driver.
 *
 * Pulls a fixed number of batches from a cycler and hands each one to a
 * caller-supplied step function (typically a forward/backward/update call
 * into a training framework).
 */

#ifndef CADENCE_STEPS_HPP
#define CADENCE_STEPS_HPP

#include <cstdint>
#include <iostream>

#include "Cycler.hpp"

namespace cadence
{

/**
 * @brief Run @p steps training steps.
 *
 * For each step k in [0, steps) calls `step_fn(cycler.next(), k)`.
 * When @p log_every is non-zero, after every @p log_every-th step a line
 * `step <k+1>/<steps> pass <p> batch <b+1>/<batches_per_pass>` is written
 * to @p os.
 *
 * Exceptions thrown by @p step_fn propagate unchanged and stop the loop.
 *
 * @param cycler Batch source.
 * @param steps Number of steps to run.
 * @param step_fn Callable taking `(const Batch<feature_t, label_t>&,
 * uint64_t)`.
 * @param log_every Logging interval in steps, 0 disables logging.
 * @param os The output stream to log to. Defaults to std::cout.
 * @return Number of steps completed (equals @p steps).
 */
template <typename feature_t, typename label_t, typename step_fn_t>
uint64_t run_steps(MinibatchCycler<feature_t, label_t>& cycler,
    uint64_t steps,
    step_fn_t&& step_fn,
    uint64_t log_every = 0,
    std::ostream& os = std::cout)
{
    uint64_t done = 0;
    for (uint64_t step = 0; step < steps; ++step)
    {
        const Batch<feature_t, label_t> batch = cycler.next();
        step_fn(batch, step);
        ++done;

        if (log_every != 0 && done % log_every == 0)
        {
            os << "step " << done << "/" << steps
               << " pass " << batch.pass
               << " batch " << (batch.index_in_pass + 1)
               << "/" << cycler.batches_per_pass() << "\n";
        }
    }
    return done;
}

} // namespace cadence

#endif // CADENCE_STEPS_HPP
