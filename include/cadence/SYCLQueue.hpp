/**
 * @file SYCLQueue.hpp
 * @brief Declaration of the global SYCL queue.
 *
 * This header declares a global `sycl::queue` variable that is used by
 * every allocation and kernel in the library, avoiding the need to pass
 * it explicitly between functions.
 */

#ifndef CADENCE_SYCLQUEUE_HPP
#define CADENCE_SYCLQUEUE_HPP

#include <sycl/sycl.hpp>

namespace cadence
{

/**
 * @brief Global in-order SYCL queue used for all operations.
 */
extern sycl::queue g_sycl_queue;

} // namespace cadence

#endif // CADENCE_SYCLQUEUE_HPP
