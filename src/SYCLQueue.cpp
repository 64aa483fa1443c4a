/**
 * @file SYCLQueue.cpp
 * @brief Global SYCL queue definition.
 */

#include "cadence/SYCLQueue.hpp"

namespace cadence {

sycl::queue g_sycl_queue{ sycl::default_selector_v,
    sycl::property::queue::in_order{} };

} // namespace cadence
