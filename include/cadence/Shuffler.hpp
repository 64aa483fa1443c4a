/**
 * @file Shuffler.hpp
 * @brief Seeded source of uniform random permutations.
 */

#ifndef CADENCE_SHUFFLER_HPP
#define CADENCE_SHUFFLER_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace cadence
{

/**
 * @brief Draws uniformly random permutations of [0, n).
 *
 * Uses std::mt19937_64, whose output sequence is fixed by the standard,
 * together with rejection sampling for bounded draws, so a given seed
 * produces the same permutations with every standard library.
 */
class Shuffler
{

private:

    /// Effective (resolved, non-zero) seed.
    uint64_t        m_seed {0};

    /// Engine state.
    std::mt19937_64 m_engine {};

    /**
     * @brief Uniform integer in [0, bound] without modulo bias.
     */
    uint64_t uniform_upto(uint64_t bound);

public:

    /**
     * @brief Construct a shuffler.
     *
     * @param seed RNG seed. If zero, the seed is drawn from
     * `std::random_device`; non-zero seeds produce deterministic output.
     */
    explicit Shuffler(uint64_t seed = 0ULL);

    /**
     * @brief Draw the next permutation of [0, @p n).
     *
     * Fisher-Yates shuffle: every one of the n! orderings is equally
     * likely. Advances the engine.
     *
     * @throws cadence::validation_error if @p n is zero.
     */
    std::vector<uint64_t> permutation(uint64_t n);

    /// Seed actually used by the engine.
    uint64_t get_seed() const noexcept;
};

/**
 * @brief Resolve a user seed following the library convention.
 *
 * Returns @p seed unchanged if non-zero, otherwise a non-zero value
 * derived from `std::random_device`.
 */
uint64_t resolve_seed(uint64_t seed);

} // namespace cadence

#endif // CADENCE_SHUFFLER_HPP
