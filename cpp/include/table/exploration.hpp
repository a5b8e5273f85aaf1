#pragma once
#include "../common.hpp"

namespace qtable {

/**
 * Effective epsilon-greedy exploration probability for an episode.
 *
 * Computed as epsilon + dropoff / (episode_number + dropoff). Starts above 1
 * (always explore) at episode 0 and decays toward epsilon as episodes grow.
 * Episode numbers near -dropoff inflate the rate; that is accepted.
 */
double exploration_rate(double epsilon, int episode_number, float dropoff = kEpsilonDropoff);

} // namespace qtable
