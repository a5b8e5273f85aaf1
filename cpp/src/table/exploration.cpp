#include "../../include/table/exploration.hpp"

namespace qtable {

double exploration_rate(double epsilon, int episode_number, float dropoff) {
    return epsilon + dropoff / (static_cast<double>(episode_number) + dropoff);
}

} // namespace qtable
