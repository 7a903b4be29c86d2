#include "util/TimSort.hpp"

namespace coda::util {

// Picks a run length in [16, 32] such that n / run is close to, but not
// above, a power of two.
size_t min_run_length(size_t n) {
    size_t low_bits = 0;
    while (n >= 32) {
        low_bits |= (n & 1);
        n >>= 1;
    }
    return n + low_bits;
}

}  // namespace coda::util
