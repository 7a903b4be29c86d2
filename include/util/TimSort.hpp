#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace coda::util {

// Minimum run length for n elements (defined in TimSort.cpp)
size_t min_run_length(size_t n);

namespace detail {

struct PendingRun {
    size_t start;
    size_t size;
};

// Stable insertion of [sorted_end, last) into the sorted prefix [first, sorted_end)
template<typename It, typename Less>
void insertion_extend(It first, It sorted_end, It last, Less less) {
    for (It it = sorted_end; it != last; ++it) {
        auto pivot = std::move(*it);
        // upper_bound keeps equal elements in input order
        It slot = std::upper_bound(first, it, pivot, less);
        std::move_backward(slot, it, it + 1);
        *slot = std::move(pivot);
    }
}

// Length of the natural run starting at first. Strictly descending runs are
// reversed in place, which is safe for stability since no two are equal.
template<typename It, typename Less>
size_t natural_run(It first, It last, Less less) {
    It next = first + 1;
    if (next == last) return 1;

    if (less(*next, *first)) {
        while (next != last && less(*next, *(next - 1))) ++next;
        std::reverse(first, next);
    } else {
        while (next != last && !less(*next, *(next - 1))) ++next;
    }
    return static_cast<size_t>(std::distance(first, next));
}

// Merge runs[i] and runs[i + 1] through a buffer holding the left run
template<typename It, typename Less>
void merge_runs(It first, std::vector<PendingRun>& runs, size_t i, Less less) {
    using Value = typename std::iterator_traits<It>::value_type;

    It left = first + runs[i].start;
    It right = first + runs[i + 1].start;
    It right_end = right + runs[i + 1].size;

    std::vector<Value> buffer(std::make_move_iterator(left), std::make_move_iterator(right));
    auto buf = buffer.begin();
    It out = left;

    while (buf != buffer.end() && right != right_end) {
        // Take from the right run only when strictly smaller
        if (less(*right, *buf)) {
            *out++ = std::move(*right++);
        } else {
            *out++ = std::move(*buf++);
        }
    }
    std::move(buf, buffer.end(), out);

    runs[i].size += runs[i + 1].size;
    runs.erase(runs.begin() + static_cast<std::ptrdiff_t>(i) + 1);
}

// Keep run sizes decreasing along the stack so merges stay balanced
template<typename It, typename Less>
void balance_runs(It first, std::vector<PendingRun>& runs, Less less) {
    while (runs.size() > 1) {
        size_t n = runs.size() - 2;
        if (n > 0 && runs[n - 1].size <= runs[n].size + runs[n + 1].size) {
            if (runs[n - 1].size < runs[n + 1].size) --n;
            merge_runs(first, runs, n, less);
        } else if (runs[n].size <= runs[n + 1].size) {
            merge_runs(first, runs, n, less);
        } else {
            break;
        }
    }
}

}  // namespace detail

/**
 * Stable adaptive merge sort (TimSort without galloping).
 * Linear on presorted input. Used for every ordering in the library index,
 * where equal keys must keep their input order.
 */
template<typename It, typename Less>
void timsort(It first, It last, Less less) {
    const size_t n = static_cast<size_t>(std::distance(first, last));
    if (n < 2) return;

    const size_t min_run = min_run_length(n);
    std::vector<detail::PendingRun> runs;

    size_t pos = 0;
    while (pos < n) {
        It run_begin = first + static_cast<std::ptrdiff_t>(pos);
        size_t run = detail::natural_run(run_begin, last, less);

        if (run < min_run) {
            size_t forced = std::min(n - pos, min_run);
            detail::insertion_extend(run_begin, run_begin + static_cast<std::ptrdiff_t>(run),
                                     run_begin + static_cast<std::ptrdiff_t>(forced), less);
            run = forced;
        }

        runs.push_back({pos, run});
        detail::balance_runs(first, runs, less);
        pos += run;
    }

    while (runs.size() > 1) {
        size_t i = runs.size() - 2;
        if (i > 0 && runs[i - 1].size < runs[i + 1].size) --i;
        detail::merge_runs(first, runs, i, less);
    }
}

template<typename Container, typename Less>
void timsort(Container& c, Less less) {
    timsort(c.begin(), c.end(), less);
}

}  // namespace coda::util
