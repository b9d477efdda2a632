#pragma once

// Greedy version of Myers difference algorithm; O((N+M) D) time.
//
// The edit script is minimal, so its common units form a longest common
// subsequence of A and B. For the backtrack, the frontier every round of D
// started from is kept, trimmed to the diagonals that round could read,
// which makes the trace O(D^2) instead of O(D (N+M)).

#include "algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <gsl/span>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

namespace patchy {

template <typename Unit>
class MyersGreedy : public Algorithm<Unit> {
   public:
    explicit MyersGreedy(DiffInput<Unit>& diff_input) : Algorithm<Unit>(diff_input) {
    }

    DiffResult
    diff() override {
        const auto n = this->diff_input_.A.size();
        const auto m = this->diff_input_.B.size();

        // Narrow index types keep the trace small.
        constexpr auto u16_max = std::numeric_limits<uint16_t>::max();
        constexpr auto u32_max = std::numeric_limits<uint32_t>::max();
        if (n < u16_max && m < u16_max) {
            return diff_impl<uint16_t>();
        } else if (n < u32_max && m < u32_max) {
            return diff_impl<uint32_t>();
        }
        return diff_impl<int64_t>();
    }

   private:
    template <typename IndexType>
    using Trace = std::vector<BipolarArray<IndexType>>;

    // Move down (insert from B) rather than right (delete from A) on
    // diagonal k in round d?
    template <typename IndexType>
    static bool
    goes_down(const BipolarArray<IndexType>& v, int64_t k, int64_t d) {
        return k == -d || (k != d && v[k - 1] < v[k + 1]);
    }

    // Returns D, or -1 if the end was never reached.
    template <typename IndexType>
    int64_t
    forward_pass(Trace<IndexType>& trace) {
        const auto& A = this->diff_input_.A;
        const auto& B = this->diff_input_.B;
        const auto n = static_cast<int64_t>(A.size());
        const auto m = static_cast<int64_t>(B.size());
        const int64_t max = n + m;

        BipolarArray<IndexType> v{-max - 1, max + 1};
        v[1] = 0;

        for (int64_t d = 0; d <= max; d++) {
            trace.push_back(v.slice(-d - 1, d + 1));

            for (int64_t k = -d; k <= d; k += 2) {
                int64_t x = goes_down(v, k, d) ? static_cast<int64_t>(v[k + 1]) : static_cast<int64_t>(v[k - 1]) + 1;
                int64_t y = x - k;

                // Follow the snake
                while (x < n && y < m && A[x] == B[y]) {
                    ++x;
                    ++y;
                }

                v[k] = static_cast<IndexType>(x);

                if (x >= n && y >= m) {
                    return d;
                }
            }
        }
        return -1;
    }

    // Walk back from (N, M) to (0, 0), emitting the edits in reverse.
    template <typename IndexType>
    void
    backtrack(const Trace<IndexType>& trace, std::vector<Edit>& edit_sequence) {
        int64_t x = static_cast<int64_t>(this->diff_input_.A.size());
        int64_t y = static_cast<int64_t>(this->diff_input_.B.size());

        for (auto d = static_cast<int64_t>(trace.size()) - 1; d >= 0; d--) {
            const auto& v = trace[static_cast<std::size_t>(d)];

            const int64_t k = x - y;
            const bool down = goes_down(v, k, d);
            const int64_t prev_k = down ? k + 1 : k - 1;
            const int64_t prev_x = v[prev_k];
            const int64_t prev_y = prev_x - prev_k;

            while (x > prev_x && y > prev_y) {
                --x;
                --y;
                edit_sequence.push_back(Edit::Common(x, y));
            }

            if (d > 0) {
                edit_sequence.push_back(down ? Edit::Insert(prev_y) : Edit::Delete(prev_x));
            }

            x = prev_x;
            y = prev_y;
        }

        std::reverse(edit_sequence.begin(), edit_sequence.end());
    }

    template <typename IndexType>
    DiffResult
    diff_impl() {
        DiffResult result;

        Trace<IndexType> trace;
        const int64_t edit_distance = forward_pass(trace);

        if (edit_distance < 0) {
            result.status = DiffResultStatus::Failed;
            return result;
        } else if (edit_distance == 0) {
            result.status = DiffResultStatus::NoChanges;
            return result;
        }

        backtrack(trace, result.edit_sequence);
        result.status = DiffResultStatus::OK;
        return result;
    }
};

}  // namespace patchy
