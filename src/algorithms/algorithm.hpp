#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <vector>

namespace patchy {

enum class EditType {
    Delete,
    Insert,
    Common,
};

// Index into A or B. Insertions have no A index and deletions no B index.
struct EditIndex {
    bool valid = false;
    int64_t value = 0;

    EditIndex() = default;

    EditIndex(int64_t in_value) : valid(true), value(in_value) {
    }

    operator int64_t() const {
        return value;
    }
};

// One step in the edit script that turns A into B.
struct Edit {
    EditType type;

    EditIndex a_index;
    EditIndex b_index;

    static Edit
    Delete(int64_t a) {
        return {EditType::Delete, a, {}};
    }

    static Edit
    Insert(int64_t b) {
        return {EditType::Insert, {}, b};
    }

    static Edit
    Common(int64_t a, int64_t b) {
        return {EditType::Common, a, b};
    }
};

enum class DiffResultStatus {
    OK,
    Failed,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<Unit> A;
    gsl::span<Unit> B;
};

struct DiffResult {
    DiffResultStatus status = DiffResultStatus::Failed;
    std::vector<Edit> edit_sequence;
};

// Base for the sequence diff algorithms. Units are compared with ==.
template <typename Unit>
class Algorithm {
   public:
    explicit Algorithm(DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    // Only called with two non-empty inputs.
    virtual DiffResult
    diff() = 0;

    // The edit script for any input. When nothing changed the status is
    // NoChanges and the script lists every unit as common.
    DiffResult
    compute() {
        const auto n = static_cast<int64_t>(diff_input_.A.size());
        const auto m = static_cast<int64_t>(diff_input_.B.size());

        DiffResult result;
        if (n == 0 || m == 0) {
            for (int64_t i = 0; i < n; i++) {
                result.edit_sequence.push_back(Edit::Delete(i));
            }
            for (int64_t j = 0; j < m; j++) {
                result.edit_sequence.push_back(Edit::Insert(j));
            }
            result.status = n + m == 0 ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
            return result;
        }

        result = diff();
        if (result.status == DiffResultStatus::NoChanges) {
            result.edit_sequence.clear();
            for (int64_t i = 0; i < n; i++) {
                result.edit_sequence.push_back(Edit::Common(i, i));
            }
        }
        return result;
    }

   protected:
    DiffInput<Unit>& diff_input_;
};

}  // namespace patchy
