#pragma once

#include <functional>
#include <string>

// Aggregate of binary measurement outcomes across every shot of one run.
// Produced by an execution service; read-only to the estimator.
struct OutcomeTally {
    int count_zero = 0;
    int count_one = 0;

    int shots() const { return count_zero + count_one; }
};

inline bool operator==(const OutcomeTally& lhs, const OutcomeTally& rhs) {
    return lhs.count_zero == rhs.count_zero && lhs.count_one == rhs.count_one;
}

inline bool operator!=(const OutcomeTally& lhs, const OutcomeTally& rhs) {
    return !(lhs == rhs);
}

inline constexpr int kRunLevelShot = -1;

struct ExecutionLog {
    int shot = kRunLevelShot;
    std::string category;
    std::string message;
};

using LogSink = std::function<void(const ExecutionLog&)>;
