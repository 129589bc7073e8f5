#pragma once

#include <chrono>
#include <cstdint>

// 微秒精度的墙钟时间点；0 表示无效（一次性定时器触发后置为无效）
class Timestamp {
public:
    static constexpr int64_t kMicroSecondsPerSecond = 1000 * 1000;

    Timestamp() = default;
    explicit Timestamp(int64_t microSecondsSinceEpoch) : microSecondsSinceEpoch_(microSecondsSinceEpoch) {}

    static Timestamp now() {
        const auto since = std::chrono::system_clock::now().time_since_epoch();
        return Timestamp(std::chrono::duration_cast<std::chrono::microseconds>(since).count());
    }

    int64_t getMicroSecondsSinceEpoch() const { return microSecondsSinceEpoch_; }
    bool valid() const { return microSecondsSinceEpoch_ > 0; }

private:
    int64_t microSecondsSinceEpoch_ = 0;
};

inline bool operator<(Timestamp lhs, Timestamp rhs) {
    return lhs.getMicroSecondsSinceEpoch() < rhs.getMicroSecondsSinceEpoch();
}

inline bool operator==(Timestamp lhs, Timestamp rhs) {
    return lhs.getMicroSecondsSinceEpoch() == rhs.getMicroSecondsSinceEpoch();
}

// 定时器到期时间 = 基准时间 + seconds（可为小数）
inline Timestamp addTime(Timestamp base, double seconds) {
    const auto delta = static_cast<int64_t>(seconds * Timestamp::kMicroSecondsPerSecond);
    return Timestamp(base.getMicroSecondsSinceEpoch() + delta);
}
