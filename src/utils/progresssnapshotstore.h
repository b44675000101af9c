/**
 * @file progresssnapshotstore.h
 * @brief Time-windowed progress samples for throughput and ETA estimation.
 *
 * Keeps the samples observed during the trailing window and derives
 * processing speed and remaining time from the oldest and newest of them.
 */

#ifndef PROGRESSSNAPSHOTSTORE_H
#define PROGRESSSNAPSHOTSTORE_H

#include <QtGlobal>

#include <algorithm>
#include <deque>
#include <optional>

/**
 * @brief A single progress sample taken from a job status response.
 */
struct ProgressSnapshot {
    qint64 timestampMs = 0;       ///< Wall-clock time the sample was taken
    double progressPercent = 0.0; ///< Reported progress in [0, 100]
    qint64 processedCount = 0;    ///< Items processed so far
};

/**
 * @brief Sliding time window of progress samples.
 *
 * Samples older than the window (relative to the newest sample) are pruned
 * on every insert. Throughput and ETA are only available once at least two
 * samples span a positive amount of time; until then they are std::nullopt
 * rather than zero.
 *
 * @par Example usage:
 * @code
 * ProgressSnapshotStore store;           // 30 second window
 * store.addSnapshot({0, 0.0, 0});
 * store.addSnapshot({1000, 25.0, 2});
 * if (auto speed = store.itemsPerSecond()) {
 *     qDebug() << *speed << "items/s";   // 2
 * }
 * @endcode
 */
class ProgressSnapshotStore
{
public:
    /// Default retention window in milliseconds
    static constexpr qint64 DefaultWindowMs = 30000;

    /// Samples needed before speed or ETA can be derived
    static constexpr size_t MinimumSamples = 2;

    /**
     * @brief Constructs a store with the given retention window.
     * @param windowMs Samples older than this (relative to the newest) are dropped.
     */
    explicit ProgressSnapshotStore(qint64 windowMs = DefaultWindowMs)
        : windowMs_(windowMs)
    {
    }

    /**
     * @brief Appends a sample and prunes everything outside the window.
     * @param snapshot The new sample. Timestamps are expected to be non-decreasing.
     */
    void addSnapshot(const ProgressSnapshot &snapshot)
    {
        snapshots_.push_back(snapshot);

        const qint64 cutoff = snapshot.timestampMs - windowMs_;
        while (!snapshots_.empty() && snapshots_.front().timestampMs < cutoff) {
            snapshots_.pop_front();
        }
    }

    /**
     * @brief Processing speed between the oldest and newest retained samples.
     * @return Items per second, or std::nullopt with fewer than two samples
     *         or when the samples share a timestamp.
     */
    [[nodiscard]] std::optional<double> itemsPerSecond() const
    {
        if (!hasEnoughHistory()) {
            return std::nullopt;
        }

        const double elapsedSec = elapsedMs() / 1000.0;
        if (elapsedSec <= 0.0) {
            return std::nullopt;
        }

        const auto processed = static_cast<double>(
            snapshots_.back().processedCount - snapshots_.front().processedCount);
        return processed / elapsedSec;
    }

    /**
     * @brief Estimated milliseconds until progress reaches 100%.
     * @return The estimate floored at 0, or std::nullopt if progress did not
     *         increase across the window.
     */
    [[nodiscard]] std::optional<qint64> etaMs() const
    {
        if (!hasEnoughHistory()) {
            return std::nullopt;
        }

        const double elapsed = elapsedMs();
        const double progressDelta =
            snapshots_.back().progressPercent - snapshots_.front().progressPercent;
        if (elapsed <= 0.0 || progressDelta <= 0.0) {
            return std::nullopt;
        }

        const double remaining = 100.0 - snapshots_.back().progressPercent;
        const double eta = remaining / progressDelta * elapsed;
        return static_cast<qint64>(std::max(0.0, eta));
    }

    /**
     * @brief Returns whether enough samples exist to derive metrics.
     */
    [[nodiscard]] bool hasEnoughHistory() const
    {
        return snapshots_.size() >= MinimumSamples;
    }

    /**
     * @brief Returns the number of retained samples.
     */
    [[nodiscard]] size_t count() const { return snapshots_.size(); }

    /**
     * @brief Returns whether no samples are retained.
     */
    [[nodiscard]] bool isEmpty() const { return snapshots_.empty(); }

    /**
     * @brief Returns the oldest retained sample. Must not be called when empty.
     */
    [[nodiscard]] const ProgressSnapshot &oldest() const { return snapshots_.front(); }

    /**
     * @brief Returns the newest retained sample. Must not be called when empty.
     */
    [[nodiscard]] const ProgressSnapshot &newest() const { return snapshots_.back(); }

    /**
     * @brief Returns the retention window in milliseconds.
     */
    [[nodiscard]] qint64 windowMs() const { return windowMs_; }

    /**
     * @brief Drops all samples.
     */
    void clear() { snapshots_.clear(); }

private:
    [[nodiscard]] double elapsedMs() const
    {
        return static_cast<double>(snapshots_.back().timestampMs - snapshots_.front().timestampMs);
    }

    qint64 windowMs_;
    std::deque<ProgressSnapshot> snapshots_;
};

#endif // PROGRESSSNAPSHOTSTORE_H
