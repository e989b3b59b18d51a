#ifndef TRAJECTORY_ANALYZER_H
#define TRAJECTORY_ANALYZER_H

#include <stdint.h>
#include <stddef.h>
#include "shared_types.h"

struct TrendConfig {
    size_t windowSize;          // samples required before classifying
    float noiseThresholdCmS;    // |dy/dt| below this is jitter
    int expectedXSign;          // +1 or -1: side of an approaching visitor
};

struct TrendFit {
    float slopeMmS;   // dy/dt, negative = closing in
    float meanX;      // mm
};

// Least-squares fit of y over time plus mean x. False if the fit is undefined.
bool fitTrend(const TargetObservation* samples, size_t count, TrendFit& fit);

// NEUTRAL when fewer than cfg.windowSize samples or inside the noise band.
IntentStatus classifyTrend(const TargetObservation* samples, size_t count, const TrendConfig& cfg);

/*
 * Sliding window of the newest radar samples, oldest first.
 */
class TrajectoryAnalyzer {
public:
    explicit TrajectoryAnalyzer(const TrendConfig& cfg);

    void addSample(const TargetObservation& obs);
    void clear();

    size_t size() const { return _count; }
    bool isFull() const { return _count >= _cfg.windowSize; }
    bool empty() const { return _count == 0; }
    const TargetObservation& latest() const { return _samples[_count - 1]; }

    IntentStatus classify() const;

    static constexpr size_t MAX_WINDOW = 32;

private:
    TrendConfig _cfg;
    TargetObservation _samples[MAX_WINDOW];
    size_t _count;
};

#endif
