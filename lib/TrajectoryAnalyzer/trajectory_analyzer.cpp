#include "trajectory_analyzer.h"

bool fitTrend(const TargetObservation* samples, size_t count, TrendFit& fit) {
    if (count < 2) return false;

    // Times relative to the oldest sample keep the sums small
    const uint32_t t0 = samples[0].timestampMs;
    double sumT = 0.0, sumY = 0.0, sumX = 0.0;
    for (size_t i = 0; i < count; i++) {
        sumT += (double)(samples[i].timestampMs - t0) / 1000.0;
        sumY += samples[i].y;
        sumX += samples[i].x;
    }
    const double meanT = sumT / count;
    const double meanY = sumY / count;

    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < count; i++) {
        double dt = (double)(samples[i].timestampMs - t0) / 1000.0 - meanT;
        sxy += dt * (samples[i].y - meanY);
        sxx += dt * dt;
    }
    if (sxx <= 0.0) return false;

    fit.slopeMmS = (float)(sxy / sxx);
    fit.meanX = (float)(sumX / count);
    return true;
}

IntentStatus classifyTrend(const TargetObservation* samples, size_t count, const TrendConfig& cfg) {
    if (count < cfg.windowSize) return INTENT_NEUTRAL;

    TrendFit fit;
    if (!fitTrend(samples, count, fit)) return INTENT_NEUTRAL;

    const float thresholdMmS = cfg.noiseThresholdCmS * 10.0f;

    if (fit.slopeMmS < -thresholdMmS) {
        bool expectedSide = (cfg.expectedXSign < 0) ? (fit.meanX < 0.0f) : (fit.meanX > 0.0f);
        return expectedSide ? INTENT_COMING : INTENT_LEAVING;
    }
    if (fit.slopeMmS > thresholdMmS) {
        return INTENT_LEAVING;
    }
    return INTENT_NEUTRAL;
}

TrajectoryAnalyzer::TrajectoryAnalyzer(const TrendConfig& cfg)
    : _cfg(cfg), _count(0) {
    if (_cfg.windowSize < 2) _cfg.windowSize = 2;
    if (_cfg.windowSize > MAX_WINDOW) _cfg.windowSize = MAX_WINDOW;
}

void TrajectoryAnalyzer::addSample(const TargetObservation& obs) {
    if (_count == _cfg.windowSize) {
        for (size_t i = 0; i + 1 < _count; i++) {
            _samples[i] = _samples[i + 1];
        }
        _samples[_count - 1] = obs;
    } else {
        _samples[_count++] = obs;
    }
}

void TrajectoryAnalyzer::clear() {
    _count = 0;
}

IntentStatus TrajectoryAnalyzer::classify() const {
    return classifyTrend(_samples, _count, _cfg);
}
