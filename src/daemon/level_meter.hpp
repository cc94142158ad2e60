#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <span>

// Maps capture buffers to a 0..1 speech level for live feedback.
// Written from the capture thread, read from anywhere.
class LevelMeter {
public:
    static constexpr float kMinDecibels = -35.0f;  // silence floor
    static constexpr float kMaxDecibels = -20.0f;  // speech peak
    static constexpr float kCurveExponent = 0.5f;
    static constexpr float kVisualBoost = 2.5f;
    static constexpr float kSmoothing = 0.8f;      // weight of the newest value

    void update(std::span<const int16_t> samples) {
        if (samples.empty()) return;

        double sum = 0.0;
        for (int16_t s : samples) {
            double v = s / 32768.0;
            sum += v * v;
        }
        float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
        float db = rms > 0.0f ? 20.0f * std::log10(rms) : -160.0f;

        float target = normalize(db);
        float old = level_.load(std::memory_order_relaxed);
        level_.store(old * (1.0f - kSmoothing) + target * kSmoothing, std::memory_order_relaxed);
    }

    float level() const { return level_.load(std::memory_order_relaxed); }
    void reset() { level_.store(0.0f, std::memory_order_relaxed); }

    // dB -> amplitude -> normalized within the speech window -> sqrt curve, boosted.
    static float normalize(float db) {
        if (db < kMinDecibels) return 0.0f;
        float clamped = std::min(db, kMaxDecibels);
        float amp = std::pow(10.0f, 0.05f * clamped);
        float min_amp = std::pow(10.0f, 0.05f * kMinDecibels);
        float max_amp = std::pow(10.0f, 0.05f * kMaxDecibels);
        float normalized = (amp - min_amp) / (max_amp - min_amp);
        return std::min(std::pow(normalized, kCurveExponent) * kVisualBoost, 1.0f);
    }

private:
    std::atomic<float> level_{0.0f};
};
