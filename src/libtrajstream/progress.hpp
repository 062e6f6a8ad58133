#ifndef __PROGRESS_HPP__
#define __PROGRESS_HPP__

#include "pch.hpp"

struct ParseProgress
{
    double current = 0;
    double total = 100;
    std::string stage;
};

typedef std::function<void(const ParseProgress&)> ProgressCallback;

// One-way notification channel for long scans. The receiver can neither 
// block the scan nor abort it: anything it throws is reported and dropped.
class ProgressReporter
{
public:
    explicit ProgressReporter(ProgressCallback onProgress = nullptr);

    void report(double dCurrent, double dTotal, const std::string& sStage) const noexcept;

    // reporter for a sub-stage, mapping its [0, 100] range onto [dFrom, dTo]
    // of this reporter and prefixing its stage names
    ProgressReporter scaled(double dFrom, double dTo, const std::string& sPrefix) const;

    // callback forwarding to report(), empty if this reporter has no receiver
    ProgressCallback callback() const;

    inline explicit operator bool() const { return static_cast<bool>(m_onProgress); }

private:
    ProgressCallback m_onProgress;
};

#endif
