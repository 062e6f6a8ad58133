#include "pch.hpp"
#include "progress.hpp"
#include "exception.hpp"

using namespace std;

ProgressReporter::ProgressReporter(ProgressCallback onProgress)
    : m_onProgress(std::move(onProgress))
{}

void ProgressReporter::report(double dCurrent, double dTotal, const std::string& sStage) const noexcept
{
    if(!m_onProgress)
        return;

    try 
    {
        m_onProgress(ParseProgress{dCurrent, dTotal, sStage});
    }
    catch(const exception& e)
    {
        cerr << "WARNING: progress callback failed (" << describe_exception(e) << "), continuing\n";
    }
    catch(...)
    {
        cerr << "WARNING: progress callback threw a non-standard exception, continuing\n";
    }
}

ProgressReporter ProgressReporter::scaled(double dFrom, double dTo, const std::string& sPrefix) const
{
    if(!m_onProgress)
        return ProgressReporter();

    // capture the parent by value, the sub-reporter may outlive this object
    ProgressReporter parent = *this;
    return ProgressReporter([parent, dFrom, dTo, sPrefix](const ParseProgress& progress) {
        const double dFraction = progress.total > 0 ? progress.current / progress.total : 0;
        parent.report(dFrom + dFraction * (dTo - dFrom), 100, sPrefix + progress.stage);
    });
}

ProgressCallback ProgressReporter::callback() const
{
    if(!m_onProgress)
        return nullptr;

    ProgressReporter reporter = *this;
    return [reporter](const ParseProgress& progress) {
        reporter.report(progress.current, progress.total, progress.stage);
    };
}
