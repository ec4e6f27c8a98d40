#include "progressreporter.h"

#include <QMutexLocker>

#include <utility>

ProgressReporter::ProgressReporter(ProgressCallback callback)
    : m_callback(std::move(callback))
{
}

void ProgressReporter::report(AnalysisPhase phase, int current, int maximum, const QString &message)
{
    AnalysisProgress progress;
    progress.phase = phase;
    progress.current = current;
    progress.maximum = maximum;
    progress.message = message;
    deliver(progress);
}

void ProgressReporter::reportIndeterminate(AnalysisPhase phase, int current, const QString &message)
{
    AnalysisProgress progress;
    progress.phase = phase;
    progress.current = current;
    progress.message = message;
    progress.indeterminate = true;
    deliver(progress);
}

void ProgressReporter::reportComplete(const QString &message, int total)
{
    report(AnalysisPhase::Complete, total, total, message);
}

void ProgressReporter::reportCancelled(const QString &message)
{
    AnalysisProgress progress;
    progress.phase = AnalysisPhase::Cancelled;
    progress.message = message;
    deliver(progress);
}

void ProgressReporter::deliver(AnalysisProgress progress)
{
    if (!m_callback) {
        return;
    }

    QMutexLocker locker(&m_mutex);

    if (progress.phase == m_lastPhase && progress.current < m_lastCurrent) {
        progress.current = m_lastCurrent;
    }
    m_lastPhase = progress.phase;
    m_lastCurrent = progress.current;

    m_callback(progress);
}
