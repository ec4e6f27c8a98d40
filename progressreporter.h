#ifndef PROGRESSREPORTER_H
#define PROGRESSREPORTER_H

#include "datamodels.h"

#include <QMutex>

/**
 * @brief Serializes progress reports from worker threads into one callback
 *
 * A null callback is allowed. Within a phase the reported current value
 * never goes backwards, even when workers finish out of order.
 */
class ProgressReporter
{
public:
    explicit ProgressReporter(ProgressCallback callback);

    void report(AnalysisPhase phase, int current, int maximum, const QString &message);
    void reportIndeterminate(AnalysisPhase phase, int current, const QString &message);
    void reportComplete(const QString &message, int total = 0);
    void reportCancelled(const QString &message);

private:
    void deliver(AnalysisProgress progress);

    ProgressCallback m_callback;
    QMutex m_mutex;
    AnalysisPhase m_lastPhase = AnalysisPhase::Idle;
    int m_lastCurrent = 0;
};

#endif // PROGRESSREPORTER_H
