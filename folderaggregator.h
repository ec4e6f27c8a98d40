#ifndef FOLDERAGGREGATOR_H
#define FOLDERAGGREGATOR_H

#include "cancellation.h"
#include "datamodels.h"

#include <QFuture>

class CacheStore;

/**
 * @brief Turns file-level matches into folder-level matches and filters them
 */
class FolderAggregator
{
public:
    /**
     * @brief Group file matches by folder pair on a worker thread
     * @param fileMatches Canonical file matches
     * @param cache Cache holding FolderInfo for every folder referenced; must outlive the future
     * @param progress Progress sink, may be null; called from the worker thread
     * @param token Cancellation token
     * @return Future resolving to folder matches sorted by descending similarity
     */
    static QFuture<AnalysisResult<QList<FolderMatch>>> aggregateFolderMatchesAsync(const QList<FileMatch> &fileMatches,
                                                                                    const CacheStore &cache,
                                                                                    const ProgressCallback &progress = ProgressCallback(),
                                                                                    const CancellationToken &token = CancellationToken());

    /**
     * @brief Blocking form of aggregateFolderMatchesAsync()
     */
    static AnalysisResult<QList<FolderMatch>> aggregateFolderMatches(const QList<FileMatch> &fileMatches,
                                                                     const CacheStore &cache,
                                                                     const CancellationToken &token = CancellationToken());

    /**
     * @brief Keep the matches that satisfy every criterion
     *
     * Pure function. A match without a date fails any date bound.
     */
    static QList<FolderMatch> applyFilters(const QList<FolderMatch> &matches, const FilterCriteria &criteria);

    static bool matchesCriteria(const FolderMatch &match, const FilterCriteria &criteria);

private:
    static AnalysisResult<QList<FolderMatch>> aggregate(const QList<FileMatch> &fileMatches,
                                                        const CacheStore &cache,
                                                        const ProgressCallback &progress,
                                                        const CancellationToken &token);
};

#endif // FOLDERAGGREGATOR_H
