#ifndef SOURCE_STATS_HPP
#define SOURCE_STATS_HPP

#include <QtGlobal>

struct SourceStats {
    double durationSeconds;
    qint64 audioBitrateBps;
};

#endif
