#include "timeline.hpp"

#include <algorithm>

EventBatch Timeline::order(const EventBatch &batch)
{
    EventBatch ordered = batch;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SeismicEvent &a, const SeismicEvent &b) {
                         return a.occurredAt.toMSecsSinceEpoch() < b.occurredAt.toMSecsSinceEpoch();
                     });
    return ordered;
}

bool Timeline::isOrdered(const EventBatch &batch)
{
    return std::is_sorted(batch.cbegin(), batch.cend(),
                          [](const SeismicEvent &a, const SeismicEvent &b) {
                              return a.occurredAt.toMSecsSinceEpoch() < b.occurredAt.toMSecsSinceEpoch();
                          });
}
