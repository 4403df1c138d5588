#pragma once
#include "seismic_event.hpp"

class Timeline
{
public:
    // Ascending by occurrence time. Events with equal times keep their
    // feed order.
    static EventBatch order(const EventBatch &batch);

    static bool isOrdered(const EventBatch &batch);
};
