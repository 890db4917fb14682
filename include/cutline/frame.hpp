#pragma once

#include <cstdint>

namespace cutline
{

struct Frame
{
    double   timestamp_ms = 0.0;   // Host timestamp handed to frame callbacks
    float    elapsed_sec  = 0.0f;
    float    dt           = 0.0f;
    uint64_t number       = 0;

    float    elapsed_seconds() const { return elapsed_sec; }
    float    delta_time() const { return dt; }
    uint64_t frame_number() const { return number; }
};

}   // namespace cutline
