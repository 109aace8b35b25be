#pragma once

#include <cstdint>
#include <vector>

namespace tcheck::model
{
    /**
     * Image handed from a frame source to the detectors. Moved, never shared.
     */
    struct Frame
    {
        uint64_t sequence{ 0 };
        int width{ 0 };
        int height{ 0 };
        std::vector<uint8_t> pixels;
    };
}
