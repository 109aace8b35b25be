#pragma once

#include "../model/Frame.hpp"

#include "mclink/Result.hpp"

namespace tcheck::station
{
    class IFrameSource
    {
    public:
        virtual ~IFrameSource() = default;
        virtual auto grab() -> mclink::Result<model::Frame> = 0;

        /** Restarts a recorded source at its first frame. Live cameras ignore it. */
        virtual void rewind() {}
    };
}
