#pragma once

#include "../model/Detection.hpp"
#include "../model/Frame.hpp"

#include "mclink/Result.hpp"

namespace tcheck::vision
{
    /**
     * Object detection model of one camera. Implementations report every
     * detection they find; confidence floors are applied by the interpreters.
     */
    class IDetector
    {
    public:
        virtual ~IDetector() = default;
        virtual auto infer(const model::Frame& frame) -> mclink::Result<model::Detections> = 0;
    };
}
