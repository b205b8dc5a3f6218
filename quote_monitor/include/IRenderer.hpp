#pragma once
#include "QuoteTypes.hpp"

class IRenderer {
public:
    virtual ~IRenderer() = default;

    // Called from the render thread only, one snapshot at a time
    virtual void render(const RenderSnapshot& snap) = 0;
};
