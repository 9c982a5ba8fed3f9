#pragma once

#include "geo_overlay/core/types.hpp"

#include <string>

namespace geo_overlay::render {

// One strategy for turning a RenderRequest into the final image. Failures are
// reported by throwing a GeoOverlayError subclass; the orchestrator turns them
// into a FAILED outcome.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual std::string name() const = 0;

    virtual RasterImage render(const RenderRequest& request) = 0;
};

} // namespace geo_overlay::render
