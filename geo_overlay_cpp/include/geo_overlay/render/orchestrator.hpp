#pragma once

#include "geo_overlay/render/renderer.hpp"

#include <functional>
#include <vector>

namespace geo_overlay::render {

// Ordered fallback over renderers: the first one that returns an image wins,
// each renderer is tried at most once per request, and total failure is a
// FAILED outcome rather than an exception. Renderers are not owned.
class RenderOrchestrator {
public:
    using ItemCallback = std::function<void(size_t index, const RenderRequest&, const RenderOutcome&)>;

    explicit RenderOrchestrator(std::vector<Renderer*> renderers);

    RenderOutcome render(const RenderRequest& request) const;

    // Renders every request in order; a FAILED item does not stop the batch.
    std::vector<RenderOutcome> render_batch(const std::vector<RenderRequest>& requests,
                                            const ItemCallback& on_item = nullptr) const;

    const std::vector<Renderer*>& renderers() const { return renderers_; }

private:
    std::vector<Renderer*> renderers_;
};

} // namespace geo_overlay::render
