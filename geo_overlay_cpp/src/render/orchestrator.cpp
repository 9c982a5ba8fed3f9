#include "geo_overlay/render/orchestrator.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/image/codec.hpp"

#include <chrono>
#include <iostream>

namespace geo_overlay::render {

RenderOrchestrator::RenderOrchestrator(std::vector<Renderer*> renderers) {
    for (auto* r : renderers) {
        if (r) renderers_.push_back(r);
    }
}

RenderOutcome RenderOrchestrator::render(const RenderRequest& request) const {
    RenderOutcome outcome;

    for (Renderer* renderer : renderers_) {
        RenderAttempt attempt;
        attempt.renderer = renderer->name();
        auto t0 = std::chrono::steady_clock::now();

        try {
            RasterImage image = renderer->render(request);
            if (image.empty()) {
                throw CompositeError(attempt.renderer + " returned an empty image");
            }
            if (image.cols != request.width || image.rows != request.height) {
                image = image::resize_fill(image, request.width, request.height);
            }
            std::vector<uint8_t> png = image::encode_png(image);

            attempt.success = true;
            attempt.elapsed_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - t0).count();
            outcome.attempts.push_back(attempt);

            outcome.status = RenderStatus::RENDERED;
            outcome.renderer = attempt.renderer;
            outcome.image = std::move(image);
            outcome.png = std::move(png);
            outcome.reason.clear();
            std::cerr << "[Orchestrator] " << request.name << ": rendered by " << attempt.renderer
                      << " in " << static_cast<long>(attempt.elapsed_ms) << " ms" << std::endl;
            return outcome;
        } catch (const std::exception& e) {
            attempt.error = e.what();
        }

        attempt.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[Orchestrator] " << request.name << ": " << attempt.renderer
                  << " failed: " << attempt.error << std::endl;
        outcome.reason = attempt.renderer + ": " + attempt.error;
        outcome.attempts.push_back(std::move(attempt));
    }

    outcome.status = RenderStatus::FAILED;
    if (renderers_.empty()) {
        outcome.reason = "no renderer configured";
    }
    std::cerr << "[Orchestrator] " << request.name << ": no image available (" << outcome.reason
              << ")" << std::endl;
    return outcome;
}

std::vector<RenderOutcome> RenderOrchestrator::render_batch(const std::vector<RenderRequest>& requests,
                                                            const ItemCallback& on_item) const {
    std::vector<RenderOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        outcomes.push_back(render(requests[i]));
        if (on_item) on_item(i, requests[i], outcomes.back());
    }
    return outcomes;
}

} // namespace geo_overlay::render
