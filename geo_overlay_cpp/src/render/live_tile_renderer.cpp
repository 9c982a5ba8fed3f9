#include "geo_overlay/render/live_tile_renderer.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/render/live_overlay_page.hpp"

#include <chrono>
#include <iostream>

namespace geo_overlay::render {

LiveTileRenderer::LiveTileRenderer(browser::BrowserPool& pool, config::LiveConfig cfg,
                                   std::string basemap_api_key)
    : pool_(pool), cfg_(std::move(cfg)), api_key_(std::move(basemap_api_key)) {}

RasterImage LiveTileRenderer::render(const RenderRequest& request) {
    validate_basemap_api_key(api_key_);
    if (request.width < 1 || request.height < 1) {
        throw ValidationError("requested size must be positive");
    }

    LiveOverlayRenderer overlay =
        LiveOverlayRenderer::for_request(request, cfg_.settle_delay_ms, cfg_.hard_timeout_ms);
    std::cerr << "[LiveRender] " << request.name << ": zoom " << overlay.zoom << ", "
              << overlay.tile_urls.size() << " overlay tiles" << std::endl;

    auto t0 = std::chrono::steady_clock::now();
    auto page = pool_.open_page();
    page->set_viewport(request.width, request.height);
    page->set_content(overlay.html(api_key_));

    bool done = page->wait_for("window.renderComplete === true || !!window.renderError",
                               cfg_.completion_timeout_ms, cfg_.poll_interval_ms);
    if (!done) {
        throw RenderTimeoutError("no completion signal within " +
                                 std::to_string(cfg_.completion_timeout_ms) + " ms");
    }

    auto page_error = page->evaluate("window.renderError");
    if (page_error.is_string()) {
        throw BrowserError(page_error.get<std::string>());
    }
    auto reason = page->evaluate("window.renderReason || ''");
    if (reason.is_string() && reason.get<std::string>() == "timeout") {
        std::cerr << "[LiveRender] Hard timeout reached, capturing partial tiles" << std::endl;
    }

    RasterImage shot = image::decode_image(page->screenshot_png(request.width, request.height));
    page->close();

    if (shot.cols != request.width || shot.rows != request.height) {
        std::cerr << "[LiveRender] Screenshot " << shot.cols << "x" << shot.rows
                  << " resized to " << request.width << "x" << request.height << std::endl;
        shot = image::resize_fill(shot, request.width, request.height);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    std::cerr << "[LiveRender] " << request.name << " captured in " << elapsed << " ms" << std::endl;
    return shot;
}

} // namespace geo_overlay::render
