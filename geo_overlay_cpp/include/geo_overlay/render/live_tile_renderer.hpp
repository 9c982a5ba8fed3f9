#pragma once

#include "geo_overlay/browser/browser_pool.hpp"
#include "geo_overlay/config/configuration.hpp"
#include "geo_overlay/render/renderer.hpp"

namespace geo_overlay::render {

// Primary renderer: the basemap and the remote index tiles are drawn by the
// same map widget in a pooled headless browser, then screenshotted.
//
// The API key is checked before the browser is touched, so a missing key
// fails fast with ConfigurationError without launching anything.
class LiveTileRenderer : public Renderer {
public:
    LiveTileRenderer(browser::BrowserPool& pool, config::LiveConfig cfg, std::string basemap_api_key);

    std::string name() const override { return "live"; }

    RasterImage render(const RenderRequest& request) override;

private:
    browser::BrowserPool& pool_;
    config::LiveConfig cfg_;
    std::string api_key_;
};

} // namespace geo_overlay::render
