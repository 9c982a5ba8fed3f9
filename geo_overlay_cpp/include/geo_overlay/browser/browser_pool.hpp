#pragma once

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace geo_overlay::browser {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct BrowserOptions {
    std::string executable;               // empty = resolve_browser_executable("")
    std::vector<std::string> extra_args;
    int launch_timeout_ms = 10000;
    int command_timeout_ms = 15000;
};

// Chooses the browser binary once: the configured path, then the
// GEO_OVERLAY_BROWSER environment variable, then well-known install
// locations. Throws ConfigurationError when nothing executable is found.
std::string resolve_browser_executable(const std::string& configured);

// Command line used to start the browser with the DevTools protocol on fds 3/4
std::vector<std::string> browser_command_line(const std::string& executable,
                                              const fs::path& user_data_dir,
                                              const std::vector<std::string>& extra_args);

class BrowserPage;

// One headless Chromium process shared by all live renders of this process.
// Started by init() (or lazily by open_page()) and stopped by shutdown() or
// the destructor. DevTools commands from any thread are multiplexed over a
// single pipe and matched to replies by id.
class BrowserPool {
public:
    explicit BrowserPool(BrowserOptions options);
    ~BrowserPool();

    BrowserPool(const BrowserPool&) = delete;
    BrowserPool& operator=(const BrowserPool&) = delete;

    void init();
    void shutdown();
    bool running() const;

    // Opens a page in its own browser context. Pages share the process but
    // no cookies, cache or navigation state.
    std::unique_ptr<BrowserPage> open_page();

    // Sends a DevTools command and blocks for its reply. timeout_ms < 0 uses
    // the configured command timeout. Throws BrowserError for error replies or
    // a dead browser, RenderTimeoutError when no reply arrives in time.
    json send(const std::string& method, const json& params = json::object(),
              const std::string& session_id = "", int timeout_ms = -1);

private:
    struct Pending {
        bool done = false;
        json reply;
    };

    void launch();
    void reader_loop(int fd);
    void fail_pending(const std::string& reason);
    void reap_process();

    BrowserOptions options_;

    std::mutex lifecycle_mutex_;   // serializes init/shutdown
    std::mutex write_mutex_;       // one message on the pipe at a time

    mutable std::mutex mutex_;     // guards everything below
    std::condition_variable cv_;
    bool running_ = false;
    std::string failure_;
    pid_t pid_ = -1;
    int fd_ = -1;
    int next_id_ = 1;
    std::map<int, Pending> pending_;

    std::thread reader_;
    fs::path user_data_dir_;
};

// A page session inside the pooled browser. Closed on destruction, so a
// page held in a scope is released on every exit path.
class BrowserPage {
public:
    ~BrowserPage();

    BrowserPage(const BrowserPage&) = delete;
    BrowserPage& operator=(const BrowserPage&) = delete;

    const std::string& target_id() const { return target_id_; }

    json send(const std::string& method, const json& params = json::object(), int timeout_ms = -1);

    void set_viewport(int width, int height);
    void set_content(const std::string& html);

    // Runtime.evaluate with returnByValue. Throws BrowserError when the
    // expression throws in the page.
    json evaluate(const std::string& expression, bool await_promise = false);

    // Polls until the expression is truthy. false on timeout.
    bool wait_for(const std::string& expression, int timeout_ms, int poll_interval_ms);

    std::vector<uint8_t> screenshot_png(int width, int height);

    void close();

private:
    friend class BrowserPool;
    explicit BrowserPage(BrowserPool& pool);

    BrowserPool& pool_;
    std::string context_id_;
    std::string target_id_;
    std::string session_id_;
    bool closed_ = false;
};

} // namespace geo_overlay::browser
