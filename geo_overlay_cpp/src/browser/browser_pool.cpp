#include "geo_overlay/browser/browser_pool.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace geo_overlay::browser {

namespace {

const char* const kWellKnownBrowsers[] = {
    "/usr/bin/chromium",
    "/usr/bin/chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/opt/google/chrome/chrome",
    "/snap/bin/chromium",
};

bool is_executable(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

bool send_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

fs::path make_user_data_dir() {
    std::string tmpl = (fs::temp_directory_path() / "geo_overlay_browser_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        throw BrowserError(std::string("cannot create profile directory: ") + std::strerror(errno));
    }
    return fs::path(buf.data());
}

} // namespace

std::string resolve_browser_executable(const std::string& configured) {
    if (!configured.empty()) {
        if (!is_executable(configured)) {
            throw ConfigurationError("browser executable not found or not executable: " + configured);
        }
        return configured;
    }

    if (const char* env = std::getenv("GEO_OVERLAY_BROWSER")) {
        std::string path = core::trim(env);
        if (!path.empty()) {
            if (!is_executable(path)) {
                throw ConfigurationError("GEO_OVERLAY_BROWSER is not executable: " + path);
            }
            return path;
        }
    }

    for (const char* candidate : kWellKnownBrowsers) {
        if (is_executable(candidate)) return candidate;
    }
    throw ConfigurationError("no headless browser found; set live.browser_executable or GEO_OVERLAY_BROWSER");
}

std::vector<std::string> browser_command_line(const std::string& executable,
                                              const fs::path& user_data_dir,
                                              const std::vector<std::string>& extra_args) {
    std::vector<std::string> args = {
        executable,
        "--headless=new",
        "--remote-debugging-pipe",
        "--no-sandbox",
        "--disable-gpu",
        "--disable-dev-shm-usage",
        "--disable-extensions",
        "--disable-background-networking",
        "--hide-scrollbars",
        "--mute-audio",
        "--no-first-run",
        "--no-default-browser-check",
        "--user-data-dir=" + user_data_dir.string(),
    };
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    args.push_back("about:blank");
    return args;
}

// ---------------------------------------------------------------------------
// BrowserPool
// ---------------------------------------------------------------------------

BrowserPool::BrowserPool(BrowserOptions options)
    : options_(std::move(options)) {}

BrowserPool::~BrowserPool() {
    shutdown();
}

bool BrowserPool::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void BrowserPool::init() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
    }
    if (pid_ > 0) {
        // Previous process died on its own; clean it up before relaunching.
        reap_process();
    }
    launch();
}

void BrowserPool::launch() {
    const std::string exe = resolve_browser_executable(options_.executable);
    user_data_dir_ = make_user_data_dir();
    const auto args = browser_command_line(exe, user_data_dir_, options_.extra_args);

    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
        throw BrowserError(std::string("socketpair failed: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::cerr << "[BrowserPool] Launching " << exe << std::endl;

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(sv[0]);
        ::close(sv[1]);
        throw BrowserError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: the protocol reads commands on fd 3 and writes replies on fd 4.
        int s = ::fcntl(sv[1], F_DUPFD, 10);
        if (s < 0 || ::dup2(s, 3) < 0 || ::dup2(s, 4) < 0) ::_exit(126);
        ::close(s);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > 4) ::close(devnull);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(sv[1]);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = pid;
        fd_ = sv[0];
        running_ = true;
        failure_.clear();
    }
    reader_ = std::thread(&BrowserPool::reader_loop, this, sv[0]);

    try {
        json version = send("Browser.getVersion", json::object(), "", options_.launch_timeout_ms);
        std::cerr << "[BrowserPool] Ready: " << version.value("product", std::string("unknown"))
                  << " (pid " << pid << ")" << std::endl;
    } catch (const GeoOverlayError& e) {
        std::cerr << "[BrowserPool] Launch failed: " << e.what() << std::endl;
        reap_process();
        throw ConfigurationError(std::string("browser failed to start: ") + e.what());
    }
}

void BrowserPool::reader_loop(int fd) {
    std::string buffer;
    char chunk[65536];
    std::string reason = "browser closed the DevTools pipe";

    for (;;) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            reason = std::string("DevTools pipe read failed: ") + std::strerror(errno);
            break;
        }
        if (n == 0) break;
        buffer.append(chunk, static_cast<size_t>(n));

        size_t start = 0;
        for (size_t nul = buffer.find('\0'); nul != std::string::npos; nul = buffer.find('\0', start)) {
            std::string message = buffer.substr(start, nul - start);
            start = nul + 1;

            json msg = json::parse(message, nullptr, false);
            if (msg.is_discarded()) {
                std::cerr << "[BrowserPool] Ignoring malformed DevTools message" << std::endl;
                continue;
            }
            if (!msg.is_object() || !msg.contains("id")) continue;  // protocol event
            if (!msg["id"].is_number_integer()) {
                std::cerr << "[BrowserPool] Ignoring DevTools reply with a non-integer id" << std::endl;
                continue;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(msg["id"].get<int>());
            if (it != pending_.end()) {
                it->second.done = true;
                it->second.reply = std::move(msg);
            }
        }
        buffer.erase(0, start);
        cv_.notify_all();
    }

    fail_pending(reason);
}

void BrowserPool::fail_pending(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            std::cerr << "[BrowserPool] " << reason << std::endl;
        }
        running_ = false;
        failure_ = reason;
        for (auto& [id, p] : pending_) {
            if (!p.done) {
                p.done = true;
                p.reply = json{{"error", {{"message", reason}}}};
            }
        }
    }
    cv_.notify_all();
}

json BrowserPool::send(const std::string& method, const json& params,
                       const std::string& session_id, int timeout_ms) {
    int id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw BrowserError(method + ": browser is not running" +
                               (failure_.empty() ? "" : " (" + failure_ + ")"));
        }
        id = next_id_++;
        pending_[id] = Pending{};
    }

    json msg = {{"id", id}, {"method", method}, {"params", params}};
    if (!session_id.empty()) msg["sessionId"] = session_id;
    std::string data = msg.dump();
    data.push_back('\0');

    // The descriptor is read under write_mutex_, which reap_process() also
    // holds while closing it, so a write never reaches a reused fd number.
    bool written = false;
    int write_errno = 0;
    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_) fd = fd_;
        }
        if (fd >= 0) {
            written = send_all(fd, data);
            write_errno = errno;
        } else {
            write_errno = EPIPE;
        }
    }
    if (!written) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        throw BrowserError(method + ": DevTools pipe write failed: " + std::strerror(write_errno));
    }

    const int wait_ms = timeout_ms < 0 ? options_.command_timeout_ms : timeout_ms;
    json reply;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool done = cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                                 [&]() { return pending_[id].done; });
        reply = std::move(pending_[id].reply);
        pending_.erase(id);
        if (!done) {
            throw RenderTimeoutError(method + " got no reply within " + std::to_string(wait_ms) + " ms");
        }
    }

    if (reply.contains("error")) {
        const json& err = reply["error"];
        std::string text = err.is_object() && err.contains("message") && err["message"].is_string()
                               ? err["message"].get<std::string>()
                               : err.dump();
        throw BrowserError(method + ": " + text);
    }
    return reply.value("result", json::object());
}

std::unique_ptr<BrowserPage> BrowserPool::open_page() {
    init();

    std::unique_ptr<BrowserPage> page(new BrowserPage(*this));
    json ctx = send("Target.createBrowserContext");
    page->context_id_ = ctx.at("browserContextId").get<std::string>();

    json target = send("Target.createTarget",
                       {{"url", "about:blank"}, {"browserContextId", page->context_id_}});
    page->target_id_ = target.at("targetId").get<std::string>();

    json attach = send("Target.attachToTarget", {{"targetId", page->target_id_}, {"flatten", true}});
    page->session_id_ = attach.at("sessionId").get<std::string>();

    page->send("Page.enable");
    page->send("Runtime.enable");
    return page;
}

void BrowserPool::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (pid_ <= 0) return;

    if (running()) {
        try {
            send("Browser.close", json::object(), "", 2000);
        } catch (const GeoOverlayError& e) {
            std::cerr << "[BrowserPool] Browser.close: " << e.what() << std::endl;
        }
    }
    reap_process();
    std::cerr << "[BrowserPool] Shut down" << std::endl;
}

void BrowserPool::reap_process() {
    int fd;
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fd = fd_;
        pid = pid_;
    }

    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
    if (reader_.joinable()) reader_.join();

    if (pid > 0) {
        int status = 0;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        while (r == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            r = ::waitpid(pid, &status, WNOHANG);
        }
        if (r == 0) {
            std::cerr << "[BrowserPool] Process " << pid << " did not exit, killing" << std::endl;
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
    }

    {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
        pid_ = -1;
        running_ = false;
    }

    if (!user_data_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(user_data_dir_, ec);
        if (ec) {
            std::cerr << "[BrowserPool] Could not remove " << user_data_dir_ << ": " << ec.message() << std::endl;
        }
        user_data_dir_.clear();
    }
}

// ---------------------------------------------------------------------------
// BrowserPage
// ---------------------------------------------------------------------------

BrowserPage::BrowserPage(BrowserPool& pool)
    : pool_(pool) {}

BrowserPage::~BrowserPage() {
    close();
}

json BrowserPage::send(const std::string& method, const json& params, int timeout_ms) {
    if (closed_) {
        throw BrowserError(method + ": page is closed");
    }
    return pool_.send(method, params, session_id_, timeout_ms);
}

void BrowserPage::set_viewport(int width, int height) {
    send("Emulation.setDeviceMetricsOverride",
         {{"width", width}, {"height", height}, {"deviceScaleFactor", 1}, {"mobile", false}});
}

void BrowserPage::set_content(const std::string& html) {
    json tree = send("Page.getFrameTree");
    std::string frame_id = tree.at("frameTree").at("frame").at("id").get<std::string>();
    send("Page.setDocumentContent", {{"frameId", frame_id}, {"html", html}});
}

json BrowserPage::evaluate(const std::string& expression, bool await_promise) {
    json r = send("Runtime.evaluate", {{"expression", expression},
                                       {"returnByValue", true},
                                       {"awaitPromise", await_promise}});
    if (r.contains("exceptionDetails")) {
        const auto& d = r["exceptionDetails"];
        std::string text = d.value("text", std::string("exception"));
        if (d.contains("exception")) {
            text += ": " + d["exception"].value("description", std::string());
        }
        throw BrowserError("evaluate failed: " + text);
    }
    return r.value("result", json::object()).value("value", json());
}

bool BrowserPage::wait_for(const std::string& expression, int timeout_ms, int poll_interval_ms) {
    const std::string check = "Boolean(" + expression + ")";
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        json v = evaluate(check);
        if (v.is_boolean() && v.get<bool>()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(std::max(10, poll_interval_ms)));
    }
}

std::vector<uint8_t> BrowserPage::screenshot_png(int width, int height) {
    json r = send("Page.captureScreenshot",
                  {{"format", "png"},
                   {"clip", {{"x", 0}, {"y", 0}, {"width", width}, {"height", height}, {"scale", 1}}}});
    return core::base64_decode(r.at("data").get<std::string>());
}

void BrowserPage::close() {
    if (closed_) return;
    closed_ = true;

    if (!target_id_.empty()) {
        try {
            pool_.send("Target.closeTarget", {{"targetId", target_id_}}, "", 5000);
        } catch (const std::exception& e) {
            std::cerr << "[BrowserPool] closeTarget: " << e.what() << std::endl;
        }
    }
    if (!context_id_.empty()) {
        try {
            pool_.send("Target.disposeBrowserContext", {{"browserContextId", context_id_}}, "", 5000);
        } catch (const std::exception& e) {
            std::cerr << "[BrowserPool] disposeBrowserContext: " << e.what() << std::endl;
        }
    }
}

} // namespace geo_overlay::browser
