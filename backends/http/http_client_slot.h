#ifndef VOXLINE_HTTP_CLIENT_SLOT_H
#define VOXLINE_HTTP_CLIENT_SLOT_H

/**
 * Shared plumbing for the HTTP engines: one configured cpp-httplib client per
 * request, registered while in flight so cancel() can stop it from another
 * thread. A cancel stays in effect until resume(), so one that lands between
 * requests still stops the next one.
 */

#include <httplib.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace voxline {

struct HttpEngineConfig {
    std::string base_url;  // scheme://host:port
    int timeout_sec = 60;
};

class HttpClientSlot {
   public:
    explicit HttpClientSlot(HttpEngineConfig config) : config_(std::move(config)) {}

    // Registers a fresh client for the lifetime of one request
    class Lease {
       public:
        explicit Lease(HttpClientSlot& slot) : slot_(slot) {
            client_ = std::make_unique<httplib::Client>(slot_.config_.base_url);
            client_->set_connection_timeout(slot_.config_.timeout_sec, 0);
            client_->set_read_timeout(slot_.config_.timeout_sec, 0);
            client_->set_write_timeout(slot_.config_.timeout_sec, 0);

            std::lock_guard<std::mutex> lock(slot_.mutex_);
            slot_.active_ = client_.get();
        }

        ~Lease() {
            std::lock_guard<std::mutex> lock(slot_.mutex_);
            slot_.active_ = nullptr;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        httplib::Client& client() { return *client_; }

       private:
        HttpClientSlot& slot_;
        std::unique_ptr<httplib::Client> client_;
    };

    // Interrupts the in-flight request, if any
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
        if (active_) {
            active_->stop();
        }
    }

    // Accept requests again after a cancel()
    void resume() { cancel_requested_ = false; }

    bool cancel_requested() const { return cancel_requested_.load(); }

    const HttpEngineConfig& config() const { return config_; }

   private:
    HttpEngineConfig config_;
    std::mutex mutex_;
    httplib::Client* active_ = nullptr;
    std::atomic<bool> cancel_requested_{false};
};

}  // namespace voxline

#endif  // VOXLINE_HTTP_CLIENT_SLOT_H
