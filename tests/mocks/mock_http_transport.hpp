#pragma once

#include "delivery/http_transport.hpp"

#include <deque>
#include <mutex>
#include <vector>

namespace flbkinesis::testing {

/**
 * @brief Records requests; replies from a script (nullopt = transport failure)
 */
class MockHttpTransport : public IHttpTransport {
public:
    [[nodiscard]] std::optional<HttpReply> send(const HttpRequest& request,
                                                std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (replies_.empty()) {
            error = "no scripted reply";
            return std::nullopt;
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        if (!reply) {
            error = "connection reset";
        }
        return reply;
    }

    void push_reply(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(HttpReply{status, std::move(body)});
    }

    void push_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(std::nullopt);
    }

    [[nodiscard]] std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::optional<HttpReply>> replies_;
    std::vector<HttpRequest> requests_;
};

} // namespace flbkinesis::testing
