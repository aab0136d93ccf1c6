#pragma once

#include "delivery/istream_client.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace flbkinesis::testing {

/**
 * @brief Stream client returning scripted responses (default: full success)
 */
class MockStreamClient : public IStreamClient {
public:
    struct Call {
        std::string stream;
        std::vector<PutRecordsEntry> entries;
    };

    [[nodiscard]] PutRecordsResponse put_records(
        const std::string& stream, const std::vector<PutRecordsEntry>& entries) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(Call{stream, entries});
        if (!responses_.empty()) {
            PutRecordsResponse response = std::move(responses_.front());
            responses_.pop_front();
            return response;
        }
        return success(entries.size());
    }

    [[nodiscard]] std::string name() const override { return "mock"; }

    void push_response(PutRecordsResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    [[nodiscard]] std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // ---- Canned responses ----

    static PutRecordsResponse success(size_t count) {
        PutRecordsResponse r;
        r.transport_ok = true;
        r.http_status = 200;
        r.records.resize(count);
        return r;
    }

    static PutRecordsResponse api_error(int status, std::string code) {
        PutRecordsResponse r;
        r.transport_ok = true;
        r.http_status = status;
        r.error_code = std::move(code);
        r.error_message = "mock error";
        return r;
    }

    static PutRecordsResponse transport_failure() {
        PutRecordsResponse r;
        r.error_message = "connection refused";
        return r;
    }

    /// Entries at the given positions fail with error_code
    static PutRecordsResponse partial(size_t count, const std::vector<size_t>& failed,
                                      const std::string& error_code) {
        PutRecordsResponse r = success(count);
        for (const size_t i : failed) {
            r.records[i].error_code = error_code;
        }
        r.failed_record_count = static_cast<uint32_t>(failed.size());
        return r;
    }

private:
    mutable std::mutex mutex_;
    std::deque<PutRecordsResponse> responses_;
    std::vector<Call> calls_;
};

} // namespace flbkinesis::testing
