#pragma once
#include "omemo_send/interfaces/i_iq_channel.hpp"
#include <deque>
#include <string>
#include <vector>

namespace omemo_send::test_helpers {

/// Answers round trips from a queue; an empty queue times out.
class MockIqChannel : public interfaces::IIqChannel {
public:
    [[nodiscard]] Result<std::string, IqFailure> RoundTrip(
        const std::string& iq_xml,
        const std::chrono::milliseconds timeout) override {
        requests_.push_back(iq_xml);
        timeouts_.push_back(timeout);
        if (responses_.empty()) {
            return Result<std::string, IqFailure>::Err(IqFailure::Timeout("no response queued"));
        }
        auto next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    void QueueResult(std::string stanza) {
        responses_.push_back(Result<std::string, IqFailure>::Ok(std::move(stanza)));
    }

    void QueueFailure(IqFailure failure) {
        responses_.push_back(Result<std::string, IqFailure>::Err(std::move(failure)));
    }

    [[nodiscard]] const std::vector<std::string>& Requests() const noexcept { return requests_; }
    [[nodiscard]] const std::vector<std::chrono::milliseconds>& Timeouts() const noexcept { return timeouts_; }

private:
    std::deque<Result<std::string, IqFailure>> responses_;
    std::vector<std::string> requests_;
    std::vector<std::chrono::milliseconds> timeouts_;
};

}
