#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "provider/http_transport.hpp"

namespace warden::testing {

// Replays canned responses in order; the last one repeats once the script
// runs out.
class ScriptedTransport : public warden::provider::HttpTransport {
public:
    struct Call {
        std::string url;
        warden::provider::HeaderMap headers;
        std::string body;
    };

    void push(warden::provider::HttpResponse response) {
        script_.push_back(std::move(response));
    }

    void push_status(long status, const std::string& body = "",
                     warden::provider::HeaderMap headers = {}) {
        warden::provider::HttpResponse response;
        response.status = status;
        response.body = body;
        response.headers = std::move(headers);
        push(std::move(response));
    }

    warden::provider::HttpResponse post_json(
        const std::string& url, const warden::provider::HeaderMap& headers,
        const std::string& body, std::uint64_t,
        const std::shared_ptr<std::atomic_bool>&) override {
        calls_.push_back(Call{url, headers, body});
        if (script_.size() > 1) {
            auto next = script_.front();
            script_.pop_front();
            return next;
        }
        return script_.empty() ? warden::provider::HttpResponse{} : script_.front();
    }

    const std::vector<Call>& calls() const { return calls_; }

private:
    std::deque<warden::provider::HttpResponse> script_;
    std::vector<Call> calls_;
};

inline std::string text_response(const std::string& text) {
    return R"({"id":"msg_1","content":[{"type":"text","text":")" + text +
           R"("}],"stop_reason":"end_turn"})";
}

}  // namespace warden::testing
