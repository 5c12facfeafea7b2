#include <doctest/doctest.h>

#include <string>
#include <utility>
#include <thread>
#include <vector>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "providers/http_llm_provider.hpp"

using namespace healbox;

namespace {

// Local Anthropic-style endpoint that records the last request body.
class LocalMessagesServer {
public:
    explicit LocalMessagesServer(std::string reply) : reply_(std::move(reply)) {
        server_.Post("/v1/messages", [this](const httplib::Request& req, httplib::Response& res) {
            last_body = req.body;
            res.set_content(reply_, "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }
    ~LocalMessagesServer() {
        server_.stop();
        thread_.join();
    }

    LocalMessagesServer(const LocalMessagesServer&) = delete;
    LocalMessagesServer& operator=(const LocalMessagesServer&) = delete;

    std::string Base() const { return "http://127.0.0.1:" + std::to_string(port_) + "/v1"; }

    std::string last_body;

private:
    std::string reply_;
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};

}  // namespace

TEST_CASE("Chat sends invalid UTF-8 program output with replacement characters") {
    LocalMessagesServer server(R"({"content":[{"type":"text","text":"ok"}],"stop_reason":"end_turn"})");
    providers::HttpLLMProvider provider("sk-ant-test", server.Base(), "claude-3-5-sonnet-20241022", false);

    providers::LLMResponse response{};
    CHECK_NOTHROW(response = provider.Chat({providers::Message{"user", "ERROR:\n\xff\xfe"}}, "", 256, 0.1));
    CHECK(response.content == "ok");
    CHECK(response.finish_reason == "end_turn");

    const auto sent = nlohmann::json::parse(server.last_body);
    CHECK(sent["messages"][0]["content"][0]["text"] == "ERROR:\n\xef\xbf\xbd\xef\xbf\xbd");
}

TEST_CASE("Chat skips content blocks that are not objects") {
    LocalMessagesServer server(
        R"({"content":["stray",42,{"type":"text","text":"<<FILENAME:main.py>>"},null],"stop_reason":"end_turn"})");
    providers::HttpLLMProvider provider("sk-ant-test", server.Base(), "claude-3-5-sonnet-20241022", false);

    providers::LLMResponse response{};
    CHECK_NOTHROW(response = provider.Chat({providers::Message{"user", "fix it"}}, "", 256, 0.1));
    CHECK(response.content == "<<FILENAME:main.py>>");
}
