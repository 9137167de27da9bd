#include <gtest/gtest.h>
#include "network/nng_agent_client.h"
#include "agent_roles.h"
#include "message.h"
#include "utils.h"
#include <nng/protocol/reqrep0/rep.h>
#include <atomic>
#include <thread>

namespace forge {

// Minimal in-process adapter: answers every request with a fixed reply
class NNGAgentClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        url = "inproc://forge-agent-" + Utils::generate_run_id();
        ASSERT_EQ(nng_rep0_open(&server), 0);
        ASSERT_EQ(nng_socket_set_ms(server, NNG_OPT_RECVTIMEO, 200), 0);
        ASSERT_EQ(nng_listen(server, url.c_str(), nullptr, 0), 0);
    }

    void TearDown() override {
        running = false;
        if (worker.joinable()) {
            worker.join();
        }
        nng_close(server);
    }

    void serve(const AgentTurnResponse& reply) {
        running = true;
        worker = std::thread([this, reply] {
            while (running) {
                char* buf = nullptr;
                size_t sz = 0;
                if (nng_recv(server, &buf, &sz, NNG_FLAG_ALLOC) != 0) {
                    continue;
                }
                last_request = MessageHandler::deserialize_turn_request(std::string(buf, sz));
                nng_free(buf, sz);
                ++requests_received;

                std::string out = MessageHandler::serialize_turn_response(reply);
                nng_send(server, const_cast<char*>(out.c_str()), out.length(), 0);
            }
        });
    }

    std::string url;
    nng_socket server = NNG_SOCKET_INITIALIZER;
    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<int> requests_received{0};
    AgentTurnRequest last_request;
};

TEST_F(NNGAgentClientTest, RequestsAreNeverResent) {
    NNGAgentClient client(url, 120000);

    EXPECT_EQ(client.get_option_ms(NNG_OPT_REQ_RESENDTIME), NNG_DURATION_INFINITE);
    EXPECT_EQ(client.get_option_ms(NNG_OPT_RECVTIMEO), 120000);
    EXPECT_EQ(client.get_option_ms(NNG_OPT_SENDTIMEO), 120000);
}

TEST_F(NNGAgentClientTest, OneTurnIsOneRequest) {
    AgentTurnResponse reply;
    reply.success = true;
    reply.text = "def add(a, b):\n    return a + b";
    serve(reply);

    NNGAgentClient client(url, 5000, "anthropic");
    std::string text = client.send(role_prompt(RoleTag::WRITER), "User wants: add");

    EXPECT_EQ(text, reply.text);
    EXPECT_EQ(requests_received.load(), 1);
    EXPECT_EQ(last_request.role, "Writer");
    EXPECT_EQ(last_request.transcript, "User wants: add");
    EXPECT_EQ(last_request.provider, "anthropic");
}

TEST_F(NNGAgentClientTest, FailedReplyThrows) {
    AgentTurnResponse reply;
    reply.success = false;
    reply.error_message = "HTTP error: 429";
    serve(reply);

    NNGAgentClient client(url, 5000);

    try {
        client.send(role_prompt(RoleTag::PLANNER), "User wants: x");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("HTTP error: 429"), std::string::npos);
    }
}

TEST_F(NNGAgentClientTest, NoReplyTimesOut) {
    NNGAgentClient client(url, 300);

    EXPECT_THROW(client.send(role_prompt(RoleTag::PLANNER), "User wants: x"), std::runtime_error);
}

TEST(NNGAgentClientRoleTest, RoleNamesFromPrompts) {
    for (RoleTag role : kRoleCycle) {
        EXPECT_EQ(NNGAgentClient::role_for_prompt(role_prompt(role)), role_name(role));
    }
    EXPECT_EQ(NNGAgentClient::role_for_prompt("You are a custom helper."), "Agent");
    EXPECT_EQ(NNGAgentClient::role_for_prompt(""), "Agent");
}

} // namespace forge
