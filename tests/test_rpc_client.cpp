/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "openshaz/logger.hpp"
#include "openshaz/memory_broker.hpp"
#include "openshaz/rpc_client.hpp"
#include "test_util.hpp"

using namespace openshaz;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

using ReplyFn = std::function<void(Broker&, const Delivery&)>;

// Serves one queue on its own thread until destroyed.
class Responder {
public:
    Responder(MemoryBroker& memory, const std::string& queue, ReplyFn reply)
        : conn_(memory.connect()), reply_(std::move(reply)) {
        conn_->declareQueue(queue);
        conn_->consume(queue, 1, [this](const Delivery& d) {
            reply_(*conn_, d);
            conn_->ack(d.tag);
            ++served;
        });
        thread_ = std::thread([this]() {
            while (!stop_.load()) {
                (void)conn_->processEvents(20ms);
            }
        });
    }
    ~Responder() {
        stop_.store(true);
        thread_.join();
        conn_->close();
    }

    std::atomic<int> served{0};

private:
    std::unique_ptr<Broker> conn_;
    ReplyFn reply_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

void replyWith(Broker& broker, const Delivery& d, const std::string& correlationId, const std::string& body) {
    Properties properties;
    properties.correlationId = correlationId;
    broker.publish("", d.message.properties.replyTo, body, properties);
}

void extractionReply(Broker& broker, const Delivery& d) {
    json task = json::parse(d.message.body);
    json reply = {{"job_id", task["job_id"]},
                  {"music_name", task["music_name"]},
                  {"bucket_url", task["bucket_url"]},
                  {"status", "extracted"},
                  {"features", {0.25, 0.5}}};
    replyWith(broker, d, d.message.properties.correlationId, reply.dump());
}

void testRoundTrip() {
    std::cout << "[Test] Request and matching reply..." << std::endl;
    MemoryBroker memory;
    Responder worker(memory, kExtractionQueue, extractionReply);
    RpcClient client(memory.factory());

    CallResult result = client.submitExtraction("blues.00000.wav", "s3://songs/blues.00000.wav", 3000ms);
    EXPECT(result.ok);
    EXPECT(static_cast<bool>(result));
    EXPECT(result.error == CallError::None);
    EXPECT(result.reply.status == JobStatus::Extracted);
    EXPECT(result.reply.payload["music_name"] == "blues.00000.wav");
    EXPECT(!result.reply.jobId.empty());
    EXPECT(result.reply.payload["features"].size() == 2);
}

void testTimeout() {
    std::cout << "[Test] No worker: timeout..." << std::endl;
    MemoryBroker memory;
    RpcClient client(memory.factory());

    for (int i = 0; i < 3; ++i) {
        auto started = std::chrono::steady_clock::now();
        CallResult result = client.submitSimilarity("q.wav", "s3://q/q.wav", 3, 150ms);
        EXPECT(!result.ok);
        EXPECT(result.error == CallError::Timeout);
        // Never gives up before the deadline
        EXPECT(std::chrono::steady_clock::now() - started >= 150ms);
    }

    // The requests stay queued for a worker that starts later
    EXPECT(memory.depth(kSimilarityQueue) == 3);
}

void testMismatchedReplyIsSkipped() {
    std::cout << "[Test] Stale replies are acked and ignored..." << std::endl;
    MemoryBroker memory;
    Responder worker(memory, kExtractionQueue, [](Broker& broker, const Delivery& d) {
        replyWith(broker, d, "someone-else", R"({"status":"error","error":"stale"})");
        extractionReply(broker, d);
    });
    RpcClient client(memory.factory());

    CallResult result = client.submitExtraction("a.wav", "s3://b/a.wav", 3000ms);
    EXPECT(result.ok);
    EXPECT(result.reply.status == JobStatus::Extracted);
}

void testErrorAndInvalidReplies() {
    std::cout << "[Test] Error status and malformed replies..." << std::endl;
    MemoryBroker memory;
    Responder errors(memory, kSimilarityQueue, [](Broker& broker, const Delivery& d) {
        replyWith(broker, d, d.message.properties.correlationId, R"({"status":"error","error":"no references"})");
    });
    Responder garbage(memory, kExtractionQueue, [](Broker& broker, const Delivery& d) {
        replyWith(broker, d, d.message.properties.correlationId, "<html>");
    });
    RpcClient client(memory.factory());

    CallResult failed = client.submitSimilarity("q.wav", "s3://q/q.wav", 5, 3000ms);
    EXPECT(failed.ok);
    EXPECT(failed.reply.status == JobStatus::Error);
    EXPECT(failed.reply.payload["error"] == "no references");

    CallResult invalid = client.submitExtraction("a.wav", "s3://b/a.wav", 3000ms);
    EXPECT(!invalid.ok);
    EXPECT(invalid.error == CallError::InvalidReply);

    CallResult badRequest = client.call(kExtractionQueue, json::array({1, 2}), 100ms);
    EXPECT(badRequest.error == CallError::InvalidRequest);
}

void testBrokerUnavailable() {
    std::cout << "[Test] Broker down..." << std::endl;
    MemoryBroker memory;
    memory.setAvailable(false);
    RpcClient client(memory.factory());
    client.setConnectRetry(2, 1ms);

    CallResult result = client.submitExtraction("a.wav", "s3://b/a.wav", 1000ms);
    EXPECT(!result.ok);
    EXPECT(result.error == CallError::BrokerUnavailable);
    EXPECT(std::string(toString(result.error)) == "broker unavailable");
}

void testDeadlineBoundsReconnect() {
    std::cout << "[Test] Reconnect backoff stops at the deadline..." << std::endl;
    MemoryBroker memory;
    memory.setAvailable(false);
    RpcClient client(memory.factory());
    client.setConnectRetry(3, 500ms);

    auto started = std::chrono::steady_clock::now();
    CallResult result = client.submitSimilarity("q.wav", "s3://q/q.wav", 3, 100ms);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT(!result.ok);
    EXPECT(result.error == CallError::Timeout);
    EXPECT(elapsed >= 100ms);
    EXPECT(elapsed < 450ms);
}

void testConcurrentCalls() {
    std::cout << "[Test] Concurrent async calls..." << std::endl;
    MemoryBroker memory;
    Responder worker(memory, kExtractionQueue, extractionReply);
    RpcClient client(memory.factory());

    std::vector<std::future<CallResult>> futures;
    for (int i = 0; i < 4; ++i) {
        json task = {{"job_id", "job-" + std::to_string(i)},
                     {"type", "extraction"},
                     {"music_name", "song" + std::to_string(i) + ".wav"},
                     {"bucket_url", "s3://b/song" + std::to_string(i) + ".wav"}};
        futures.push_back(client.callAsync(kExtractionQueue, task, 5000ms));
    }
    for (int i = 0; i < 4; ++i) {
        CallResult result = futures[static_cast<std::size_t>(i)].get();
        EXPECT(result.ok);
        EXPECT(result.reply.jobId == "job-" + std::to_string(i));
    }
    EXPECT(test::waitFor([&worker]() { return worker.served.load() == 4; }));
}

}

int main() {
    Logger::setLevel(LogLevel::CRITICAL);
    std::cout << "=== RPC Client Tests ===" << std::endl;

    testRoundTrip();
    testTimeout();
    testMismatchedReplyIsSkipped();
    testErrorAndInvalidReplies();
    testBrokerUnavailable();
    testDeadlineBoundsReconnect();
    testConcurrentCalls();

    return test::finish("rpc_client");
}
