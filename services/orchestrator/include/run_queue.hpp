#pragma once
#include "../../../shared/cpp/backend_sdk/include/generation_request.hpp"
#include "../../../shared/cpp/common/include/cancel.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct RunTicket {
    std::string id;
    std::string priority; // "high" or "low"
    GenerationRequest request;
    std::string submitted_at;
    std::shared_ptr<CancelToken> cancel;
};

enum class TicketState { Queued, Running, Done, Cancelled };

const char* to_string(TicketState state);

struct TicketView {
    std::string id;
    std::string priority;
    TicketState state{TicketState::Queued};
    std::string submitted_at;
    std::optional<nlohmann::json> result; // rendered run, once finished
};

struct QueueSnapshot {
    std::vector<RunTicket> high;
    std::vector<RunTicket> low;
    std::vector<RunTicket> running;
    std::uint64_t submitted{0};
    std::uint64_t finished{0};
    std::uint64_t cancelled{0};
    std::size_t retained{0};
};

// Two-lane run queue drained by a fixed pool of worker threads. High lane
// first, FIFO within a lane. Finished runs are kept for polling, oldest
// evicted beyond max_finished.
class RunQueue {
public:
    // Runs one request to completion and renders the result.
    using Executor = std::function<nlohmann::json(const RunTicket&, CancelToken&)>;

    RunQueue(Executor exec, std::size_t max_finished);
    ~RunQueue();
    RunQueue(const RunQueue&) = delete;
    RunQueue& operator=(const RunQueue&) = delete;

    void start(int workers);
    // Cancels running work, drops queued work and joins the workers.
    void stop();

    RunTicket enqueue(GenerationRequest request);
    std::optional<TicketView> find(const std::string& id);
    // False when the id is unknown or already finished.
    bool cancel(const std::string& id);
    QueueSnapshot snapshot();

private:
    std::optional<RunTicket> pop_locked();
    void worker_loop();
    void finish_locked(const RunTicket& ticket, TicketState state, nlohmann::json result);

    Executor exec_;
    std::size_t max_finished_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<RunTicket> high_;
    std::deque<RunTicket> low_;
    std::unordered_map<std::string, RunTicket> running_;
    std::unordered_map<std::string, TicketView> finished_;
    std::deque<std::string> finished_order_;
    std::uint64_t submitted_{0};
    std::uint64_t finished_count_{0};
    std::uint64_t cancelled_count_{0};
    bool stopping_{false};
    std::vector<std::thread> workers_;
};
