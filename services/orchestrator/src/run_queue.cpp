#include "../include/run_queue.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace {
json aborted_before_start(const RunTicket& t) {
    return {
        {"id", t.id},
        {"status", "aborted"},
        {"state", "aborted"},
        {"errors", json::array({{{"stage", "run"}, {"kind", to_string(ErrorKind::Cancelled)}, {"message", "cancelled before start"}}})}
    };
}
}

const char* to_string(TicketState state) {
    switch (state) {
        case TicketState::Queued: return "queued";
        case TicketState::Running: return "running";
        case TicketState::Done: return "done";
        case TicketState::Cancelled: return "cancelled";
    }
    return "unknown";
}

RunQueue::RunQueue(Executor exec, std::size_t max_finished)
    : exec_(std::move(exec)), max_finished_(std::max<std::size_t>(1, max_finished)) {}

RunQueue::~RunQueue() {
    stop();
}

void RunQueue::start(int workers) {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = false;
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

void RunQueue::stop() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
        for (auto& kv : running_) kv.second.cancel->cancel();
        for (auto* lane : {&high_, &low_}) {
            for (const auto& t : *lane) finish_locked(t, TicketState::Cancelled, aborted_before_start(t));
            lane->clear();
        }
        joining.swap(workers_);
    }
    cv_.notify_all();
    for (auto& t : joining) {
        if (t.joinable()) t.join();
    }
}

RunTicket RunQueue::enqueue(GenerationRequest request) {
    RunTicket t;
    t.id = gen_id();
    t.priority = request.priority == "high" ? "high" : "low";
    t.request = std::move(request);
    t.submitted_at = utc_timestamp();
    t.cancel = std::make_shared<CancelToken>();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (t.priority == "high") high_.push_back(t);
        else low_.push_back(t);
        ++submitted_;
    }
    cv_.notify_one();
    log_info("queue", "enqueued run=" + t.id + " lane=" + t.priority);
    return t;
}

std::optional<RunTicket> RunQueue::pop_locked() {
    for (auto* lane : {&high_, &low_}) {
        if (!lane->empty()) {
            RunTicket t = lane->front();
            lane->pop_front();
            running_.emplace(t.id, t);
            return t;
        }
    }
    return std::nullopt;
}

void RunQueue::worker_loop() {
    for (;;) {
        RunTicket ticket;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !high_.empty() || !low_.empty(); });
            if (stopping_) return;
            auto next = pop_locked();
            if (!next) continue;
            ticket = std::move(*next);
        }

        json result;
        try {
            result = exec_(ticket, *ticket.cancel);
        } catch (const std::exception& e) {
            log_error("queue", "run=" + ticket.id + " crashed: " + e.what());
            result = {
                {"id", ticket.id},
                {"status", "failed"},
                {"state", "aborted"},
                {"errors", json::array({{{"stage", "run"}, {"kind", to_string(ErrorKind::Unexpected)}, {"message", e.what()}}})}
            };
        }

        std::lock_guard<std::mutex> lock(mtx_);
        // a cancel that lands after the run finished does not change its outcome
        const bool aborted = result.is_object() && result.value("status", std::string()) == "aborted";
        TicketState state = aborted && ticket.cancel->cancel_requested() ? TicketState::Cancelled : TicketState::Done;
        finish_locked(ticket, state, std::move(result));
    }
}

void RunQueue::finish_locked(const RunTicket& ticket, TicketState state, json result) {
    running_.erase(ticket.id);
    TicketView v;
    v.id = ticket.id;
    v.priority = ticket.priority;
    v.state = state;
    v.submitted_at = ticket.submitted_at;
    v.result = std::move(result);
    finished_[ticket.id] = std::move(v);
    finished_order_.push_back(ticket.id);
    ++finished_count_;
    if (state == TicketState::Cancelled) ++cancelled_count_;
    while (finished_order_.size() > max_finished_) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

std::optional<TicketView> RunQueue::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto done = finished_.find(id);
    if (done != finished_.end()) return done->second;

    auto view_of = [](const RunTicket& t, TicketState state) {
        TicketView v;
        v.id = t.id;
        v.priority = t.priority;
        v.state = state;
        v.submitted_at = t.submitted_at;
        return v;
    };
    auto run = running_.find(id);
    if (run != running_.end()) return view_of(run->second, TicketState::Running);
    for (auto* lane : {&high_, &low_}) {
        for (const auto& t : *lane) {
            if (t.id == id) return view_of(t, TicketState::Queued);
        }
    }
    return std::nullopt;
}

bool RunQueue::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto* lane : {&high_, &low_}) {
        auto it = std::find_if(lane->begin(), lane->end(), [&](const RunTicket& t) { return t.id == id; });
        if (it != lane->end()) {
            RunTicket t = *it;
            lane->erase(it);
            t.cancel->cancel();
            finish_locked(t, TicketState::Cancelled, aborted_before_start(t));
            log_info("queue", "cancelled queued run=" + id);
            return true;
        }
    }
    auto run = running_.find(id);
    if (run != running_.end()) {
        run->second.cancel->cancel();
        log_info("queue", "cancelling running run=" + id);
        return true;
    }
    return false;
}

QueueSnapshot RunQueue::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    QueueSnapshot s;
    s.high.assign(high_.begin(), high_.end());
    s.low.assign(low_.begin(), low_.end());
    s.running.reserve(running_.size());
    for (const auto& kv : running_) s.running.push_back(kv.second);
    s.submitted = submitted_;
    s.finished = finished_count_;
    s.cancelled = cancelled_count_;
    s.retained = finished_.size();
    return s;
}
