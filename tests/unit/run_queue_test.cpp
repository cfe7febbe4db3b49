#include "../../services/orchestrator/include/run_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

using json = nlohmann::json;
using namespace std::chrono_literals;

GenerationRequest Request(const std::string& prompt, const std::string& priority = "low") {
    GenerationRequest r;
    r.prompt = prompt;
    r.priority = priority;
    return r;
}

json Done(const RunTicket& t) {
    return {{"id", t.id}, {"status", "completed"}, {"prompt", t.request.prompt}};
}

// Polls until the ticket reaches `want`; false after two seconds.
bool WaitFor(RunQueue& q, const std::string& id, TicketState want) {
    for (int i = 0; i < 2000; ++i) {
        auto v = q.find(id);
        if (v && v->state == want) return true;
        std::this_thread::sleep_for(1ms);
    }
    return false;
}

void TestHighLaneRunsFirst() {
    std::mutex mtx;
    std::vector<std::string> order;
    RunQueue q([&](const RunTicket& t, CancelToken&) {
        std::lock_guard<std::mutex> lock(mtx);
        order.push_back(t.request.prompt);
        return Done(t);
    }, 16);

    auto a = q.enqueue(Request("low-1"));
    auto b = q.enqueue(Request("low-2"));
    auto c = q.enqueue(Request("high-1", "high"));
    assert(a.priority == "low" && c.priority == "high");

    auto snap = q.snapshot();
    assert(snap.high.size() == 1 && snap.low.size() == 2);
    assert(snap.submitted == 3);

    q.start(1);
    assert(WaitFor(q, a.id, TicketState::Done));
    assert(WaitFor(q, b.id, TicketState::Done));
    assert(WaitFor(q, c.id, TicketState::Done));
    q.stop();

    assert(order.size() == 3);
    assert(order[0] == "high-1");
    assert(order[1] == "low-1");
    assert(order[2] == "low-2");

    auto v = q.find(c.id);
    assert(v && v->result && (*v->result)["status"] == "completed");
}

void TestUnknownPriorityGoesToLowLane() {
    RunQueue q([](const RunTicket& t, CancelToken&) { return Done(t); }, 4);
    auto t = q.enqueue(Request("x", "urgent"));
    assert(t.priority == "low");
    assert(q.snapshot().low.size() == 1);
    q.stop();
}

void TestCancelQueuedRun() {
    RunQueue q([](const RunTicket& t, CancelToken&) { return Done(t); }, 4);
    auto t = q.enqueue(Request("never runs"));
    assert(q.find(t.id)->state == TicketState::Queued);

    assert(q.cancel(t.id));
    auto v = q.find(t.id);
    assert(v && v->state == TicketState::Cancelled);
    assert((*v->result)["status"] == "aborted");
    assert((*v->result)["errors"][0]["kind"] == "Cancelled");
    assert(t.cancel->cancel_requested());
    assert(!q.cancel(t.id));
    assert(!q.cancel("no-such-run"));

    auto snap = q.snapshot();
    assert(snap.low.empty());
    assert(snap.cancelled == 1);
}

void TestCancelRunningRun() {
    RunQueue q([](const RunTicket& t, CancelToken& cancel) {
        while (!cancel.cancelled()) cancel.wait_for(5ms);
        return json{{"id", t.id}, {"status", "aborted"}};
    }, 4);
    q.start(1);
    auto t = q.enqueue(Request("long run"));
    assert(WaitFor(q, t.id, TicketState::Running));
    assert(q.snapshot().running.size() == 1);

    assert(q.cancel(t.id));
    assert(WaitFor(q, t.id, TicketState::Cancelled));
    assert((*q.find(t.id)->result)["status"] == "aborted");
    assert(!q.cancel(t.id));
    q.stop();
}

void TestExecutorExceptionBecomesFailedRun() {
    RunQueue q([](const RunTicket&, CancelToken&) -> json { throw std::runtime_error("backend exploded"); }, 4);
    q.start(1);
    auto t = q.enqueue(Request("boom"));
    assert(WaitFor(q, t.id, TicketState::Done));
    auto v = q.find(t.id);
    assert((*v->result)["status"] == "failed");
    assert((*v->result)["errors"][0]["message"] == "backend exploded");
    assert((*v->result)["errors"][0]["kind"] == "Unexpected");
    q.stop();
}

void TestLateCancelKeepsCompletedRun() {
    RunQueue q([](const RunTicket& t, CancelToken& cancel) {
        // the cancel arrives once the work is already done
        cancel.cancel();
        return Done(t);
    }, 4);
    q.start(1);
    auto t = q.enqueue(Request("finished anyway"));
    assert(WaitFor(q, t.id, TicketState::Done));
    auto v = q.find(t.id);
    assert((*v->result)["status"] == "completed");
    assert(q.snapshot().cancelled == 0);
    q.stop();
}

void TestFinishedRunsAreEvicted() {
    RunQueue q([](const RunTicket& t, CancelToken&) { return Done(t); }, 2);
    q.start(1);
    std::vector<RunTicket> tickets;
    for (int i = 0; i < 3; ++i) {
        tickets.push_back(q.enqueue(Request("run-" + std::to_string(i))));
        assert(WaitFor(q, tickets.back().id, TicketState::Done));
    }
    assert(!q.find(tickets[0].id));
    assert(q.find(tickets[1].id));
    assert(q.find(tickets[2].id));

    auto snap = q.snapshot();
    assert(snap.finished == 3);
    assert(snap.retained == 2);
    q.stop();
}

void TestStopCancelsQueuedRuns() {
    RunQueue q([](const RunTicket& t, CancelToken&) { return Done(t); }, 8);
    auto a = q.enqueue(Request("a"));
    auto b = q.enqueue(Request("b", "high"));
    q.stop();
    assert(q.find(a.id)->state == TicketState::Cancelled);
    assert(q.find(b.id)->state == TicketState::Cancelled);
    assert(q.snapshot().cancelled == 2);
}

void TestSeveralWorkersDrainTheQueue() {
    std::mutex mtx;
    int ran = 0;
    RunQueue q([&](const RunTicket& t, CancelToken&) {
        std::this_thread::sleep_for(2ms);
        std::lock_guard<std::mutex> lock(mtx);
        ++ran;
        return Done(t);
    }, 64);
    q.start(4);
    std::vector<RunTicket> tickets;
    for (int i = 0; i < 20; ++i) tickets.push_back(q.enqueue(Request("p" + std::to_string(i), i % 2 ? "high" : "low")));
    for (const auto& t : tickets) assert(WaitFor(q, t.id, TicketState::Done));
    q.stop();
    assert(ran == 20);
    assert(q.snapshot().finished == 20);
}

} // namespace

int main() {
    TestHighLaneRunsFirst();
    TestUnknownPriorityGoesToLowLane();
    TestCancelQueuedRun();
    TestCancelRunningRun();
    TestExecutorExceptionBecomesFailedRun();
    TestLateCancelKeepsCompletedRun();
    TestFinishedRunsAreEvicted();
    TestStopCancelsQueuedRuns();
    TestSeveralWorkersDrainTheQueue();

    std::cout << "assetgen_unit_run_queue: pass\n";
    return 0;
}
