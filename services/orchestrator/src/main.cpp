#include <iostream>
#include <string>
#include <map>
#include <cstring>
#include <csignal>
#include <pthread.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/pipeline_factory.hpp"
#include "../include/run_queue.hpp"
#include "../../../shared/cpp/common/include/log.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
const std::size_t kMaxBody = 1024 * 1024;

struct ServerContext {
    const PipelineConfig& cfg;
    PipelineServices& svc;
    RunQueue& queue;
};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
};

MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                        const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult send_error(struct MHD_Connection* conn, unsigned int status, const std::string& message) {
    return send_response(conn, status, json({{"error", message}}).dump());
}

json ticket_json(const RunTicket& t) {
    return {{"id", t.id}, {"priority", t.priority}, {"submitted_at", t.submitted_at}, {"prompt", t.request.prompt}};
}

MhdResult handle_submit(ServerContext& ctx, struct MHD_Connection* conn, const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return send_error(conn, MHD_HTTP_BAD_REQUEST, "body must be a JSON object");
    GenerationRequest req;
    try {
        req = request_from_json(j);
    } catch (const json::exception& e) {
        return send_error(conn, MHD_HTTP_BAD_REQUEST, std::string("invalid request: ") + e.what());
    }
    if (req.priority != "high" && req.priority != "low") {
        return send_error(conn, MHD_HTTP_BAD_REQUEST, "priority must be high or low");
    }
    if (auto problem = validate_request(req, ctx.cfg.max_prompt_chars)) {
        return send_error(conn, MHD_HTTP_BAD_REQUEST, *problem);
    }
    auto t = ctx.queue.enqueue(std::move(req));
    return send_response(conn, MHD_HTTP_ACCEPTED, json({{"id", t.id}, {"state", "queued"}}).dump());
}

MhdResult handle_get(ServerContext& ctx, struct MHD_Connection* conn, const std::string& id) {
    auto v = ctx.queue.find(id);
    if (!v) return send_error(conn, MHD_HTTP_NOT_FOUND, "unknown run " + id);
    json out = {
        {"id", v->id},
        {"state", to_string(v->state)},
        {"priority", v->priority},
        {"submitted_at", v->submitted_at}
    };
    if (v->result) out["result"] = *v->result;
    return send_response(conn, MHD_HTTP_OK, out.dump());
}

MhdResult handle_cancel(ServerContext& ctx, struct MHD_Connection* conn, const std::string& id) {
    auto v = ctx.queue.find(id);
    if (!v) return send_error(conn, MHD_HTTP_NOT_FOUND, "unknown run " + id);
    if (v->state == TicketState::Done || v->state == TicketState::Cancelled) {
        return send_error(conn, MHD_HTTP_CONFLICT, "run already finished");
    }
    bool ok = ctx.queue.cancel(id);
    return send_response(conn, MHD_HTTP_OK, json({{"ok", ok}, {"id", id}}).dump());
}

MhdResult handle_stats(ServerContext& ctx, struct MHD_Connection* conn) {
    auto s = ctx.queue.snapshot();
    json high = json::array();
    json low = json::array();
    json running = json::array();
    for (const auto& t : s.high) high.push_back(ticket_json(t));
    for (const auto& t : s.low) low.push_back(ticket_json(t));
    for (const auto& t : s.running) running.push_back(ticket_json(t));
    json metrics = {
        {"queued_high", high.size()},
        {"queued_low", low.size()},
        {"running", running.size()},
        {"submitted", s.submitted},
        {"finished", s.finished},
        {"cancelled", s.cancelled},
        {"retained", s.retained},
        {"workers", ctx.cfg.server_workers}
    };
    json out = {{"queues", {{"high", high}, {"low", low}}}, {"running", running}, {"metrics", metrics}};
    return send_response(conn, MHD_HTTP_OK, out.dump());
}

MhdResult handle_health(ServerContext& ctx, struct MHD_Connection* conn) {
    json optional = json::array();
    for (auto s : ctx.cfg.optional_stages) optional.push_back(to_string(s));
    json out = {
        {"ok", true},
        {"storage", ctx.svc.store->name()},
        {"endpoints", {
            {"llm", ctx.cfg.llm_endpoint},
            {"image", ctx.cfg.image_endpoint},
            {"threed", ctx.cfg.threed_endpoint}
        }},
        {"optional_stages", optional},
        {"threed_without_image", ctx.cfg.threed_without_image},
        {"image_handoff", to_string(ctx.cfg.image_handoff)},
        {"run_budget_ms", ctx.svc.orchestrator->run_budget().count()}
    };
    return send_response(conn, MHD_HTTP_OK, out.dump());
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto& ctx = *static_cast<ServerContext*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            if (ci->body.size() + *upload_data_size > kMaxBody) ci->too_large = true;
            else ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    try {
        if (ci->too_large) return send_error(connection, MHD_HTTP_PAYLOAD_TOO_LARGE, "request body too large");
        if (ci->method == "POST" && path == "/runs") return handle_submit(ctx, connection, ci->body);
        if (ci->method == "GET" && path == "/stats") return handle_stats(ctx, connection);
        if (ci->method == "GET" && path == "/healthz") return handle_health(ctx, connection);
        if (path.rfind("/runs/", 0) == 0) {
            std::string rest = path.substr(std::string("/runs/").size());
            const std::string cancel_suffix = "/cancel";
            if (ci->method == "POST" && rest.size() > cancel_suffix.size() &&
                rest.compare(rest.size() - cancel_suffix.size(), cancel_suffix.size(), cancel_suffix) == 0) {
                return handle_cancel(ctx, connection, rest.substr(0, rest.size() - cancel_suffix.size()));
            }
            if (ci->method == "GET" && !rest.empty() && rest.find('/') == std::string::npos) {
                return handle_get(ctx, connection, rest);
            }
        }
        return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
    } catch (const std::exception& e) {
        log_error("server", ci->method + " " + path + ": " + e.what());
        return send_error(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

int main(int, char**) {
    init_logging_from_env();
    CurlGlobal curl;

    // SIGINT/SIGTERM are collected by sigwait below; block them before any
    // thread starts so every thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    PipelineConfig cfg;
    std::unique_ptr<PipelineServices> svc;
    try {
        cfg = load_config_from_env();
        svc = build_pipeline(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    RunQueue queue([&svc](const RunTicket& t, CancelToken& cancel) {
        return to_json(svc->orchestrator->run(t.request, cancel, t.id));
    }, cfg.server_max_finished);
    queue.start(cfg.server_workers);

    ServerContext ctx{cfg, *svc, queue};
    log_info("server", "Starting HTTP server on port " + std::to_string(cfg.server_port) + " with " +
                       std::to_string(cfg.server_workers) + " workers...");
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.server_port,
                                            nullptr, nullptr, &handler, &ctx,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        log_error("server", "Failed to start HTTP server");
        queue.stop();
        return 1;
    }

    int sig = 0;
    sigwait(&signals, &sig);
    log_info("server", std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");
    MHD_stop_daemon(d);
    queue.stop();
    return 0;
}
