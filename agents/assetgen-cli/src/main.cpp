#include "../../../services/orchestrator/include/pipeline_factory.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <pthread.h>
#include <thread>

static void usage() {
    std::cerr << "assetgen-cli usage:\n"
              << "  run --prompt \"...\" [--style <name>] [--optional image,threed] [--threed-without-image]\n"
              << "      [--no-metadata] [--octree-resolution N] [--face-count N] [--no-texture] [--inline-image]\n"
              << "  get --key <storage key> --out <file>\n"
              << "  presign --key <storage key> [--ttl <seconds>]\n";
}

// Cancels `cancel` on SIGINT/SIGTERM until stop() is called.
class SignalWatcher {
public:
    explicit SignalWatcher(CancelToken& cancel) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);
        thread_ = std::thread([this, &cancel] {
            int sig = 0;
            sigwait(&set_, &sig);
            if (!done_) {
                log_warn("cli", "interrupted, cancelling run");
                cancel.cancel();
            }
        });
    }
    ~SignalWatcher() { stop(); }

    void stop() {
        if (!thread_.joinable()) return;
        done_ = true;
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    sigset_t set_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

static int cmd_run(PipelineConfig cfg, int argc, char** argv) {
    GenerationRequest req;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--prompt" && i + 1 < argc) req.prompt = argv[++i];
        else if (a == "--style" && i + 1 < argc) req.style = std::string(argv[++i]);
        else if (a == "--optional" && i + 1 < argc) cfg.optional_stages = parse_optional_stages(argv[++i]);
        else if (a == "--threed-without-image") cfg.threed_without_image = true;
        else if (a == "--inline-image") cfg.image_handoff = ImageHandoff::Inline;
        else if (a == "--no-metadata") cfg.persist_metadata = false;
        else if (a == "--octree-resolution" && i + 1 < argc) req.shape.octree_resolution = std::stoi(argv[++i]);
        else if (a == "--face-count" && i + 1 < argc) req.shape.face_count = std::stoi(argv[++i]);
        else if (a == "--no-texture") req.shape.texture = false;
        else { usage(); return 2; }
    }
    if (req.prompt.empty()) { usage(); return 2; }
    validate_config(cfg);
    if (auto problem = validate_request(req, cfg.max_prompt_chars)) {
        std::cerr << "[ERROR] " << *problem << "\n";
        return 2;
    }

    auto svc = build_pipeline(cfg);
    CancelToken cancel;
    SignalWatcher watcher(cancel);
    PipelineRun run = svc->orchestrator->run(req, cancel);
    watcher.stop();

    std::cout << to_json(run).dump(2) << "\n";
    return (run.status == RunStatus::Completed || run.status == RunStatus::PartiallyCompleted) ? 0 : 1;
}

static int cmd_get(const PipelineConfig& cfg, int argc, char** argv) {
    std::string key, out;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--key" && i + 1 < argc) key = argv[++i];
        else if (a == "--out" && i + 1 < argc) out = argv[++i];
    }
    if (key.empty() || out.empty()) { usage(); return 2; }

    auto svc = build_pipeline(cfg);
    CancelToken cancel;
    auto r = svc->storage->get(key, cancel);
    if (!r.value) {
        std::cerr << "[ERROR] " << to_string(r.failure.kind) << ": " << r.failure.message << "\n";
        return 1;
    }
    std::ofstream f(out, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + out + " for writing");
    f.write(r.value->bytes.data(), (std::streamsize)r.value->bytes.size());
    if (!f) throw std::runtime_error("failed writing " + out);
    std::cout << "[OK] " << key << " (" << r.value->content_type << ", " << r.value->bytes.size()
              << " bytes) -> " << out << "\n";
    return 0;
}

static int cmd_presign(const PipelineConfig& cfg, int argc, char** argv) {
    std::string key;
    long ttl = 3600;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--key" && i + 1 < argc) key = argv[++i];
        else if (a == "--ttl" && i + 1 < argc) ttl = std::stol(argv[++i]);
    }
    if (key.empty() || ttl <= 0) { usage(); return 2; }
    auto svc = build_pipeline(cfg);
    std::cout << svc->storage->presign(key, std::chrono::seconds(ttl)) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    init_logging_from_env();
    CurlGlobal curl;
    std::string cmd = argv[1];
    try {
        PipelineConfig cfg = load_config_from_env();
        if (cmd == "run") return cmd_run(cfg, argc, argv);
        if (cmd == "get") return cmd_get(cfg, argc, argv);
        if (cmd == "presign") return cmd_presign(cfg, argc, argv);
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
