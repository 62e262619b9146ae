#include "core/executor.h"
#include "core/loopback_channel.h"
#include "transfer/transfer_manager.h"
#include "util/settings.h"
#include <asio/post.hpp>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

static std::atomic<bool> g_running{true};
static std::mutex g_mutex;
static std::condition_variable g_cv;

static void shutdown() {
    g_running = false;
    g_cv.notify_all();
}

void signal_handler(int signal) {
    if (signal == SIGINT) {
        spdlog::info("\nReceived interrupt signal, shutting down...");
        shutdown();
    }
}

// Sends a file between two in-process peers over a loopback channel pair and
// writes what arrives into the receiver's save directory.
int main(int argc, char** argv) {
    if (argc < 2) {
        spdlog::error("Usage: {} <file>", argv[0]);
        return 1;
    }
    const std::filesystem::path file(argv[1]);

    util::Settings::instance().init(argv[0]);
    const auto settings = util::Settings::instance().transfer_settings();
    spdlog::set_level(spdlog::level::from_str(settings.logging.level));
    spdlog::info("chanxfer starting...");

    core::Executor executor;

    // The receiving side keeps its own state directory.
    auto receiver_settings = settings;
    receiver_settings.persistence.directory = (std::filesystem::path(settings.persistence.directory) / "bob").string();
    auto sender_settings = settings;
    sender_settings.persistence.enabled = false;

    transfer::TransferManager alice(executor, sender_settings);
    transfer::TransferManager bob(executor, receiver_settings);

    std::atomic<int> exit_code{0};
    bob.on_file_received([&exit_code, &settings](const receiver::ReceivedArtifact& artifact) {
        std::filesystem::path path = artifact.path;
        if (artifact.method == persistence::StorageMethod::Memory) {
            std::error_code ec;
            std::filesystem::create_directories(settings.receiver.save_dir, ec);
            path = receiver::unique_destination(settings.receiver.save_dir, artifact.file_name);
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char*>(artifact.data.data()),
                      static_cast<std::streamsize>(artifact.data.size()));
            if (!out) {
                spdlog::error("Failed to write {}", path.string());
                exit_code = 1;
            }
        }
        spdlog::info("Received {} ({} bytes) at {}", artifact.file_name, artifact.file_size, path.string());
        shutdown();
    });

    auto stop_on_failure = [&exit_code](const char* side) {
        return [&exit_code, side](const progress::TransferProgress& p) {
            if (p.status != progress::TransferStatus::Error && p.status != progress::TransferStatus::Cancelled) {
                return;
            }
            spdlog::error("{} transfer of {} {}{}{}",
                          side,
                          p.file_name,
                          progress::to_string(p.status),
                          p.error.empty() ? "" : ": ",
                          p.error);
            exit_code = 1;
            shutdown();
        };
    };
    alice.on_progress(stop_on_failure("Outgoing"));
    bob.on_progress(stop_on_failure("Incoming"));

    asio::post(executor.get_io_context(), [&]() {
        auto [to_bob, to_alice] = core::LoopbackChannel::make_pair(executor.get_io_context(), "alice", "bob");
        alice.add_peer(to_bob);
        bob.add_peer(to_alice);
        alice.start();
        bob.start();

        if (!alice.send_file(file, "bob")) {
            exit_code = 1;
            shutdown();
        }
    });

    std::signal(SIGINT, signal_handler);
    std::thread io_thread([&executor]() { executor.start(); });
    {
        std::unique_lock<std::mutex> lock(g_mutex);
        g_cv.wait(lock, [] { return !g_running.load(); });
    }

    spdlog::info("Shutting down...");
    asio::post(executor.get_io_context(), [&]() {
        alice.stop();
        bob.stop();
        executor.stop();
    });
    if (io_thread.joinable()) {
        io_thread.join();
    }
    return exit_code.load();
}
