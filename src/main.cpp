/*
 * cverifyd - reproducible contract build verifier
 * Drains queued verification jobs from the job store
 */

#include "config.h"
#include "json_job_store.h"
#include "github_client.h"
#include "git_client.h"
#include "docker_runtime.h"
#include "source_acquirer.h"
#include "sandbox_executor.h"
#include "post_processor.h"
#include "verifier.h"
#include "worker_identity.h"
#include <iostream>
#include <memory>
#include <csignal>
#include <ctime>
#include <signal.h>

using namespace cverify;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config FILE] [--worker-key FILE] [--generate-key]" << std::endl;
    std::cout << "  --config FILE      JSON configuration (defaults apply when omitted)" << std::endl;
    std::cout << "  --worker-key FILE  Ed25519 PEM key used to sign verification records" << std::endl;
    std::cout << "  --generate-key     Write a new key to --worker-key (or verifier_key.pem) and exit" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string worker_key_file;
    bool generate_key = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--worker-key" && i + 1 < argc) {
            worker_key_file = argv[++i];
        } else if (arg == "--generate-key") {
            generate_key = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (generate_key) {
        auto identity = WorkerIdentity::generate();
        if (!identity) {
            std::cerr << "Failed to generate verifier identity" << std::endl;
            return 1;
        }
        std::string keyfile = worker_key_file.empty() ? "verifier_key.pem" : worker_key_file;
        if (!identity->save_to_file(keyfile)) {
            std::cerr << "Failed to save verifier key to " << keyfile << std::endl;
            return 1;
        }
        std::cout << "Saved verifier key to: " << keyfile << std::endl;
        std::cout << "Verifier ID: " << identity->get_worker_id() << std::endl;
        return 0;
    }

    VerifierConfig config;
    try {
        if (!config_file.empty()) {
            config = VerifierConfig::from_file(config_file);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (!worker_key_file.empty()) {
        config.verifier_key_file = worker_key_file;
    }

    std::unique_ptr<WorkerIdentity> identity;
    if (!config.verifier_key_file.empty()) {
        identity = WorkerIdentity::from_keyfile(config.verifier_key_file);
        if (!identity) {
            std::cerr << "Failed to load verifier key from: " << config.verifier_key_file << std::endl;
            std::cerr << "Generate one with: --generate-key --worker-key mykey.pem" << std::endl;
            return 1;
        }
    }

    std::cout << "cverifyd - reproducible contract build verifier" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Store:     " << config.store_dir << std::endl;
    std::cout << "Work dir:  " << config.src_dir << std::endl;
    std::cout << "Output:    " << config.output_dir << std::endl;
    std::cout << "Docker:    " << config.docker_socket << std::endl;
    if (identity) {
        std::cout << "Verifier:  " << identity->get_worker_id() << std::endl;
    } else {
        std::cout << "Verifier:  anonymous (records are unsigned)" << std::endl;
    }
    std::cout << "------------------------------------------------" << std::endl;

    std::unique_ptr<JsonFileJobStore> store;
    try {
        store = std::make_unique<JsonFileJobStore>(config.store_dir);
    } catch (const StoreError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    GithubClient github(config);
    GitCli git(config.git_binary);
    DockerRuntime docker(config.docker_socket);

    SourceAcquirer acquirer(config, *store, github, git);
    SandboxExecutor sandbox(config, docker);
    PostProcessor post_processor(config);
    Verifier verifier(config, *store, acquirer, sandbox, post_processor, identity.get());

    // Signals are taken synchronously so shutdown runs on the main thread
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    verifier.notify();

    struct timespec poll_interval;
    poll_interval.tv_sec = config.poll_interval_seconds;
    poll_interval.tv_nsec = 0;

    while (true) {
        int sig = sigtimedwait(&signals, nullptr, &poll_interval);
        if (sig == SIGINT || sig == SIGTERM) {
            std::cout << "Received signal " << sig << ", stopping" << std::endl;
            break;
        }
        // Timeout: pick up anything queued while idle or after a halted drain
        verifier.notify();
    }

    verifier.stop();

    VerifierStats stats = verifier.stats();
    std::cout << "Processed " << stats.jobs_processed << " jobs, "
              << stats.backoffs << " backoffs" << std::endl;
    return 0;
}
