/*
 * scriptdeck C++ - Sandbox worker
 *
 * One process per execution request. Started by the supervisor with an
 * empty environment:
 *   fd 0  request JSON (read to EOF)
 *   fd 1  /dev/null
 *   fd 2  worker diagnostics (never part of the captured output)
 *   fd 3  result channel
 *
 * Usage:
 *   scriptdeck-worker [--channel-fd N] [--log-level LEVEL]
 */
#include <scriptdeck/sandbox/types.hpp>
#include <scriptdeck/sandbox/channel.hpp>
#include <scriptdeck/sandbox/output_sink.hpp>
#include <scriptdeck/sandbox/confinement.hpp>
#include <scriptdeck/sandbox/python_unit.hpp>
#include <scriptdeck/core/logger.hpp>

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <unistd.h>

namespace {

const size_t MAX_REQUEST_BYTES = 64 * 1024 * 1024;

bool read_request(int fd, std::string& out) {
    char buf[65536];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Worker] Failed to read request: %s", strerror(errno));
            return false;
        }
        out.append(buf, static_cast<size_t>(n));
        if (out.size() > MAX_REQUEST_BYTES) {
            LOG_ERROR("[Worker] Request exceeds %zu bytes", MAX_REQUEST_BYTES);
            return false;
        }
    }
}

// The RESULT frame is the last thing the worker ever writes
int finish(scriptdeck::ChannelWriter& channel, const scriptdeck::WorkerReport& report) {
    std::string payload = report.to_json().dump(-1, ' ', false,
                                                scriptdeck::Json::error_handler_t::replace);
    if (!channel.write_frame(scriptdeck::FrameType::RESULT, payload)) {
        LOG_ERROR("[Worker] Failed to send result: %s", strerror(errno));
        return 1;
    }
    return 0;
}

int fail(scriptdeck::ChannelWriter& channel, const std::string& error) {
    scriptdeck::WorkerReport report;
    report.success = false;
    report.error = error;
    finish(channel, report);
    return 2;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int channel_fd = 3;
    
    scriptdeck::Logger& logger = scriptdeck::Logger::instance();
    logger.set_color(false);
    logger.set_tag("worker:" + std::to_string(getpid()));
    logger.set_level(scriptdeck::LogLevel::WARN);
    
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--channel-fd") == 0 && i + 1 < argc) {
            channel_fd = atoi(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            scriptdeck::LogLevel level;
            if (scriptdeck::parse_log_level(argv[++i], level)) {
                logger.set_level(level);
            }
            continue;
        }
        fprintf(stderr, "usage: %s [--channel-fd N] [--log-level LEVEL]\n", argv[0]);
        return 2;
    }
    
    // A vanished supervisor must surface as EPIPE, not kill us mid-frame
    signal(SIGPIPE, SIG_IGN);
    
    scriptdeck::ChannelWriter channel(channel_fd);
    
    std::string raw;
    if (!read_request(STDIN_FILENO, raw)) {
        return fail(channel, "Worker could not read the execution request");
    }
    close(STDIN_FILENO);
    
    scriptdeck::WorkerRequest request;
    std::string error;
    scriptdeck::Json j = scriptdeck::Json::parse(raw, nullptr, false);
    if (j.is_discarded()) {
        return fail(channel, "Malformed execution request");
    }
    if (!scriptdeck::WorkerRequest::from_json(j, request, error)) {
        return fail(channel, "Invalid execution request: " + error);
    }
    
    // Process-level confinement first, before the interpreter exists
    scriptdeck::ConfinementOptions options;
    options.memory_limit_mb = request.limits.memory_limit_mb;
    options.cpu_seconds = request.limits.cpu_seconds;
    options.max_open_files = request.limits.max_open_files;
    options.max_processes = 1;
    
    scriptdeck::Confinement confinement(options);
    if (!confinement.restrict_process()) {
        return fail(channel, "Worker confinement failed");
    }
    confinement.isolate_network();
    
    scriptdeck::OutputSink sink(channel, request.limits.max_output_bytes);
    scriptdeck::PythonUnit unit(request, sink);
    if (!unit.initialize(error)) {
        LOG_ERROR("[Worker] %s", error.c_str());
        return fail(channel, error);
    }
    
    // Lock the filesystem down now that the interpreter has loaded
    std::vector<std::string> paths = unit.library_paths();
    for (size_t i = 0; i < paths.size(); ++i) {
        confinement.allow_path(paths[i]);
    }
    confinement.restrict_filesystem();
    
    const scriptdeck::ConfinementReport& cr = confinement.report();
    LOG_DEBUG("[Worker] Confinement: limits=%d no_new_privs=%d network=%d filesystem=%d",
              cr.limits_applied, cr.no_new_privs, cr.network_isolated, cr.filesystem_restricted);
    
    scriptdeck::WorkerReport report = unit.run();
    return finish(channel, report);
}
