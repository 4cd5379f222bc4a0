// SPDX-License-Identifier: MIT
// Part of SigProxy (SP) project.
// apps/sp_server.cpp

#include "sp/server.hpp"
#include "sp/proxy_config.hpp"
#include "sp/log.hpp"

#include <iostream>
#include <string>
#include <cstdlib>    // getenv
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --key <hmac key> [--listen 0.0.0.0] [--port 8080]\n"
         "  [--max_size <KB>]                (default 5120)\n"
         "  [--timeout_ms <ms>]              (default 4000)\n"
         "  [--max_redirects <n>]            (default 3)\n"
         "  [--server_name <name>]           (default sigproxy)\n"
         "  [--allow_video 0|1] [--allow_audio 0|1]\n"
         "  [--allow_credential_urls 0|1] [--enable_xfwd_for 0|1]\n"
         "  [--allow_list <file>] [--deny_list <file>]  (one glob per line)\n"
         "  [--header \"Name: value\"]         (repeatable, added to every response)\n"
         "  [--stats 0|1]                    (serve /status)\n"
         "  [--tls_ca <file>] [--tls_verify 0|1]\n"
         "  [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--log_file <path>] [--verbose 0|1]\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n"
         "  [--no_ip_filtering 0|1]          (TESTING ONLY)\n"
         "The key may also be given in the SP_HMAC_KEY environment variable.\n";
}

int main(int argc, char** argv) {
    sp::ProxyConfig cfg;
    bool quiet = false;
    bool verbose = false;
    std::string log_file, allow_file, deny_file;

    if (const char* k = std::getenv("SP_HMAC_KEY")) cfg.hmac_key = k;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--key" && i+1 < argc) cfg.hmac_key = argv[++i];
            else if (a == "--listen" && i+1 < argc) cfg.listen_addr = argv[++i];
            else if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--max_size" && i+1 < argc) cfg.max_size = std::stoll(argv[++i]) * 1024;
            else if (a == "--timeout_ms" && i+1 < argc) cfg.request_timeout_ms = std::stoi(argv[++i]);
            else if (a == "--max_redirects" && i+1 < argc) cfg.max_redirects = std::stoi(argv[++i]);
            else if (a == "--server_name" && i+1 < argc) cfg.server_name = argv[++i];
            else if (a == "--allow_video" && i+1 < argc) cfg.allow_video = (std::stoi(argv[++i]) != 0);
            else if (a == "--allow_audio" && i+1 < argc) cfg.allow_audio = (std::stoi(argv[++i]) != 0);
            else if (a == "--allow_credential_urls" && i+1 < argc) cfg.allow_credential_urls = (std::stoi(argv[++i]) != 0);
            else if (a == "--enable_xfwd_for" && i+1 < argc) cfg.enable_xfwd_for = (std::stoi(argv[++i]) != 0);
            else if (a == "--no_ip_filtering" && i+1 < argc) cfg.no_ip_filtering = (std::stoi(argv[++i]) != 0);
            else if (a == "--allow_list" && i+1 < argc) allow_file = argv[++i];
            else if (a == "--deny_list" && i+1 < argc) deny_file = argv[++i];
            else if (a == "--header" && i+1 < argc) {
                std::pair<std::string,std::string> h;
                if (!sp::parse_header_arg(argv[++i], h)) {
                    std::cerr << "Bad --header value, expected \"Name: value\"\n";
                    return 2;
                }
                cfg.extra_headers.push_back(h);
            }
            else if (a == "--stats" && i+1 < argc) cfg.stats_enabled = (std::stoi(argv[++i]) != 0);
            else if (a == "--tls_ca" && i+1 < argc) cfg.tls_ca_file = argv[++i];
            else if (a == "--tls_verify" && i+1 < argc) cfg.tls_verify = (std::stoi(argv[++i]) != 0);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--verbose" && i+1 < argc) verbose = (std::stoi(argv[++i]) != 0);
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!log_file.empty()) sp::set_log_file(log_file);
    sp::set_log_debug(verbose);

    if (!allow_file.empty() && !sp::load_pattern_file(allow_file, cfg.allow_list)) return 2;
    if (!deny_file.empty() && !sp::load_pattern_file(deny_file, cfg.deny_list)) return 2;

    std::string why;
    if (!sp::validate_config(cfg, why)) {
        std::cerr << "Invalid configuration: " << why << "\n";
        usage(argv[0]);
        return 2;
    }

    try {
        sp::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
