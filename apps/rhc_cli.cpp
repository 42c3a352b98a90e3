/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/client.hpp"
#include "rhc/errors.hpp"
#include "rhc/http_response.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --url https://host[:port][/path] [--method GET|POST|PUT|DELETE]\n"
      "      [--path /p] [--header 'Name: value']... [--data STRING | --form k=v ...]\n"
      "      [--timeout ms] [--retries n] [--retry_delay ms]\n"
      "      [--fingerprint AB:CD:...] [--tls_ca ca.pem] [--insecure 0|1] [--log_file path]\n"
      "\n"
      "Load mode (same request repeated by concurrent callers):\n"
      "  " << argv0 << " ... --repeat 100 --concurrency 8\n";
}

static bool parse_method(const std::string& s, rhc::Method& out){
    if(s=="GET") out = rhc::Method::Get;
    else if(s=="POST") out = rhc::Method::Post;
    else if(s=="PUT") out = rhc::Method::Put;
    else if(s=="DELETE") out = rhc::Method::Delete;
    else return false;
    return true;
}

static void print_body(const rhc::Response& resp){
    if(!resp.data){ std::cout << "(no body)\n"; return; }
    if(resp.has_json()) std::cout << resp.json().dump(2) << "\n";
    else if(resp.has_bytes()) std::cout << "(" << resp.bytes().size() << " bytes of binary data)\n";
    else std::cout << resp.text() << "\n";
}

static int print_result(const rhc::Result& r){
    if(!r.ok()){
        std::cerr << "request failed [" << rhc::error_kind_name(r.error->kind()) << "]: " << r.error->what() << "\n";
        if(const auto* se = dynamic_cast<const rhc::StatusError*>(r.error.get())){
            std::cerr << "HTTP " << se->response().status_code << " " << se->response().status_message << "\n";
            if(se->response().has_text()) std::cerr << se->response().text() << "\n";
        }
        return 1;
    }
    const rhc::Response& resp = *r.value;
    std::cout << "HTTP " << resp.status_code << " " << resp.status_message
              << "  (" << resp.url << ", attempts=" << resp.attempts << ")\n";
    for(const auto& kv : resp.headers){
        std::cout << kv.first << ": " << kv.second << "\n";
    }
    std::cout << "\n";
    print_body(resp);
    return 0;
}

int main(int argc, char** argv){
    rhc::ClientConfig cfg;
    cfg.log_file = "rhc_cli.log";

    rhc::RequestOptions opts;
    rhc::Method method = rhc::Method::Get;
    std::string fingerprint;
    std::optional<rhc::RequestBody> body;
    rhc::FormData form;
    int repeat = 1;
    int concurrency = 1;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--url" && i+1<argc) opts.host = argv[++i];
            else if(a=="--method" && i+1<argc){ if(!parse_method(argv[++i], method)){ usage(argv[0]); return 2; } }
            else if(a=="--path" && i+1<argc) opts.path = argv[++i];
            else if(a=="--header" && i+1<argc){
                std::string h = argv[++i];
                const auto c = h.find(':');
                if(c==std::string::npos){ usage(argv[0]); return 2; }
                std::string v = h.substr(c+1);
                v.erase(0, v.find_first_not_of(' '));
                opts.headers[h.substr(0,c)] = v;
            }
            else if(a=="--data" && i+1<argc) body = rhc::RequestBody{std::string(argv[++i])};
            else if(a=="--form" && i+1<argc){
                std::string kv = argv[++i];
                const auto eq = kv.find('=');
                form.emplace_back(kv.substr(0,eq), eq==std::string::npos ? "" : kv.substr(eq+1));
            }
            else if(a=="--timeout" && i+1<argc) opts.timeout = std::chrono::milliseconds(std::max(1, std::stoi(argv[++i])));
            else if(a=="--retries" && i+1<argc) opts.max_retries = (unsigned)std::max(0, std::stoi(argv[++i]));
            else if(a=="--retry_delay" && i+1<argc) opts.retry_delay = std::chrono::milliseconds(std::max(0, std::stoi(argv[++i])));
            else if(a=="--fingerprint" && i+1<argc) fingerprint = argv[++i];
            else if(a=="--tls_ca" && i+1<argc) cfg.tls_ca_file = argv[++i];
            else if(a=="--insecure" && i+1<argc) cfg.tls_verify_peer = (std::stoi(argv[++i])==0);
            else if(a=="--log_file" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--repeat" && i+1<argc) repeat = std::max(1, std::stoi(argv[++i]));
            else if(a=="--concurrency" && i+1<argc) concurrency = std::max(1, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    if(opts.host.empty()){ usage(argv[0]); return 2; }
    if(!form.empty()){
        if(body){ std::cerr << "--data and --form are exclusive\n"; return 2; }
        body = rhc::RequestBody{form};
    }

    rhc::Client cli(cfg);

    if(repeat == 1){
        return print_result(cli.request(method, opts, fingerprint, body));
    }

    // === Load mode ===
    // Batches of `concurrency` independent calls, each on its own thread.
    std::size_t success = 0, failed = 0;
    std::vector<double> lat_ms;
    lat_ms.reserve((std::size_t)repeat);

    const auto t_start = std::chrono::steady_clock::now();
    int launched = 0;
    while(launched < repeat){
        const int batch = std::min(concurrency, repeat - launched);
        std::vector<std::pair<std::chrono::steady_clock::time_point, std::future<rhc::Result>>> inflight;
        for(int i=0;i<batch;++i){
            inflight.emplace_back(std::chrono::steady_clock::now(), cli.request_async(method, opts, fingerprint, body));
        }
        for(auto& f : inflight){
            const rhc::Result r = f.second.get();
            const auto t1 = std::chrono::steady_clock::now();
            if(r.ok()){
                ++success;
                lat_ms.push_back(std::chrono::duration_cast<std::chrono::microseconds>(t1 - f.first).count() / 1000.0);
            } else {
                ++failed;
            }
        }
        launched += batch;
    }
    const double wall_sec = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - t_start).count() / 1e6;

    std::sort(lat_ms.begin(), lat_ms.end());
    double mn = 0.0, mx = 0.0, avg = 0.0;
    if(!lat_ms.empty()){
        mn = lat_ms.front();
        mx = lat_ms.back();
        avg = std::accumulate(lat_ms.begin(), lat_ms.end(), 0.0) / static_cast<double>(lat_ms.size());
    }

    std::cout << "=== rhc load results ===\n";
    std::cout << "duration: " << std::fixed << std::setprecision(3) << wall_sec << " s\n";
    std::cout << "concurrency: " << concurrency << "\n";
    std::cout << "success:  " << success << "\n";
    std::cout << "errors:   " << failed  << "\n";
    std::cout << "latency (ms):  min: " << mn << "  avg: " << avg << "  max: " << mx << "\n";
    return failed == 0 ? 0 : 1;
}
