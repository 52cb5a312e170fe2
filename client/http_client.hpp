#pragma once

#include <chrono>
#include <string>

#include "httplib.h"

struct ClientOptions {
    std::string host = "127.0.0.1";  // "host" or "host:port", optionally with scheme
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
};

// "127.0.0.1:8080" -> "http://127.0.0.1:8080"; URLs with a scheme are kept.
std::string base_url(const std::string& host);

// Applies keep-alive, TCP_NODELAY and the configured deadlines.
void configure_client(httplib::Client& cli, const ClientOptions& options);
