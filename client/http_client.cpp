#include "http_client.hpp"

std::string base_url(const std::string& host) {
    if (host.find("://") != std::string::npos) {
        return host;
    }
    return "http://" + host;
}

void configure_client(httplib::Client& cli, const ClientOptions& options) {
    cli.set_keep_alive(true);
    cli.set_tcp_nodelay(true);
    cli.set_connection_timeout(options.connect_timeout);
    cli.set_read_timeout(options.read_timeout);
    cli.set_write_timeout(options.read_timeout);
}
