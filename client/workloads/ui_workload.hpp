#pragma once

#include <stdexcept>

#include "../workload.hpp"

/**
 * @brief Workload "ui"
 * Fetches the landing page and checks that the front end answered.
 * Also used once before the run as the liveness probe.
 */
class UiWorkload : public IWorkload {
public:
    static constexpr const char* MARKER = "UiFrontend";

    std::string name() const override { return "ui"; }

    std::optional<RequestError> execute(httplib::Client& cli, std::mt19937& /*gen*/) override {
        auto res = cli.Get("/");
        if (!res) {
            return transport_error(res);
        }
        if (res->status != 200) {
            return RequestError::unexpected_status(res->status);
        }
        if (res->body.find(MARKER) == std::string::npos) {
            return RequestError{ErrorKind::ContentMismatch, 0,
                                std::string("page content does not match: ") + MARKER};
        }
        return std::nullopt;
    }

    std::unique_ptr<IWorkload> clone() const override {
        return std::make_unique<UiWorkload>(*this);
    }
};

class LivenessCheckFailed : public std::runtime_error {
public:
    LivenessCheckFailed(const std::string& host, const std::string& reason)
        : std::runtime_error("failed to check host " + host + ": " + reason) {}
};
