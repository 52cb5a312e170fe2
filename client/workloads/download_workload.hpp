#pragma once

#include "../workload.hpp"
#include "download_targets.hpp"

/**
 * @brief Workload "download"
 * Replays an identifier discovered by the search workload. The identifier
 * is put back so later cycles can reuse it, and about one request in a
 * hundred asks for the full-size image instead of the thumbnail.
 */
class DownloadWorkload : public IWorkload {
    DownloadTargets& targets;
    std::uniform_int_distribution<> full_size_dist;
public:
    static constexpr const char* THUMB_PREFIX = "/download/thumbnail_";

    explicit DownloadWorkload(DownloadTargets& download_targets)
        : targets(download_targets), full_size_dist(0, 99) {}

    std::string name() const override { return "download"; }

    std::optional<RequestError> execute(httplib::Client& cli, std::mt19937& gen) override {
        auto target = targets.try_receive();
        if (!target || target->empty()) {
            return RequestError{ErrorKind::NoDownloadTargets, 0, "no download urls found"};
        }
        std::string url = *target;
        // Best effort; dropped if the ring filled up in the meantime.
        targets.try_send(*target);

        const std::string prefix(THUMB_PREFIX);
        if (full_size_dist(gen) == 0 && url.compare(0, prefix.size(), prefix) == 0) {
            url = "/download/" + url.substr(prefix.size());
        }

        auto res = cli.Get(url);
        if (!res) {
            return transport_error(res);
        }
        if (res->status != 200) {
            return RequestError::unexpected_status(res->status);
        }
        if (res->body.empty()) {
            return RequestError{ErrorKind::EmptyBody, 0, "download returned empty body"};
        }
        return std::nullopt;
    }

    std::unique_ptr<IWorkload> clone() const override {
        return std::make_unique<DownloadWorkload>(*this);
    }
};
