#pragma once

#include <memory>
#include <stdexcept>
#include <vector>

#include <json/json.h>

#include "../workload.hpp"
#include "download_targets.hpp"

/**
 * @brief Workload "search"
 * Posts a keyword search for a random tag ("" searches everything) and
 * feeds the returned identifiers to the download workload.
 */
class SearchWorkload : public IWorkload {
    std::vector<std::string> tags;
    DownloadTargets& targets;
    std::uniform_int_distribution<size_t> tag_dist;
public:
    SearchWorkload(std::vector<std::string> known_tags, DownloadTargets& download_targets)
        : tags(std::move(known_tags)), targets(download_targets),
          tag_dist(0, tags.empty() ? 0 : tags.size() - 1) {
        if (tags.empty()) {
            throw std::invalid_argument("Search workload needs at least one tag.");
        }
    }

    std::string name() const override { return "search"; }

    std::optional<RequestError> execute(httplib::Client& cli, std::mt19937& gen) override {
        const std::string& tag = tags[tag_dist(gen)];

        httplib::Params params{{"keyword", tag}};
        auto res = cli.Post("/search", params);
        if (!res) {
            return transport_error(res);
        }
        if (res->status != 200) {
            return RequestError::unexpected_status(res->status);
        }

        std::vector<std::string> thumbnails;
        std::string parse_error;
        if (!parse_identifiers(res->body, thumbnails, parse_error)) {
            return RequestError{ErrorKind::BadResponse, 0, parse_error};
        }

        for (auto& thumb : thumbnails) {
            if (!targets.try_send(std::move(thumb))) {
                break;
            }
        }
        return std::nullopt;
    }

    std::unique_ptr<IWorkload> clone() const override {
        return std::make_unique<SearchWorkload>(*this);
    }

    /**
     * @brief Decodes a JSON array of strings.
     * @return false with a message in err if body is anything else.
     */
    static bool parse_identifiers(const std::string& body, std::vector<std::string>& out, std::string& err) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errs;
        if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
            err = "invalid search response: " + errs;
            return false;
        }
        if (!root.isArray()) {
            err = "invalid search response: not a JSON array";
            return false;
        }

        out.clear();
        out.reserve(root.size());
        for (const auto& item : root) {
            if (!item.isString()) {
                err = "invalid search response: non-string identifier";
                return false;
            }
            out.push_back(item.asString());
        }
        return true;
    }
};
