#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <json/json.h>

#include "../image_catalog.hpp"
#include "../workload.hpp"

/**
 * @brief Workload "upload"
 * Posts a random fixture as multipart/form-data to /upload, together with a
 * synthesized user name and the fixture's tag as a JSON hashtag list.
 */
class UploadWorkload : public IWorkload {
    const std::vector<Fixture>& fixtures;
    std::uniform_int_distribution<size_t> fixture_dist;
    std::uniform_int_distribution<> user_dist;
public:
    UploadWorkload(const std::vector<Fixture>& images, int user_count)
        : fixtures(images), fixture_dist(0, images.empty() ? 0 : images.size() - 1),
          user_dist(1, user_count > 0 ? user_count : 1) {
        if (images.empty()) {
            throw std::invalid_argument("Upload workload needs at least one fixture.");
        }
        if (user_count <= 0) {
            throw std::invalid_argument("User count must be greater than 0.");
        }
    }

    std::string name() const override { return "upload"; }

    std::optional<RequestError> execute(httplib::Client& cli, std::mt19937& gen) override {
        const Fixture& image = fixtures[fixture_dist(gen)];

        std::ifstream file(image.path, std::ios::binary);
        if (!file) {
            return RequestError{ErrorKind::Io, 0, "cannot open " + image.path};
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            return RequestError{ErrorKind::Io, 0, "cannot read " + image.path};
        }

        std::string user = "user" + std::to_string(user_dist(gen));
        std::string filename = std::filesystem::path(image.path).filename().string();

        httplib::MultipartFormDataItems items = {
            {"username", user, "", ""},
            {"hashtags", hashtags_json(image.tag), "", ""},
            {"file", content, filename, "application/octet-stream"},
        };

        auto res = cli.Post("/upload", items);
        if (!res) {
            return transport_error(res);
        }
        if (res->status != 200) {
            return RequestError::unexpected_status(res->status);
        }
        return std::nullopt;
    }

    std::unique_ptr<IWorkload> clone() const override {
        return std::make_unique<UploadWorkload>(*this);
    }

    static std::string hashtags_json(const std::string& tag) {
        Json::Value tags(Json::arrayValue);
        tags.append(tag);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        return Json::writeString(writer, tags);
    }
};
