#include "image_catalog.hpp"

#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {

bool is_image_extension(const fs::path& p) {
    const std::string ext = p.extension().string();
    return ext == ".jpg" || ext == ".jpeg" || ext == ".gif" || ext == ".png";
}

} // namespace

std::vector<Fixture> load_fixtures(const std::string& root) {
    std::vector<Fixture> fixtures;

    // Any I/O error ends the walk and propagates to the caller.
    for (fs::recursive_directory_iterator it(root), end; it != end; ++it) {
        const fs::directory_entry& entry = *it;
        if (!entry.is_regular_file()) {
            continue;
        }
        const fs::path& path = entry.path();
        if (!is_image_extension(path)) {
            continue;
        }
        fixtures.push_back(Fixture{path.string(), path.parent_path().filename().string()});
    }

    if (fixtures.empty()) {
        throw NoFixturesFound(root);
    }
    return fixtures;
}

std::vector<std::string> collect_tags(const std::vector<Fixture>& fixtures) {
    std::vector<std::string> tags{""};
    std::unordered_set<std::string> seen;
    for (const auto& f : fixtures) {
        if (seen.insert(f.tag).second) {
            tags.push_back(f.tag);
        }
    }
    return tags;
}
