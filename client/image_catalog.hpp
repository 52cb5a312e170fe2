#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief A test image and the tag it is uploaded under (its parent
 * directory name).
 */
struct Fixture {
    std::string path;
    std::string tag;
};

class NoFixturesFound : public std::runtime_error {
public:
    explicit NoFixturesFound(const std::string& root)
        : std::runtime_error("no image files found under '" + root + "'") {}
};

/**
 * @brief Recursively collects .jpg/.jpeg/.gif/.png files below root.
 *
 * @throws NoFixturesFound if the walk succeeded but matched nothing.
 * @throws std::filesystem::filesystem_error on any I/O failure.
 */
std::vector<Fixture> load_fixtures(const std::string& root);

/**
 * @brief Distinct tags in first-seen order, preceded by "" (no filter).
 */
std::vector<std::string> collect_tags(const std::vector<Fixture>& fixtures);
