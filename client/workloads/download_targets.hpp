#pragma once

#include <cstddef>
#include <string>

#include "../bounded_channel.hpp"

// Identifiers found by the search workload and replayed by the download workload.
using DownloadTargets = BoundedChannel<std::string>;

constexpr size_t DOWNLOAD_TARGETS_CAPACITY = 1000;
