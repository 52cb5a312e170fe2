#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>

#include "httplib.h"

#include "outcome.hpp"

/**
 * @brief Abstract interface for one kind of synthetic request.
 *
 * Each worker thread receives its own clone of a workload object together
 * with its own HTTP client and random generator, so execute() needs no
 * locking for per-thread state. Shared state (e.g. the download ring) is
 * held by reference and must be thread-safe itself.
 */
class IWorkload {
public:
    virtual ~IWorkload() = default;

    /**
     * @brief Short name used as the log prefix ("upload", "ui", ...).
     */
    virtual std::string name() const = 0;

    /**
     * @brief Performs one request/response exchange and validates it.
     * @param cli The HTTP client dedicated to this thread.
     * @param gen The random number generator dedicated to this thread.
     * @return std::nullopt on success, otherwise what went wrong.
     */
    virtual std::optional<RequestError> execute(httplib::Client& cli, std::mt19937& gen) = 0;

    /**
     * @brief Creates a deep copy of the workload object.
     */
    virtual std::unique_ptr<IWorkload> clone() const = 0;
};

/**
 * @brief Maps an httplib transport failure to a RequestError.
 */
inline RequestError transport_error(const httplib::Result& res) {
    return RequestError::transport(httplib::to_string(res.error()));
}
