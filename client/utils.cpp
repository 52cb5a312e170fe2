#include "utils.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace {

std::mutex log_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y/%m/%d %H:%M:%S");
    return ss.str();
}

void write_line(std::ostream& out, const std::string& msg) {
    std::string stamp = timestamp();
    std::lock_guard<std::mutex> lock(log_mutex);
    out << stamp << " " << msg << std::endl;
}

} // namespace

void log_line(const std::string& msg) {
    write_line(std::cout, msg);
}

void log_error(const std::string& msg) {
    write_line(std::cerr, msg);
}

std::chrono::milliseconds parse_duration(const std::string& text) {
    if (text == "0") {
        return std::chrono::milliseconds(0);
    }
    if (text.empty()) {
        throw std::invalid_argument("empty duration");
    }

    auto is_number_char = [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
    };

    double total_ms = 0.0;
    size_t pos = 0;
    while (pos < text.size()) {
        // Number part: digits with at most one '.', and at least one digit
        size_t start = pos;
        int dots = 0;
        while (pos < text.size() && is_number_char(text[pos])) {
            if (text[pos] == '.') dots++;
            pos++;
        }
        const std::string number = text.substr(start, pos - start);
        if (number.empty() || dots > 1 || number == ".") {
            throw std::invalid_argument("invalid duration '" + text + "'");
        }
        size_t used = 0;
        double value = std::stod(number, &used);
        if (used != number.size()) {
            throw std::invalid_argument("invalid duration '" + text + "'");
        }

        // Unit part: everything up to the next number
        start = pos;
        while (pos < text.size() && !is_number_char(text[pos])) {
            pos++;
        }
        const std::string unit = text.substr(start, pos - start);

        if (unit == "h") {
            total_ms += value * 3600.0 * 1000.0;
        } else if (unit == "m") {
            total_ms += value * 60.0 * 1000.0;
        } else if (unit == "s") {
            total_ms += value * 1000.0;
        } else if (unit == "ms") {
            total_ms += value;
        } else if (unit == "us" || unit == "\u00b5s" || unit == "\u03bcs") {
            total_ms += value / 1000.0;
        } else if (unit == "ns") {
            total_ms += value / 1000000.0;
        } else {
            throw std::invalid_argument("unknown unit '" + unit + "' in duration '" + text + "'");
        }
    }

    // 2^63 ms is far beyond any sane run; reject before the cast
    if (!(total_ms < 9.2e18)) {
        throw std::invalid_argument("duration '" + text + "' is out of range");
    }
    return std::chrono::milliseconds(static_cast<long long>(total_ms));
}

std::string format_duration(std::chrono::milliseconds d) {
    long long ms = d.count();
    if (ms == 0) {
        return "0s";
    }

    std::ostringstream ss;
    long long hours = ms / 3600000;
    ms %= 3600000;
    long long minutes = ms / 60000;
    ms %= 60000;

    if (hours > 0) ss << hours << "h";
    if (minutes > 0) ss << minutes << "m";
    if (ms > 0) {
        if (ms % 1000 == 0) {
            ss << ms / 1000 << "s";
        } else {
            ss << std::fixed << std::setprecision(3) << static_cast<double>(ms) / 1000.0 << "s";
        }
    }
    return ss.str();
}
