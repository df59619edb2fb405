/**
 * @file ElevationProvider.cpp
 * @brief Implementation of the Open-Elevation client
 */

#include "ElevationProvider.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace terrain3d {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_initialized() {
    static bool curl_initialized = false;
    if (!curl_initialized) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_initialized = true;
    }
}

} // namespace

OpenElevationProvider::OpenElevationProvider()
    : options_(), logger_("OpenElevationProvider") {
    ensure_curl_initialized();
}

OpenElevationProvider::OpenElevationProvider(const Options& options)
    : options_(options), logger_("OpenElevationProvider") {
    ensure_curl_initialized();
}

std::string OpenElevationProvider::build_request_body(const std::vector<GeoPoint>& points) {
    json locations = json::array();
    for (const auto& point : points) {
        locations.push_back({{"latitude", point.lat}, {"longitude", point.lon}});
    }
    json body;
    body["locations"] = std::move(locations);
    return body.dump();
}

std::optional<std::vector<double>> OpenElevationProvider::parse_response(const std::string& json_response,
                                                                         size_t expected_count) {
    Logger logger("OpenElevationProvider");

    try {
        auto j = json::parse(json_response);

        if (!j.contains("results") || !j["results"].is_array()) {
            logger.error("Response has no 'results' array");
            return std::nullopt;
        }

        const auto& results = j["results"];
        if (results.size() != expected_count) {
            logger.error("Expected " + std::to_string(expected_count) + " elevations, got " +
                         std::to_string(results.size()));
            return std::nullopt;
        }

        std::vector<double> elevations;
        elevations.reserve(results.size());
        for (const auto& item : results) {
            if (!item.contains("elevation") || !item["elevation"].is_number()) {
                logger.error("Result without a numeric elevation");
                return std::nullopt;
            }
            elevations.push_back(item["elevation"].get<double>());
        }
        return elevations;

    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<std::vector<double>> OpenElevationProvider::fetch_batch(const std::vector<GeoPoint>& points) {
    if (points.empty()) {
        return std::vector<double>{};
    }

    logger_.debug("Requesting " + std::to_string(points.size()) + " elevations from " + options_.url);

    auto response = post_json(build_request_body(points));
    if (!response) {
        return std::nullopt;
    }
    return parse_response(*response, points.size());
}

std::optional<std::string> OpenElevationProvider::post_json(const std::string& body) {
    std::string response_data;

    CURL* curl = curl_easy_init();
    if (!curl) {
        logger_.error("Failed to initialize CURL");
        return std::nullopt;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, options_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        logger_.warning("CURL request failed: " + std::string(curl_easy_strerror(res)));
        return std::nullopt;
    }

    if (http_code != 200) {
        logger_.warning("HTTP error " + std::to_string(http_code) + " from " + options_.url);
        return std::nullopt;
    }

    return response_data;
}

} // namespace terrain3d
