/**
 * @file ElevationProvider.hpp
 * @brief Point elevation lookup services
 *
 * The acquirer talks to an abstract provider so that the network service
 * can be swapped for a local or scripted source. OpenElevationProvider
 * queries an Open-Elevation compatible HTTP endpoint.
 */

#pragma once

#include "terrain3d.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace terrain3d {

/**
 * @brief Geographic sample location in decimal degrees
 */
struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;

    GeoPoint() = default;
    GeoPoint(double lat, double lon) : lat(lat), lon(lon) {}
};

/**
 * @brief Source of elevations for batches of points
 */
class ElevationProvider {
public:
    virtual ~ElevationProvider() = default;

    /**
     * @brief Look up elevations for a batch of points
     * @return One elevation in meters per point, in request order, or
     *         std::nullopt when the request failed
     */
    virtual std::optional<std::vector<double>> fetch_batch(const std::vector<GeoPoint>& points) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Open-Elevation lookup API over HTTP POST
 */
class OpenElevationProvider : public ElevationProvider {
public:
    struct Options {
        std::string url;
        std::string user_agent;
        int timeout_seconds;

        Options()
            : url("https://api.open-elevation.com/api/v1/lookup"),
              user_agent("terrain3d/1.0"),
              timeout_seconds(30) {}
    };

    OpenElevationProvider();
    explicit OpenElevationProvider(const Options& options);

    std::optional<std::vector<double>> fetch_batch(const std::vector<GeoPoint>& points) override;

    std::string name() const override { return "open-elevation"; }

    /**
     * @brief Request body: {"locations":[{"latitude":..,"longitude":..},...]}
     */
    static std::string build_request_body(const std::vector<GeoPoint>& points);

    /**
     * @brief Extract results[i].elevation; nullopt on malformed JSON or a count mismatch
     */
    static std::optional<std::vector<double>> parse_response(const std::string& json_response,
                                                             size_t expected_count);

    const Options& get_options() const { return options_; }

private:
    Options options_;
    Logger logger_;

    std::optional<std::string> post_json(const std::string& body);
};

} // namespace terrain3d
