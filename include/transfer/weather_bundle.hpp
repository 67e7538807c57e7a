#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nocturne::transfer {

enum class ForecastMode {
    Hourly,
    Weekly
};

const char* forecastModeName(ForecastMode mode);
std::optional<ForecastMode> parseForecastMode(const std::string& name);

/** Human-readable condition for a WMO weather code ("Unknown" if unmapped). */
const char* weatherConditionName(int weatherCode);

int fahrenheitToCelsius(double fahrenheit);

struct HourlyForecast {
    std::string time;           // ISO-8601 local time
    double temperatureF = 0.0;
    int weatherCode = 0;
    int precipitation = 0;      // probability, percent
    int humidity = 0;
    double windSpeed = 0.0;
};

struct DailyForecast {
    std::string date;           // yyyy-mm-dd
    std::string dayName;
    double highF = 0.0;
    double lowF = 0.0;
    int weatherCode = 0;
    int precipitation = 0;
    int humidity = 65;
};

struct WeatherLocation {
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief One weather update as shipped through the weather transfer
 *
 * Hourly bundles carry at most 24 hours, weekly bundles at most 7 days;
 * serialization truncates longer inputs.
 */
struct WeatherBundle {
    ForecastMode mode = ForecastMode::Hourly;
    WeatherLocation location;
    int64_t timestampMs = 0;
    std::vector<HourlyForecast> hours;
    std::vector<DailyForecast> days;
};

constexpr size_t MAX_HOURLY_ENTRIES = 24;
constexpr size_t MAX_DAILY_ENTRIES = 7;

nlohmann::json weatherBundleToJson(const WeatherBundle& bundle);
std::optional<WeatherBundle> weatherBundleFromJson(const nlohmann::json& document);

/** Compact UTF-8 JSON document used as the weather transfer payload. */
std::vector<uint8_t> buildWeatherDocument(const WeatherBundle& bundle);
std::optional<WeatherBundle> parseWeatherDocument(const std::vector<uint8_t>& bytes);

} // namespace nocturne::transfer
