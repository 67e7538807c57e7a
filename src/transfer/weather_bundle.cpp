#include "transfer/weather_bundle.hpp"
#include "system/logger.hpp"

#include <algorithm>

namespace nocturne::transfer {

using json = nlohmann::json;

const char* forecastModeName(ForecastMode mode) {
    switch (mode) {
        case ForecastMode::Hourly: return "hourly";
        case ForecastMode::Weekly: return "weekly";
    }
    return "unknown";
}

std::optional<ForecastMode> parseForecastMode(const std::string& name) {
    if (name == "hourly") {
        return ForecastMode::Hourly;
    }
    if (name == "weekly") {
        return ForecastMode::Weekly;
    }
    return std::nullopt;
}

const char* weatherConditionName(int weatherCode) {
    switch (weatherCode) {
        case 0: return "Clear";
        case 1: return "Partly Cloudy";
        case 2:
        case 3: return "Cloudy";
        case 45:
        case 48: return "Foggy";
        case 51:
        case 53:
        case 55: return "Drizzle";
        case 56:
        case 57: return "Freezing Drizzle";
        case 61:
        case 63:
        case 65: return "Rain";
        case 66:
        case 67: return "Freezing Rain";
        case 71:
        case 73:
        case 75:
        case 77: return "Snow";
        case 80:
        case 81:
        case 82: return "Rain Showers";
        case 85:
        case 86: return "Snow Showers";
        case 95: return "Thunderstorm";
        case 96:
        case 99: return "Heavy Thunderstorm";
        default: return "Unknown";
    }
}

int fahrenheitToCelsius(double fahrenheit) {
    return static_cast<int>((fahrenheit - 32.0) * 5.0 / 9.0);
}

json weatherBundleToJson(const WeatherBundle& bundle) {
    json document;
    document["type"] = "weatherUpdate";
    document["mode"] = forecastModeName(bundle.mode);
    document["location"] = {
        {"name", bundle.location.name},
        {"latitude", bundle.location.latitude},
        {"longitude", bundle.location.longitude}
    };
    document["timestamp_ms"] = bundle.timestampMs;

    if (bundle.mode == ForecastMode::Hourly) {
        json hours = json::array();
        size_t count = std::min(bundle.hours.size(), MAX_HOURLY_ENTRIES);
        for (size_t i = 0; i < count; ++i) {
            const auto& hour = bundle.hours[i];
            hours.push_back({
                {"time", hour.time},
                {"temp_f", static_cast<int>(hour.temperatureF)},
                {"temp_c", fahrenheitToCelsius(hour.temperatureF)},
                {"condition", weatherConditionName(hour.weatherCode)},
                {"weather_code", hour.weatherCode},
                {"precipitation", hour.precipitation},
                {"humidity", hour.humidity},
                {"wind_speed", static_cast<int>(hour.windSpeed)}
            });
        }
        document["hours"] = std::move(hours);
    } else {
        json days = json::array();
        size_t count = std::min(bundle.days.size(), MAX_DAILY_ENTRIES);
        for (size_t i = 0; i < count; ++i) {
            const auto& day = bundle.days[i];
            days.push_back({
                {"date", day.date},
                {"day_name", day.dayName.empty() ? std::string("Unknown") : day.dayName},
                {"high_f", static_cast<int>(day.highF)},
                {"low_f", static_cast<int>(day.lowF)},
                {"high_c", fahrenheitToCelsius(day.highF)},
                {"low_c", fahrenheitToCelsius(day.lowF)},
                {"condition", weatherConditionName(day.weatherCode)},
                {"weather_code", day.weatherCode},
                {"precipitation", day.precipitation},
                {"humidity", day.humidity}
            });
        }
        document["days"] = std::move(days);
    }

    return document;
}

std::optional<WeatherBundle> weatherBundleFromJson(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }

    try {
        auto mode = parseForecastMode(document.value("mode", std::string()));
        if (!mode) {
            return std::nullopt;
        }

        WeatherBundle bundle;
        bundle.mode = *mode;
        bundle.timestampMs = document.value("timestamp_ms", static_cast<int64_t>(0));

        if (document.contains("location") && document["location"].is_object()) {
            const auto& location = document["location"];
            bundle.location.name = location.value("name", std::string());
            bundle.location.latitude = location.value("latitude", 0.0);
            bundle.location.longitude = location.value("longitude", 0.0);
        }

        if (bundle.mode == ForecastMode::Hourly && document.contains("hours")) {
            for (const auto& entry : document["hours"]) {
                HourlyForecast hour;
                hour.time = entry.value("time", std::string());
                hour.temperatureF = entry.value("temp_f", 0.0);
                hour.weatherCode = entry.value("weather_code", 0);
                hour.precipitation = entry.value("precipitation", 0);
                hour.humidity = entry.value("humidity", 0);
                hour.windSpeed = entry.value("wind_speed", 0.0);
                bundle.hours.push_back(std::move(hour));
            }
        } else if (bundle.mode == ForecastMode::Weekly && document.contains("days")) {
            for (const auto& entry : document["days"]) {
                DailyForecast day;
                day.date = entry.value("date", std::string());
                day.dayName = entry.value("day_name", std::string());
                day.highF = entry.value("high_f", 0.0);
                day.lowF = entry.value("low_f", 0.0);
                day.weatherCode = entry.value("weather_code", 0);
                day.precipitation = entry.value("precipitation", 0);
                day.humidity = entry.value("humidity", 65);
                bundle.days.push_back(std::move(day));
            }
        }

        return bundle;
    } catch (const json::exception& e) {
        Logger::warning("WeatherBundle: malformed document: {}", e.what());
        return std::nullopt;
    }
}

std::vector<uint8_t> buildWeatherDocument(const WeatherBundle& bundle) {
    std::string text = weatherBundleToJson(bundle).dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<WeatherBundle> parseWeatherDocument(const std::vector<uint8_t>& bytes) {
    json document = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::nullopt;
    }
    return weatherBundleFromJson(document);
}

} // namespace nocturne::transfer
