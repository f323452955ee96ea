#include "WeatherService.h"

#include <utility>

#include "Log.h"

static constexpr const char* TAG = "WeatherService";

WeatherService::WeatherService(WeatherClient& client,
                               DiskCache& cache,
                               WeatherServiceConfig cfg,
                               PollerClock& clock,
                               StopSignal& stop)
: client_(client),
  cache_(cache),
  cfg_(std::move(cfg)),
  clock_(clock),
  poller_("weather",
          [this]() { return fetchOnce(); },
          cfg_.policy,
          clock,
          stop,
          [this](const WeatherReport& r) { return persist_(r); },
          [this](WeatherReport& r, time_t& savedAt) { return preload_(r, savedAt); })
{
}

FetchResult<GeoLocation> WeatherService::location_()
{
    using R = FetchResult<GeoLocation>;

    if (!geo_.id.empty()) return R::success(geo_);

    GeoLocation cached;
    const bool haveCached = cache_.loadGeo(cached);

    if (!cfg_.locationId.empty()) {
        geo_.id = cfg_.locationId;
        if (haveCached && cached.id == cfg_.locationId) {
            geo_.name = cached.name;
        } else {
            geo_.name = cfg_.locationText.empty() ? cfg_.locationId : cfg_.locationText;
        }
        panel_log(TAG, "using configured location %s", geo_.id.c_str());
        return R::success(geo_);
    }

    if (haveCached) {
        geo_ = cached;
        panel_log(TAG, "using cached location %s (%s)", geo_.id.c_str(), geo_.name.c_str());
        return R::success(geo_);
    }

    FetchResult<GeoLocation> looked = client_.resolveLocation(cfg_.locationText);
    if (!looked.ok()) return looked;

    looked.value.resolvedAt = clock_.epochNow();
    geo_ = looked.value;
    // A failed save only costs a lookup on the next boot.
    cache_.saveGeo(geo_);
    return looked;
}

FetchResult<WeatherReport> WeatherService::fetchOnce()
{
    using R = FetchResult<WeatherReport>;

    FetchResult<GeoLocation> loc = location_();
    if (!loc.ok()) return R::failureFrom(loc);

    FetchResult<WeatherFetch> w = client_.fetchWeather(loc.value.id);
    if (!w.ok()) return R::failureFrom(w);

    WeatherReport report;
    report.locationId = loc.value.id;
    report.locationName = loc.value.name.empty() ? "-" : loc.value.name;
    report.now = std::move(w.value.now);

    if (w.value.hasForecast) {
        lastDaily_ = w.value.daily;
        report.daily = std::move(w.value.daily);
    } else {
        report.daily = lastDaily_;
    }
    return R::success(std::move(report));
}

bool WeatherService::persist_(const WeatherReport& report)
{
    bool ok = cache_.saveWeatherNow(report, clock_.epochNow());
    if (!report.daily.empty()) {
        ok = cache_.saveForecast(report) && ok;
    }
    return ok;
}

bool WeatherService::preload_(WeatherReport& report, time_t& savedAt)
{
    if (!cache_.loadWeatherNow(report, savedAt)) return false;

    // The forecast record is optional; an old one is still worth drawing.
    if (cache_.loadForecast(report)) {
        lastDaily_ = report.daily;
    }
    return true;
}
