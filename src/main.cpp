#include <Arduino.h>
#include <Arduino_GFX_Library.h>  // Core graphics library
#include <LittleFS.h>
#include <time.h>
#include <memory>
#include <string>

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_sleep.h"

#include "Alerts.h"
#include "DiskCache.h"
#include "DisplayManager.h"
#include "EspHttpTransport.h"
#include "LittleFsFileSystem.h"
#include "Log.h"
#include "MessageQueue.h"
#include "NetworkReachability.h"
#include "PageContent.h"
#include "PageRenderer.h"
#include "PollerClock.h"
#include "PollerTask.h"
#include "SettingsManager.h"
#include "SnapshotBuilder.h"
#include "SystemMetrics.h"
#include "TextClient.h"
#include "TextServices.h"
#include "TimeManager.h"
#include "TimeSync.h"
#include "WeatherClient.h"
#include "WeatherService.h"
#include "WiFiManager.h"


//////////////////// DEFINITIONS ///////////////////////////////

#define FORMAT_LITTLEFS_IF_FAILED true

// ST7789 240x320 on the VSPI pins
#define LCD_DC    2
#define LCD_CS    15
#define LCD_SCK   14
#define LCD_MOSI  13
#define LCD_RST   12
#define LCD_BL    21

#define LCD_WIDTH  240
#define LCD_HEIGHT 320

// BOOT button: hold to stop and sleep, press again to wake
#define BOOT_BUTTON   0
#define LONG_PRESS_MS 3000

#define FRAME_INTERVAL_MS    100    // ticker scroll
#define SNAPSHOT_INTERVAL_MS 1000   // data, alerts, reminders
#define STOP_WAIT_MS         15000  // an HTTPS call in flight may run to its timeout

static constexpr const char* TAG = "Main";


Arduino_DataBus *bus = new Arduino_ESP32SPI(LCD_DC, LCD_CS, LCD_SCK, LCD_MOSI, GFX_NOT_DEFINED);

Arduino_GFX *panel = new Arduino_ST7789(
  bus,
  LCD_RST /* RST */,
  0 /* rotation */,
  true /* IPS */,
  LCD_WIDTH,
  LCD_HEIGHT
);

// Pages are drawn off-screen and pushed in one go, no tearing
Arduino_Canvas *canvas = new Arduino_Canvas(LCD_WIDTH, LCD_HEIGHT, panel);


static StopSignal g_stop;
static MessageQueue g_queue(SystemClock::instance());
static EspHttpTransport g_http;
static WiFiConnectivityProbe g_probe;
static EspMetrics g_metrics;

static LittleFsFileSystem g_fs;
static std::unique_ptr<FileStateStore> g_store;
static std::unique_ptr<DiskCache> g_cache;
static std::unique_ptr<WeatherClient> g_weatherClient;
static std::unique_ptr<TextClient> g_textClient;
static std::unique_ptr<NtpTimeSource> g_ntp;

static std::unique_ptr<NetworkReachability> g_network;
static std::unique_ptr<TimeSyncService> g_timeSync;
static std::unique_ptr<WeatherService> g_weather;
static std::unique_ptr<QuoteService> g_quotes;
static std::unique_ptr<LunarService> g_lunar;

static std::unique_ptr<PollerTask> g_tasks[5];

static std::unique_ptr<SnapshotBuilder> g_snapshots;
static std::unique_ptr<AlertPublisher> g_alerts;
static std::unique_ptr<ReminderSchedule> g_reminders;
static std::unique_ptr<PageRotation> g_rotation;
static std::unique_ptr<PageRenderer> g_renderer;

static bool g_fsMounted = false;


static void serial_sink(const char* line)
{
  Serial.println(line);
}


static void start_pollers()
{
  // TLS needs the larger stacks
  g_tasks[0].reset(new PollerTask("net",     [] { g_network->run(); },  4096));
  g_tasks[1].reset(new PollerTask("ntp",     [] { g_timeSync->run(); }, 4096));
  g_tasks[2].reset(new PollerTask("weather", [] { g_weather->run(); },  12288));
  g_tasks[3].reset(new PollerTask("quote",   [] { g_quotes->run(); },   10240));
  g_tasks[4].reset(new PollerTask("lunar",   [] { g_lunar->run(); },    10240));

  for (auto& t : g_tasks) {
    if (!t->start()) {
      panel_log(TAG, "failed to start %s task, that page stays n/a", t->name());
    }
  }
}


static void build_components(const PanelConfig& cfg)
{
  SystemClock& clock = SystemClock::instance();

  g_store.reset(new FileStateStore(g_fs, cfg.paths.stateDir));
  if (!g_fsMounted || !g_store->begin()) {
    panel_log(TAG, "state dir unavailable (%s), cache writes will be counted as failures",
               g_store->lastError());
  }
  g_cache.reset(new DiskCache(*g_store, cfg.paths.files));

  g_weatherClient.reset(new WeatherClient(g_http, cfg.weatherClient()));
  g_textClient.reset(new TextClient(g_http, cfg.textClient()));
  g_ntp.reset(new NtpTimeSource(cfg.time.ntpServer));

  g_network.reset(new NetworkReachability(g_probe, cfg.reachability(), clock, g_stop));
  g_timeSync.reset(new TimeSyncService(*g_ntp, cfg.policyFor(cfg.time.refreshSeconds), clock, g_stop));
  g_weather.reset(new WeatherService(*g_weatherClient, *g_cache, cfg.weatherService(), clock, g_stop));
  g_quotes.reset(new QuoteService(*g_textClient, g_queue, cfg.quoteService(), clock, g_stop));
  g_lunar.reset(new LunarService(*g_textClient, *g_cache,
                                 cfg.policyFor(cfg.shwg.lunarRefreshSeconds), clock, g_stop));

  SnapshotSources src;
  src.network = &g_network->poller();
  src.weather = &g_weather->poller();
  src.lunar = &g_lunar->poller();
  src.quote = &g_quotes->poller();
  src.timeSync = &g_timeSync->poller();
  src.metrics = &g_metrics;
  src.cache = g_cache.get();
  g_snapshots.reset(new SnapshotBuilder(src, clock));

  g_alerts.reset(new AlertPublisher(g_queue, clock));
  g_reminders.reset(new ReminderSchedule(cfg.reminders.times, cfg.reminders.text));
  g_rotation.reset(new PageRotation(cfg.display.pages, seconds_to_ms(cfg.display.pageCycleSeconds)));
  g_renderer.reset(new PageRenderer(canvas, cfg.ui.tickerHeight, cfg.ui.tickerSpeedPxPerS));
}


static void shutdown_and_sleep()
{
  panel_log(TAG, "stop requested, waiting for pollers");

  DisplayManager::instance().powerDown();

  const uint32_t start = millis();
  for (auto& t : g_tasks) {
    while (t && !t->finished() && millis() - start < STOP_WAIT_MS) {
      delay(50);
    }
    if (t && !t->finished()) {
      panel_log(TAG, "%s task still busy, sleeping anyway", t->name());
    }
  }

  wifi_manager_disconnect(true);
  if (g_fsMounted) LittleFS.end();

  panel_log(TAG, "deep sleep, press BOOT to wake");
  Serial.flush();
  esp_sleep_enable_ext0_wakeup((gpio_num_t)BOOT_BUTTON, 0);
  esp_deep_sleep_start();
}


static void check_boot_button()
{
  static uint32_t pressedSince = 0;

  if (digitalRead(BOOT_BUTTON) == LOW) {
    if (pressedSince == 0) {
      pressedSince = millis();
    } else if (millis() - pressedSince >= LONG_PRESS_MS) {
      g_stop.request();
    }
  } else {
    pressedSince = 0;
  }
}


void setup() {

  Serial.begin(115200);
  delay(200);
  log_set_sink(serial_sink);
  panel_log(TAG, "desk panel starting");

  if (!LittleFS.begin(FORMAT_LITTLEFS_IF_FAILED)) {
    panel_log("FS", "LittleFS mount failed, running on defaults without cache");
  } else {
    g_fsMounted = true;
    panel_log("FS", "LittleFS mounted");

    // Load or create settings.json -> fills currentSettings
    initializeSettingsData();
  }

  const PanelConfig& cfg = currentSettings;
  panel_log("Settings", "ssid '%s', location '%s', pages %u",
             cfg.wifi.ssid.c_str(),
             cfg.qweather.locationId.empty() ? cfg.qweather.locationText.c_str()
                                             : cfg.qweather.locationId.c_str(),
             (unsigned)cfg.display.pages.size());

  time_manager_apply_tz(cfg.time.tz.c_str());

  if (!canvas->begin(GFX_NOT_DEFINED)) {
    panel_log(TAG, "canvas begin failed (out of memory?)");
  }
  canvas->fillScreen(0x0000);
  canvas->flush();

  // dark until the first frame is up, then ramp in
  DisplayManager::instance().setBrightnessPercent(0);
  DisplayManager::instance().begin(panel, LCD_BL);
  DisplayManager::instance().rampTo(cfg.display.brightness, 800);

  pinMode(BOOT_BUTTON, INPUT_PULLUP);

  wifi_manager_begin();
  if (!wifi_manager_start_connect(cfg.wifi.ssid.c_str(), cfg.wifi.password.c_str(),
                                  seconds_to_ms(cfg.wifi.connectTimeoutSeconds))) {
    panel_log(TAG, "wifi not started, pages will show cached data");
  }

  build_components(cfg);
  start_pollers();

  panel_log(TAG, "setup finished");
}

void loop() {
  static uint32_t lastSnapshotMs = 0;
  static bool haveSnapshot = false;
  static Snapshot snap;

  if (g_stop.requested()) {
    shutdown_and_sleep();
    return;
  }

  check_boot_button();
  wifi_manager_tick();
  DisplayManager::instance().tick();

  const uint32_t nowMs = millis();

  if (!haveSnapshot || nowMs - lastSnapshotMs >= SNAPSHOT_INTERVAL_MS) {
    lastSnapshotMs = nowMs;
    haveSnapshot = true;

    snap = g_snapshots->build();
    g_alerts->update(snap);

    if (time_manager_clock_valid()) {
      struct tm lt;
      localtime_r(&snap.now, &lt);
      g_reminders->tick(lt, g_queue);
    }
  }

  std::string text = g_queue.current();
  if (text.empty()) text = currentSettings.ui.tickerFallback;

  const PageKind page = g_rotation->current(nowMs);
  g_renderer->render(page, snap, !g_alerts->active().empty(), text, nowMs);

  delay(FRAME_INTERVAL_MS);
}
