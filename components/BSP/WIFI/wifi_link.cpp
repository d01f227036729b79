#include "wifi_link.h"

#include "esp_check.h"
#include "esp_log.h"
#include "esp_wifi.h"

#include <algorithm>
#include <cstring>

static const char *TAG = "WifiLink";

WifiLink &WifiLink::instance() {
  static WifiLink instance;
  return instance;
}

esp_err_t WifiLink::start(const WifiLinkConfig &cfg) {
  if (m_started) {
    return ESP_ERR_INVALID_STATE;
  }
  if (cfg.ssid.empty()) {
    ESP_LOGE(TAG, "SSID not configured");
    return ESP_ERR_INVALID_ARG;
  }
  m_cfg = cfg;

  m_events = xEventGroupCreate();
  if (!m_events) {
    return ESP_ERR_NO_MEM;
  }

  esp_err_t err = esp_netif_init();
  if (err == ESP_OK) {
    err = esp_event_loop_create_default();
  }
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    ESP_LOGE(TAG, "netif/event loop init failed: %s", esp_err_to_name(err));
    return err;
  }
  if (!esp_netif_create_default_wifi_sta()) {
    return ESP_FAIL;
  }

  wifi_init_config_t init = WIFI_INIT_CONFIG_DEFAULT();
  ESP_RETURN_ON_ERROR(esp_wifi_init(&init), TAG, "esp_wifi_init");
  ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(
                          WIFI_EVENT, WIFI_EVENT_STA_START, &onEvent, this, nullptr),
                      TAG, "register STA_START");
  ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(
                          WIFI_EVENT, WIFI_EVENT_STA_DISCONNECTED, &onEvent, this,
                          nullptr),
                      TAG, "register STA_DISCONNECTED");
  ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(
                          IP_EVENT, IP_EVENT_STA_GOT_IP, &onEvent, this, nullptr),
                      TAG, "register GOT_IP");

  wifi_config_t sta = {};
  std::memcpy(sta.sta.ssid, cfg.ssid.data(),
              std::min(cfg.ssid.size(), sizeof(sta.sta.ssid) - 1));
  std::memcpy(sta.sta.password, cfg.password.data(),
              std::min(cfg.password.size(), sizeof(sta.sta.password) - 1));
  sta.sta.threshold.authmode =
      cfg.password.empty() ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;

  ESP_RETURN_ON_ERROR(esp_wifi_set_mode(WIFI_MODE_STA), TAG, "set_mode");
  ESP_RETURN_ON_ERROR(esp_wifi_set_config(WIFI_IF_STA, &sta), TAG, "set_config");
  ESP_RETURN_ON_ERROR(esp_wifi_start(), TAG, "esp_wifi_start");

  m_started = true;
  ESP_LOGI(TAG, "Station started, SSID %s", cfg.ssid.c_str());
  return ESP_OK;
}

esp_err_t WifiLink::waitUntilUp(uint32_t timeoutMs) {
  if (!m_started) {
    return ESP_ERR_INVALID_STATE;
  }
  EventBits_t bits = xEventGroupWaitBits(m_events, UP_BIT | GAVE_UP_BIT, pdFALSE,
                                         pdFALSE, pdMS_TO_TICKS(timeoutMs));
  if (bits & UP_BIT) {
    return ESP_OK;
  }
  return (bits & GAVE_UP_BIT) ? ESP_FAIL : ESP_ERR_TIMEOUT;
}

std::string WifiLink::ipAddress() const {
  if (!m_up) {
    return std::string();
  }
  char buf[16];
  snprintf(buf, sizeof(buf), IPSTR, IP2STR(&m_ip));
  return buf;
}

void WifiLink::onEvent(void *arg, esp_event_base_t base, int32_t id, void *data) {
  auto *self = static_cast<WifiLink *>(arg);
  if (base == IP_EVENT) {
    self->linkUp(static_cast<ip_event_got_ip_t *>(data)->ip_info.ip);
  } else if (id == WIFI_EVENT_STA_DISCONNECTED) {
    self->linkDown();
  } else {
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "esp_wifi_connect: %s", esp_err_to_name(err));
    }
  }
}

void WifiLink::linkUp(const esp_ip4_addr_t &ip) {
  m_ip = ip;
  m_attempts = 0;
  m_everUp = true;
  ESP_LOGI(TAG, "Link up, IP " IPSTR, IP2STR(&m_ip));
  xEventGroupSetBits(m_events, UP_BIT);
  setUp(true);
}

void WifiLink::linkDown() {
  setUp(false);

  // 从未连上时有次数上限，连上过之后一直重连
  if (!m_everUp && ++m_attempts >= m_cfg.first_connect_attempts) {
    ESP_LOGE(TAG, "Giving up on %s after %d attempts", m_cfg.ssid.c_str(),
             m_attempts);
    xEventGroupSetBits(m_events, GAVE_UP_BIT);
    return;
  }
  esp_err_t err = esp_wifi_connect();
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Reconnect failed: %s", esp_err_to_name(err));
  }
}

void WifiLink::setUp(bool up) {
  if (m_up == up) {
    return;
  }
  m_up = up;
  if (!up) {
    ESP_LOGW(TAG, "Link down");
  }
  if (m_onLinkChange) {
    m_onLinkChange(up);
  }
}
