#pragma once

#include "esp_event.h"
#include "esp_netif.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include <functional>
#include <string>

struct WifiLinkConfig {
  std::string ssid;
  std::string password;
  int first_connect_attempts = 5; /*!< 从未连上时最多尝试几次 */
};

/**
 * @brief WiFi Station 链路
 *
 * 只关心链路是否可用：第一次连上之前最多尝试 first_connect_attempts 次，
 * 之后掉线无限重连。链路变化通过回调通知，云端 WebSocket 自己重连服务器。
 * NVS 需要在 start() 之前由调用方初始化。
 *
 * @example
 *   auto& wifi = WifiLink::instance();
 *   wifi.setOnLinkChange([](bool up) { ESP_LOGI("MAIN", "link %d", up); });
 *   ESP_ERROR_CHECK(wifi.start({.ssid = "MySSID", .password = "pass"}));
 *   wifi.waitUntilUp(30000);
 */
class WifiLink {
public:
  static WifiLink &instance();

  WifiLink(const WifiLink &) = delete;
  WifiLink &operator=(const WifiLink &) = delete;

  using LinkCallback = std::function<void(bool up)>;

  /// 回调在系统事件任务中执行，需在 start() 之前设置
  void setOnLinkChange(LinkCallback cb) { m_onLinkChange = std::move(cb); }

  /**
   * @brief 启动 STA 并开始连接，不阻塞
   */
  esp_err_t start(const WifiLinkConfig &cfg);

  /**
   * @brief 等待第一次连接结果
   * @return ESP_OK 已连上, ESP_FAIL 尝试次数用尽, ESP_ERR_TIMEOUT 超时
   */
  esp_err_t waitUntilUp(uint32_t timeoutMs);

  bool isUp() const { return m_up; }

  /// 点分十进制地址，未连上时为空
  std::string ipAddress() const;

private:
  WifiLink() = default;
  ~WifiLink() = default;

  static void onEvent(void *arg, esp_event_base_t base, int32_t id, void *data);

  void linkUp(const esp_ip4_addr_t &ip);
  void linkDown();
  void setUp(bool up);

  WifiLinkConfig m_cfg;
  bool m_started = false;
  volatile bool m_up = false;
  bool m_everUp = false;
  int m_attempts = 0;
  esp_ip4_addr_t m_ip = {};

  EventGroupHandle_t m_events = nullptr;
  LinkCallback m_onLinkChange;

  static constexpr EventBits_t UP_BIT = BIT0;
  static constexpr EventBits_t GAVE_UP_BIT = BIT1;
};
