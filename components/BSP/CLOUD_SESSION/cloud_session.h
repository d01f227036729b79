#pragma once

#include "capture_state.h"
#include "esp_err.h"
#include "esp_websocket_client.h"
#include "subscription.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief 云端连接状态
 */
enum class CloudLinkState {
    Idle,        ///< 未连接
    Connecting,  ///< 连接中 / 等待服务器 hello
    Ready,       ///< 握手完成
};

/**
 * @brief 云端会话配置
 */
struct CloudSessionConfig {
    std::string url;                     ///< WebSocket 服务器 URL (ws:// 或 wss://)
    std::string device_id;               ///< 设备 ID
    int reconnect_timeout_ms = 10000;    ///< 重连超时
    int buffer_size = 4096;              ///< 接收缓冲区大小
    int sample_rate = 16000;             ///< 上行音频采样率
};

/**
 * @brief 云端语音会话 (xiaozhi 兼容协议)
 *
 * 上行：hello / listen start|stop / abort 文本帧和 16-bit PCM 二进制帧。
 * 下行：hello、stt（可带 final 标记）、tts start|stop、expression 情绪分数、
 * error 错误码。
 *
 * 下行回调全部投递到 EventLoop 任务中执行；sendAudio() 可以在采集任务中
 * 直接调用。
 *
 * @example
 *   auto& cloud = CloudSession::instance();
 *   cloud.init({.url = "ws://192.168.1.10:8000/ws", .device_id = "esp32-xxx"});
 *   auto sub = cloud.addSttListener([](const std::string& text, bool final) { ... });
 *   cloud.setOnTtsState([](bool speaking) { ... });
 *   cloud.connect();
 */
class CloudSession {
public:
    using ExpressionScores = std::vector<std::pair<std::string, float>>;

    static CloudSession& instance();

    CloudSession(const CloudSession&) = delete;
    CloudSession& operator=(const CloudSession&) = delete;

    esp_err_t init(const CloudSessionConfig& config);

    esp_err_t connect();
    void disconnect();

    bool isReady() const { return state_.load() == CloudLinkState::Ready; }
    CloudLinkState getState() const { return state_.load(); }
    bool isListening() const { return listening_.load(); }

    const std::string& sessionId() const { return session_id_; }
    int serverSampleRate() const { return server_sample_rate_; }

    /**
     * @brief 发送 listen start
     * @return ESP_ERR_INVALID_STATE 未握手
     */
    esp_err_t startListening();

    /**
     * @brief 发送 listen stop（未在监听时为空操作）
     */
    esp_err_t stopListening();

    /**
     * @brief 发送二进制音频数据
     * @param data PCM 16-bit mono 数据
     * @param len 数据长度 (字节)
     */
    esp_err_t sendAudio(const uint8_t* data, size_t len);

    /**
     * @brief 发送打断信号
     */
    esp_err_t sendAbort();

    // ========== 监听 / 回调（EventLoop 任务中调用） ==========

    /**
     * @brief STT 结果，final=false 为中间结果
     */
    using SttCallback = std::function<void(const std::string& text, bool is_final)>;
    Subscription addSttListener(SttCallback cb) { return stt_listeners_.add(std::move(cb)); }

    /**
     * @brief 服务器报告的识别错误，以及识别中途断线 (NetworkError)
     */
    using ErrorCallback = std::function<void(CaptureError error)>;
    Subscription addErrorListener(ErrorCallback cb) { return error_listeners_.add(std::move(cb)); }

    using TtsStateCallback = std::function<void(bool speaking)>;
    void setOnTtsState(TtsStateCallback cb) { on_tts_state_ = std::move(cb); }

    /**
     * @brief 情绪分数，source 为 "voice" 或 "face"
     */
    using ExpressionCallback =
        std::function<void(const std::string& source, const ExpressionScores& scores)>;
    void setOnExpression(ExpressionCallback cb) { on_expression_ = std::move(cb); }

    using ConnectionCallback = std::function<void(bool connected)>;
    void setOnConnection(ConnectionCallback cb) { on_connection_ = std::move(cb); }

    /**
     * @brief 服务器错误码映射
     *
     * "no-speech" / "aborted" / "network" / "not-allowed" /
     * "service-not-allowed" / "audio-capture" / "invalid-state"，
     * 未知错误码按 NetworkError 处理
     */
    static CaptureError MapErrorCode(const char* code);

private:
    CloudSession() = default;
    ~CloudSession();

    CloudSessionConfig config_;
    esp_websocket_client_handle_t client_ = nullptr;
    std::atomic<CloudLinkState> state_{CloudLinkState::Idle};
    std::atomic<bool> listening_{false};
    bool initialized_ = false;
    std::mutex mutex_;

    std::string session_id_;
    int server_sample_rate_ = 16000;

    // RX framing helpers (handle continuation / oversized frames)
    uint8_t rx_continuation_opcode_ = 0;
    std::string rx_text_buf_;

    ListenerList<const std::string&, bool> stt_listeners_;
    ListenerList<CaptureError> error_listeners_;
    TtsStateCallback on_tts_state_;
    ExpressionCallback on_expression_;
    ConnectionCallback on_connection_;

    esp_err_t sendText(const std::string& text);
    esp_err_t sendListen(const char* state);
    void sendHello();

    void post(std::function<void()> task);
    void onLinkLost(const char* reason);

    static void eventHandler(void* arg, esp_event_base_t event_base,
                             int32_t event_id, void* event_data);
    void handleEvent(esp_websocket_event_data_t* data, int32_t event_id);
    void handleTextMessage(const char* data, size_t len);
};
