#include "cloud_session.h"
#include "cJSON.h"
#include "esp_log.h"
#include "event_loop.h"
#include <cstring>

static const char* TAG = "CloudSession";

CloudSession& CloudSession::instance() {
    static CloudSession instance;
    return instance;
}

CloudSession::~CloudSession() {
    disconnect();
    if (client_) {
        esp_websocket_client_destroy(client_);
        client_ = nullptr;
    }
}

esp_err_t CloudSession::init(const CloudSessionConfig& config) {
    if (initialized_) {
        ESP_LOGW(TAG, "Already initialized");
        return ESP_OK;
    }

    if (config.url.empty()) {
        ESP_LOGE(TAG, "Empty WebSocket URL");
        return ESP_ERR_INVALID_ARG;
    }

    config_ = config;

    esp_websocket_client_config_t ws_config = {};
    ws_config.uri = config_.url.c_str();
    ws_config.buffer_size = config_.buffer_size;
    ws_config.reconnect_timeout_ms = config_.reconnect_timeout_ms;
    ws_config.network_timeout_ms = 10000;
    ws_config.ping_interval_sec = 30;
    ws_config.pingpong_timeout_sec = 10;

    client_ = esp_websocket_client_init(&ws_config);
    if (!client_) {
        ESP_LOGE(TAG, "Failed to init WebSocket client");
        return ESP_FAIL;
    }

    esp_err_t err = esp_websocket_client_append_header(client_, "Protocol-Version", "1");
    if (err == ESP_OK && !config_.device_id.empty()) {
        err = esp_websocket_client_append_header(client_, "Device-Id", config_.device_id.c_str());
    }
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Failed to append headers: %s", esp_err_to_name(err));
    }

    err = esp_websocket_register_events(client_, WEBSOCKET_EVENT_ANY, eventHandler, this);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register events: %s", esp_err_to_name(err));
        esp_websocket_client_destroy(client_);
        client_ = nullptr;
        return err;
    }

    initialized_ = true;
    state_.store(CloudLinkState::Idle);
    ESP_LOGI(TAG, "Cloud session initialized, URL: %s", config_.url.c_str());
    return ESP_OK;
}

esp_err_t CloudSession::connect() {
    if (!initialized_) {
        ESP_LOGE(TAG, "Not initialized");
        return ESP_ERR_INVALID_STATE;
    }

    if (state_.load() != CloudLinkState::Idle) {
        ESP_LOGW(TAG, "Already connected or connecting");
        return ESP_OK;
    }

    state_.store(CloudLinkState::Connecting);
    ESP_LOGI(TAG, "Connecting to cloud...");

    esp_err_t err = esp_websocket_client_start(client_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start WebSocket client: %s", esp_err_to_name(err));
        state_.store(CloudLinkState::Idle);
    }
    return err;
}

void CloudSession::disconnect() {
    if (!initialized_ || !client_) {
        return;
    }

    if (esp_websocket_client_is_connected(client_)) {
        ESP_LOGI(TAG, "Disconnecting...");
        esp_err_t err = esp_websocket_client_stop(client_);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Stop failed: %s", esp_err_to_name(err));
        }
    }
    state_.store(CloudLinkState::Idle);
    listening_.store(false);
    session_id_.clear();
}

esp_err_t CloudSession::sendText(const std::string& text) {
    if (!client_ || !esp_websocket_client_is_connected(client_)) {
        ESP_LOGW(TAG, "Not connected");
        return ESP_ERR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int sent = esp_websocket_client_send_text(client_, text.c_str(), text.length(), portMAX_DELAY);
    if (sent < 0) {
        ESP_LOGE(TAG, "Failed to send text");
        return ESP_FAIL;
    }

    ESP_LOGD(TAG, "Sent: %s", text.c_str());
    return ESP_OK;
}

esp_err_t CloudSession::sendAudio(const uint8_t* data, size_t len) {
    if (!listening_.load() || data == nullptr || len == 0) {
        return ESP_ERR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int sent = esp_websocket_client_send_bin(client_, (const char*)data, len, portMAX_DELAY);
    if (sent < 0) {
        ESP_LOGE(TAG, "Failed to send audio data");
        return ESP_FAIL;
    }
    return ESP_OK;
}

void CloudSession::sendHello() {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "hello");
    cJSON_AddNumberToObject(root, "version", 1);
    cJSON_AddStringToObject(root, "transport", "websocket");

    cJSON* audio_params = cJSON_CreateObject();
    cJSON_AddStringToObject(audio_params, "format", "pcm");
    cJSON_AddNumberToObject(audio_params, "sample_rate", config_.sample_rate);
    cJSON_AddNumberToObject(audio_params, "channels", 1);
    cJSON_AddItemToObject(root, "audio_params", audio_params);

    // 请求服务器下发中间结果和情绪分数
    cJSON* features = cJSON_CreateObject();
    cJSON_AddBoolToObject(features, "interim_results", true);
    cJSON_AddBoolToObject(features, "expression", true);
    cJSON_AddItemToObject(root, "features", features);

    char* str = cJSON_PrintUnformatted(root);
    esp_err_t err = sendText(str);

    free(str);
    cJSON_Delete(root);

    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Sent hello");
    } else {
        ESP_LOGE(TAG, "Failed to send hello: %s", esp_err_to_name(err));
    }
}

esp_err_t CloudSession::sendListen(const char* state) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "session_id", session_id_.c_str());
    cJSON_AddStringToObject(root, "type", "listen");
    cJSON_AddStringToObject(root, "state", state);
    if (strcmp(state, "start") == 0) {
        cJSON_AddStringToObject(root, "mode", "auto");
    }

    char* str = cJSON_PrintUnformatted(root);
    esp_err_t err = sendText(str);

    free(str);
    cJSON_Delete(root);
    return err;
}

esp_err_t CloudSession::startListening() {
    if (state_.load() != CloudLinkState::Ready) {
        ESP_LOGW(TAG, "Cannot start listening: handshake not complete");
        return ESP_ERR_INVALID_STATE;
    }
    if (listening_.load()) {
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t err = sendListen("start");
    if (err == ESP_OK) {
        listening_.store(true);
        ESP_LOGI(TAG, "Start listening");
    }
    return err;
}

esp_err_t CloudSession::stopListening() {
    if (!listening_.exchange(false)) {
        return ESP_OK;
    }
    if (state_.load() != CloudLinkState::Ready) {
        return ESP_OK;
    }

    esp_err_t err = sendListen("stop");
    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Stop listening");
    }
    return err;
}

esp_err_t CloudSession::sendAbort() {
    if (state_.load() != CloudLinkState::Ready) {
        return ESP_ERR_INVALID_STATE;
    }

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "session_id", session_id_.c_str());
    cJSON_AddStringToObject(root, "type", "abort");
    cJSON_AddStringToObject(root, "reason", "user_interrupt");

    char* str = cJSON_PrintUnformatted(root);
    esp_err_t err = sendText(str);

    free(str);
    cJSON_Delete(root);

    if (err == ESP_OK) {
        ESP_LOGI(TAG, "Sent abort");
    }
    return err;
}

CaptureError CloudSession::MapErrorCode(const char* code) {
    if (code == nullptr) {
        return CaptureError::NetworkError;
    }
    if (strcmp(code, "no-speech") == 0) {
        return CaptureError::NoSpeechTimeout;
    }
    if (strcmp(code, "aborted") == 0) {
        return CaptureError::Aborted;
    }
    if (strcmp(code, "not-allowed") == 0 || strcmp(code, "service-not-allowed") == 0) {
        return CaptureError::PermissionDenied;
    }
    if (strcmp(code, "audio-capture") == 0) {
        return CaptureError::DeviceNotFound;
    }
    if (strcmp(code, "invalid-state") == 0) {
        return CaptureError::EngineInvalidState;
    }
    return CaptureError::NetworkError;
}

void CloudSession::post(std::function<void()> task) {
    esp_err_t err = EventLoop::instance().post(std::move(task));
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Dropped downlink event: %s", esp_err_to_name(err));
    }
}

void CloudSession::onLinkLost(const char* reason) {
    ESP_LOGI(TAG, "Link lost: %s", reason);
    state_.store(CloudLinkState::Idle);
    session_id_.clear();
    rx_continuation_opcode_ = 0;
    rx_text_buf_.clear();

    bool was_listening = listening_.exchange(false);
    post([this, was_listening]() {
        if (was_listening) {
            error_listeners_.notify(CaptureError::NetworkError);
        }
        if (on_connection_) {
            on_connection_(false);
        }
    });
}

void CloudSession::eventHandler(void* arg, esp_event_base_t event_base,
                                int32_t event_id, void* event_data) {
    auto* self = static_cast<CloudSession*>(arg);
    auto* data = static_cast<esp_websocket_event_data_t*>(event_data);
    self->handleEvent(data, event_id);
}

void CloudSession::handleEvent(esp_websocket_event_data_t* data, int32_t event_id) {
    switch (event_id) {
        case WEBSOCKET_EVENT_CONNECTED:
            ESP_LOGI(TAG, "WebSocket connected, waiting for server hello");
            state_.store(CloudLinkState::Connecting);
            sendHello();
            break;

        case WEBSOCKET_EVENT_DISCONNECTED:
            onLinkLost("disconnected");
            break;

        case WEBSOCKET_EVENT_DATA:
            if (data->data_ptr && data->data_len > 0) {
                const uint8_t raw_op = data->op_code;
                uint8_t op = raw_op;

                // 续帧 (opcode 0x00) 沿用上一个非续帧的 opcode
                if (op == 0x00) {
                    op = rx_continuation_opcode_;
                } else if (op == 0x01 || op == 0x02) {
                    rx_continuation_opcode_ = op;
                }

                const bool frame_done =
                    (data->payload_len <= 0) ? data->fin
                                             : ((data->payload_offset + data->data_len) >= data->payload_len);

                if (op == 0x01) {
                    if (raw_op == 0x01 && data->payload_offset == 0) {
                        rx_text_buf_.clear();
                        if (data->payload_len > 0) {
                            rx_text_buf_.reserve((size_t)data->payload_len);
                        }
                    }
                    rx_text_buf_.append(data->data_ptr, (size_t)data->data_len);

                    if (data->fin && frame_done) {
                        ESP_LOGD(TAG, "Text msg len=%u", (unsigned)rx_text_buf_.size());
                        if (!rx_text_buf_.empty()) {
                            handleTextMessage(rx_text_buf_.c_str(), rx_text_buf_.size());
                        }
                        rx_text_buf_.clear();
                    }
                } else if (op == 0x02) {
                    // TTS 音频由播放端处理，这里只关心 start/stop
                    ESP_LOGV(TAG, "Binary frame len=%d", data->data_len);
                }

                if (data->fin && frame_done) {
                    rx_continuation_opcode_ = 0;
                }
            }
            break;

        case WEBSOCKET_EVENT_ERROR:
            ESP_LOGE(TAG, "WebSocket error");
            onLinkLost("error");
            break;

        case WEBSOCKET_EVENT_CLOSED:
            onLinkLost("closed");
            break;

        default:
            break;
    }
}

void CloudSession::handleTextMessage(const char* data, size_t len) {
    if (!data || len == 0) {
        return;
    }

    cJSON* root = cJSON_ParseWithLength(data, len);
    if (!root) {
        ESP_LOGW(TAG, "Failed to parse JSON");
        return;
    }

    cJSON* type_item = cJSON_GetObjectItem(root, "type");
    if (!cJSON_IsString(type_item)) {
        cJSON_Delete(root);
        return;
    }

    const char* type = type_item->valuestring;

    if (strcmp(type, "hello") == 0) {
        cJSON* session_id_item = cJSON_GetObjectItem(root, "session_id");
        if (cJSON_IsString(session_id_item)) {
            session_id_ = session_id_item->valuestring;
        }

        cJSON* audio_params = cJSON_GetObjectItem(root, "audio_params");
        if (cJSON_IsObject(audio_params)) {
            cJSON* sample_rate = cJSON_GetObjectItem(audio_params, "sample_rate");
            if (cJSON_IsNumber(sample_rate)) {
                server_sample_rate_ = sample_rate->valueint;
            }
        }

        state_.store(CloudLinkState::Ready);
        ESP_LOGI(TAG, "Hello handshake complete, session_id=%s, server_sr=%d",
                 session_id_.c_str(), server_sample_rate_);

        post([this]() {
            if (on_connection_) {
                on_connection_(true);
            }
        });

    } else if (strcmp(type, "stt") == 0) {
        cJSON* text_item = cJSON_GetObjectItem(root, "text");
        cJSON* final_item = cJSON_GetObjectItem(root, "final");
        // 老版本服务器只发最终结果，不带 final 字段
        bool is_final = cJSON_IsBool(final_item) ? cJSON_IsTrue(final_item) : true;

        if (cJSON_IsString(text_item)) {
            std::string text = text_item->valuestring;
            ESP_LOGI(TAG, "STT%s: %s", is_final ? "" : " (partial)", text.c_str());
            post([this, text, is_final]() { stt_listeners_.notify(text, is_final); });
        }

    } else if (strcmp(type, "tts") == 0) {
        cJSON* state_item = cJSON_GetObjectItem(root, "state");
        if (cJSON_IsString(state_item)) {
            const char* tts_state = state_item->valuestring;
            bool speaking = false;
            if (strcmp(tts_state, "start") == 0) {
                speaking = true;
            } else if (strcmp(tts_state, "stop") != 0) {
                // sentence_start 等只用于字幕
                cJSON_Delete(root);
                return;
            }
            ESP_LOGI(TAG, "TTS %s", speaking ? "start" : "stop");
            post([this, speaking]() {
                if (on_tts_state_) {
                    on_tts_state_(speaking);
                }
            });
        }

    } else if (strcmp(type, "expression") == 0) {
        cJSON* source_item = cJSON_GetObjectItem(root, "source");
        cJSON* scores_item = cJSON_GetObjectItem(root, "scores");
        if (cJSON_IsString(source_item) && cJSON_IsObject(scores_item)) {
            std::string source = source_item->valuestring;
            ExpressionScores scores;
            cJSON* item = nullptr;
            cJSON_ArrayForEach(item, scores_item) {
                if (item->string != nullptr && cJSON_IsNumber(item)) {
                    scores.emplace_back(item->string, (float)item->valuedouble);
                }
            }
            ESP_LOGD(TAG, "Expression from %s: %u scores", source.c_str(),
                     (unsigned)scores.size());
            post([this, source, scores = std::move(scores)]() {
                if (on_expression_) {
                    on_expression_(source, scores);
                }
            });
        } else {
            ESP_LOGW(TAG, "Malformed expression message");
        }

    } else if (strcmp(type, "error") == 0) {
        cJSON* code_item = cJSON_GetObjectItem(root, "code");
        const char* code = cJSON_IsString(code_item) ? code_item->valuestring : nullptr;
        CaptureError error = MapErrorCode(code);
        ESP_LOGW(TAG, "Server error %s -> %s", code ? code : "(none)",
                 GetCaptureErrorName(error));
        post([this, error]() { error_listeners_.notify(error); });
    }

    cJSON_Delete(root);
}
