#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

/**
 * @brief 订阅句柄
 *
 * 由 subscribe/add 类接口返回，调用方持有。析构或 reset() 时自动取消订阅，
 * 发布者先于句柄销毁时 reset() 为空操作。
 *
 * @example
 *   Subscription sub = adapter.subscribe([](const auto& readings) { ... });
 *   ...
 *   sub.reset(); // 或者离开作用域
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release)
        : release_(std::move(release)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : release_(std::move(other.release_)) {
        other.release_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release_ = std::move(other.release_);
            other.release_ = nullptr;
        }
        return *this;
    }

    /**
     * @brief 取消订阅（幂等）
     */
    void reset() {
        if (release_) {
            auto release = std::move(release_);
            release_ = nullptr;
            release();
        }
    }

    bool active() const { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

/**
 * @brief 回调列表，add() 返回 Subscription
 *
 * 通知时遍历快照，回调里取消订阅是安全的。
 */
template <typename... Args>
class ListenerList {
public:
    using Callback = std::function<void(Args...)>;

    ListenerList() : entries_(std::make_shared<std::vector<Entry>>()) {}

    ListenerList(const ListenerList&) = delete;
    ListenerList& operator=(const ListenerList&) = delete;

    Subscription add(Callback callback) {
        int id = next_id_++;
        entries_->push_back(Entry{id, std::move(callback)});

        std::weak_ptr<std::vector<Entry>> weak = entries_;
        return Subscription([weak, id]() {
            if (auto entries = weak.lock()) {
                entries->erase(
                    std::remove_if(entries->begin(), entries->end(),
                                   [id](const Entry& e) { return e.id == id; }),
                    entries->end());
            }
        });
    }

    void notify(Args... args) const {
        auto snapshot = *entries_;
        for (const auto& [id, callback] : snapshot) {
            // 前面的回调可能已经取消了这个订阅
            if (callback && contains(id)) {
                callback(args...);
            }
        }
    }

    size_t size() const { return entries_->size(); }
    bool empty() const { return entries_->empty(); }

private:
    struct Entry {
        int id;
        Callback callback;
    };

    bool contains(int id) const {
        return std::any_of(entries_->begin(), entries_->end(),
                           [id](const Entry& e) { return e.id == id; });
    }

    std::shared_ptr<std::vector<Entry>> entries_;
    int next_id_ = 0;
};
