// ==============================================================================
// harvest/cancel.hpp - Кооперативная отмена заданий
// ==============================================================================
//
// Задание опрашивает токен между обменами и между группами.
// Отменённое задание возвращает Cancelled и ничего не публикует.
//
// ==============================================================================

#ifndef HARVEST_CANCEL_HPP
#define HARVEST_CANCEL_HPP

#include <atomic>

namespace harvest {

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/// nullptr означает "отмена невозможна"
inline bool is_cancelled(const CancelToken* token) {
    return token != nullptr && token->cancelled();
}

}  // namespace harvest

#endif  // HARVEST_CANCEL_HPP
