#pragma once
#include <chrono>
#include <cstdio>
#include <string>

// Простой таймер: сколько заняли импорт отчёта или загрузка мира
class Timer {
private:
    std::chrono::steady_clock::time_point start_time;

public:
    Timer() { start(); }

    void start() {
        start_time = std::chrono::steady_clock::now();
    }

    // Возвращает время в секундах, прошедшее с момента старта
    double get_elapsed_sec() const {
        std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start_time;
        return diff.count();
    }

    double get_elapsed_ms() const {
        return get_elapsed_sec() * 1000.0;
    }

    // "12.3 ms" или "1.25 s" для строки статуса
    std::string format_elapsed() const {
        char buf[32];
        double sec = get_elapsed_sec();
        if (sec < 1.0) {
            std::snprintf(buf, sizeof(buf), "%.1f ms", sec * 1000.0);
        } else {
            std::snprintf(buf, sizeof(buf), "%.2f s", sec);
        }
        return buf;
    }
};
