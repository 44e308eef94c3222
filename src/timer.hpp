#ifndef FASTACLEAN_TIMER_HPP
#define FASTACLEAN_TIMER_HPP

#include <chrono>

// A timer that automatically starts on construction
class Timer {
public:
    Timer() : start_time(std::chrono::high_resolution_clock::now()) {
    }

    // Return time elapsed since construction or the last call to lap()
    std::chrono::duration<double> duration() const {
        return std::chrono::high_resolution_clock::now() - start_time;
    }

    std::chrono::duration<double>::rep elapsed() const {
        return duration().count();
    }

    // Return the elapsed time and restart the timer
    std::chrono::duration<double> lap() {
        auto now = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> d = now - start_time;
        start_time = now;
        return d;
    }

private:
    std::chrono::time_point<std::chrono::high_resolution_clock> start_time;
};

#endif
