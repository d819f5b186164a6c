/**
 * @file time.hpp
 * @brief Time helpers for dingstream.
 *
 * Token expiry is tracked on the wall clock; the negotiator takes a Clock so
 * tests can move time forward without sleeping.
 */
#pragma once
#include <chrono>
#include <functional>

namespace dingstream {

    using WallTime = std::chrono::system_clock::time_point;

    /**
     * @typedef Clock
     * @brief Source of the current wall-clock time.
     */
    using Clock = std::function<WallTime()>;

    inline WallTime systemNow() {
        return std::chrono::system_clock::now();
    }

}
