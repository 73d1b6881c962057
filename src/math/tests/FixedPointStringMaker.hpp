/**
 * @file FixedPointStringMaker.hpp
 * @brief Catch2 printer so failing assertions show value and raw bits.
 */
#pragma once

#include <catch2/catch_tostring.hpp>

#include <lockstep/math/FixedPoint.hpp>

#include <string>

template <>
struct Catch::StringMaker<lockstep::math::FixedPoint> {
    static std::string convert(const lockstep::math::FixedPoint &value)
    {
        return value.toString() + " (raw " + std::to_string(value.raw()) + ")";
    }
};
