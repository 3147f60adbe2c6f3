#include "NumberFormat.hxx"

#include <charconv>
#include <stdexcept>

namespace NumberFormat {

std::string number(double v) {
    if (v == 0.0) v = 0.0; // drop the sign of -0
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc()) throw std::runtime_error("NumberFormat: conversion failed");
    return std::string(buf, res.ptr);
}

std::string point(const Point& p) {
    return number(p[0]) + "," + number(p[1]);
}

} // namespace NumberFormat
