#pragma once
#include "QuoteTypes.hpp"
#include <optional>
#include <string>

class ChangeClassifier {
public:
    // Exact comparison: feed prices are already quantized.
    static Direction classify(double current, const std::optional<double>& previous) {
        if (!previous)
            return Direction::FirstObservation;
        if (current > *previous) return Direction::Up;
        if (current < *previous) return Direction::Down;
        return Direction::Unchanged;
    }

    // Display glyph for the live table
    static const char* indicator(Direction d) {
        switch (d) {
            case Direction::Up:        return "^";
            case Direction::Down:      return "v";
            case Direction::Unchanged: return "=";
            case Direction::FirstObservation:
            default:                   return " ";
        }
    }

    static const char* name(Direction d) {
        switch (d) {
            case Direction::Up:        return "up";
            case Direction::Down:      return "down";
            case Direction::Unchanged: return "unchanged";
            case Direction::FirstObservation:
            default:                   return "first";
        }
    }

    static std::optional<Direction> from_name(const std::string& s) {
        if (s == "up")        return Direction::Up;
        if (s == "down")      return Direction::Down;
        if (s == "unchanged") return Direction::Unchanged;
        if (s == "first")     return Direction::FirstObservation;
        return std::nullopt;
    }
};
