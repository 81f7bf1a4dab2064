#pragma once

#include <chrono>
#include <optional>
#include <string>

// Все отметки времени в документе: UTC с точностью до секунды
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

Timestamp nowUtc();

// "YYYY-MM-DDTHH:MM:SS"
std::string formatTimestamp(Timestamp ts);

// Принимает и старые записи с дробной частью секунд ("...T12:00:00.123456")
std::optional<Timestamp> parseTimestamp(const std::string& text);
