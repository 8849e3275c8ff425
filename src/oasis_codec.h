#pragma once

#include <optional>

#include <QString>

#include "oasis_types.h"

namespace oasis::control {

// Minimum number of ';'-separated fields in a full status string. A 19th
// field, when present, carries the software version.
inline constexpr int kStatusFieldCount = 18;

enum class StatusLayout {
    Invalid,
    V1, // 18 fields
    V2, // 18 fields + software version
};

StatusLayout statusLayout(const QString &raw);

// Parses a full status string (HTTP GETSTATUS body or FULLSTATUS topic).
// Returns std::nullopt and fills *error when the string is empty or has
// fewer than 18 fields. Malformed numeric fields parse as 0.
std::optional<FieldMap> parseFullStatus(const QString &raw, QString *error = nullptr);

// Maps a single "<serial>/STATUS/<suffix>" payload to a field update.
// Returns std::nullopt for suffixes outside the known set and for payloads
// that cannot be parsed; *error says which.
std::optional<FieldMap> parseTopicValue(const QString &suffix,
                                        const QString &payload,
                                        QString *error = nullptr);

bool isKnownStatusTopic(const QString &suffix);

int parseIntOrZero(const QString &text);
bool parseBit(const QString &text);
QList<int> parsePlaylist(const QString &csv);

} // namespace oasis::control
