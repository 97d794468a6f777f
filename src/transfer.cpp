#include "transfer.hpp"

#include <algorithm>
#include <cctype>
#include <string>

TransferStatus parse_status(std::string_view s) {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "active")
        return TransferStatus::Active;
    if (lower == "waiting")
        return TransferStatus::Waiting;
    if (lower == "paused")
        return TransferStatus::Paused;
    if (lower == "complete")
        return TransferStatus::Complete;
    if (lower == "removed")
        return TransferStatus::Removed;
    return TransferStatus::Error;
}

const char* status_name(TransferStatus s) {
    switch (s) {
    case TransferStatus::Waiting: return "WAITING";
    case TransferStatus::Active: return "ACTIVE";
    case TransferStatus::Paused: return "PAUSED";
    case TransferStatus::Complete: return "COMPLETE";
    case TransferStatus::Error: return "ERROR";
    case TransferStatus::Removed: return "REMOVED";
    }
    return "ERROR";
}

const char* kind_name(TransferKind k) {
    switch (k) {
    case TransferKind::Http: return "HTTP/HTTPS";
    case TransferKind::Torrent: return "BitTorrent";
    case TransferKind::Metalink: return "Metalink";
    }
    return "HTTP/HTTPS";
}
