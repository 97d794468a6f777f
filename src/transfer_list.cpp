#include "transfer_list.hpp"

#include "format.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

static std::string fold_case(const std::string& s) {
    std::string out = s;
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool in_tab(const Transfer& t, ListTab tab) {
    switch (tab) {
    case ListTab::Active: return is_active(t);
    case ListTab::Queue: return is_queued(t);
    case ListTab::Completed: return is_stopped(t);
    }
    return false;
}

std::vector<Transfer> filter_by_tab(const std::vector<Transfer>& transfers, ListTab tab) {
    std::vector<Transfer> out;
    std::ranges::copy_if(transfers, std::back_inserter(out),
                         [tab](const Transfer& t) { return in_tab(t, tab); });
    return out;
}

size_t count_in_tab(const std::vector<Transfer>& transfers, ListTab tab) {
    return static_cast<size_t>(
        std::ranges::count_if(transfers, [tab](const Transfer& t) { return in_tab(t, tab); }));
}

std::vector<Transfer> filter_by_search(const std::vector<Transfer>& transfers,
                                       const std::string&           query) {
    if (query.empty())
        return transfers;
    const std::string needle = fold_case(query);
    std::vector<Transfer> out;
    std::ranges::copy_if(transfers, std::back_inserter(out), [&needle](const Transfer& t) {
        return fold_case(t.name).find(needle) != std::string::npos;
    });
    return out;
}

void sort_transfers(std::vector<Transfer>& transfers, SortOrder order, bool ascending) {
    auto less = [order](const Transfer& a, const Transfer& b) {
        switch (order) {
        case SortOrder::Name:
            return fold_case(a.name) < fold_case(b.name);
        case SortOrder::Progress:
            return a.progress() < b.progress();
        case SortOrder::Speed:
            return parse_rate(format_rate(a.download_rate)) <
                   parse_rate(format_rate(b.download_rate));
        case SortOrder::Size:
            return a.total_bytes < b.total_bytes;
        case SortOrder::DateAdded:
            return a.added_at < b.added_at;
        case SortOrder::Status:
            return static_cast<int>(a.status) < static_cast<int>(b.status);
        }
        return false;
    };
    if (ascending)
        std::ranges::stable_sort(transfers, less);
    else
        std::ranges::stable_sort(transfers,
                                 [&less](const Transfer& a, const Transfer& b) { return less(b, a); });
}

SortOrder next_sort_order(SortOrder order) {
    switch (order) {
    case SortOrder::Name: return SortOrder::Size;
    case SortOrder::Size: return SortOrder::Progress;
    case SortOrder::Progress: return SortOrder::Speed;
    case SortOrder::Speed: return SortOrder::DateAdded;
    case SortOrder::DateAdded: return SortOrder::Status;
    case SortOrder::Status: return SortOrder::Name;
    }
    return SortOrder::Name;
}

const char* sort_order_name(SortOrder order) {
    switch (order) {
    case SortOrder::Name: return "Name";
    case SortOrder::Progress: return "Progress";
    case SortOrder::Speed: return "Speed";
    case SortOrder::Size: return "Size";
    case SortOrder::DateAdded: return "Date Added";
    case SortOrder::Status: return "Status";
    }
    return "Name";
}
