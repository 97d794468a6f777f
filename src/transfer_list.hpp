#pragma once

#include "transfer.hpp"

#include <string>
#include <vector>

enum class ListTab { Active = 0, Queue = 1, Completed = 2 };

enum class SortOrder { Name, Size, Progress, Speed, DateAdded, Status };

bool                  in_tab(const Transfer& t, ListTab tab);
std::vector<Transfer> filter_by_tab(const std::vector<Transfer>& transfers, ListTab tab);
size_t                count_in_tab(const std::vector<Transfer>& transfers, ListTab tab);

// Case-insensitive substring match on the display name; an empty query keeps
// everything.
std::vector<Transfer> filter_by_search(const std::vector<Transfer>& transfers,
                                       const std::string&           query);

// Stable sort; ties keep their incoming order. Speed compares the displayed
// rate strings, so transfers showing the same rate sort as equal. Status
// follows the lifecycle: waiting, active, paused, complete, error, removed.
void sort_transfers(std::vector<Transfer>& transfers, SortOrder order, bool ascending);

SortOrder   next_sort_order(SortOrder order);
const char* sort_order_name(SortOrder order);
