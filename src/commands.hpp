#pragma once
#include "service/recommend_service.hpp"
#include "service/search_service.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lookbook {

struct App;

// Numbered result list, one line per item
std::string format_results(const std::vector<SearchResult>& results);

std::string format_recommendation(const Recommendation& rec);

std::string format_history(const std::vector<std::string>& lines);

// Parse a non-negative list position; nullopt on anything else
std::optional<int64_t> parse_index(const std::string& s);

// Run one interactive shell line for user. Returns the text to print.
// Sets quit when the line asks to leave.
std::string run_shell_command(const std::string& line, const std::string& user,
                              App& app, bool& quit);

std::string shell_help();

} // namespace lookbook
