#include "commands.hpp"
#include "app.hpp"
#include "util.hpp"
#include <cstdio>

namespace lookbook {

namespace {

std::string format_score(float score) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(score));
    return buf;
}

std::string display_caption(const std::string& caption, const std::string& id) {
    return caption.empty() ? base_name(id) : caption;
}

} // namespace

std::string format_results(const std::vector<SearchResult>& results) {
    if (results.empty()) return "No results.\n";
    std::string out;
    for (size_t i = 0; i < results.size(); ++i) {
        out += "  " + std::to_string(i) + ". [" + format_score(results[i].score) + "] "
            + display_caption(results[i].caption, results[i].id)
            + "  (" + base_name(results[i].id) + ")\n";
    }
    return out;
}

std::string format_recommendation(const Recommendation& rec) {
    std::string out = rec.reason + "\n";
    if (rec.items.empty()) return out + "No items.\n";
    for (size_t i = 0; i < rec.items.size(); ++i) {
        const auto& item = rec.items[i];
        out += "  " + std::to_string(i) + ". ";
        if (item.source == ItemSource::Personalized) {
            out += "[" + format_score(item.score) + "] ";
        } else {
            out += "[" + item_source_to_string(item.source) + "] ";
        }
        out += display_caption(item.caption, item.id) + "  (" + base_name(item.id) + ")\n";
    }
    return out;
}

std::string format_history(const std::vector<std::string>& lines) {
    if (lines.empty()) return "No activity yet. Try a search or click a recommendation.\n";
    std::string out;
    for (const auto& line : lines) out += line + "\n";
    return out;
}

std::optional<int64_t> parse_index(const std::string& s) {
    std::string t = trim(s);
    if (t.empty() || t.size() > 9) return std::nullopt;
    for (char c : t) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return std::stoll(t);
}

std::string shell_help() {
    return "Commands:\n"
           "  /search TEXT   Search images by text\n"
           "  /image PATH    Search images similar to an image\n"
           "  /click N       Record a click on search result N\n"
           "  /recommend     Show recommendations\n"
           "  /pick N        Record a click on recommendation N\n"
           "  /history       Show your activity\n"
           "  /clear         Delete your activity\n"
           "  /help          Show this help\n"
           "  /quit          Exit\n";
}

std::string run_shell_command(const std::string& line, const std::string& user,
                              App& app, bool& quit) {
    std::string input = trim(line);
    if (input.empty()) return "";

    auto space = input.find(' ');
    std::string cmd = input.substr(0, space);
    std::string arg = space == std::string::npos ? "" : trim(input.substr(space + 1));
    const int64_t k = app.config.search.default_top_k;

    if (cmd == "/quit" || cmd == "/exit") {
        quit = true;
        return "";
    }
    if (cmd == "/help") return shell_help();
    if (cmd == "/search") {
        if (arg.empty()) return "Usage: /search TEXT\n";
        return format_results(app.search.text_search(arg, k, user));
    }
    if (cmd == "/image") {
        if (arg.empty()) return "Usage: /image PATH\n";
        return format_results(app.search.image_search(expand_home(arg), k, user));
    }
    if (cmd == "/click" || cmd == "/pick") {
        auto index = parse_index(arg);
        if (!index) return "Usage: " + cmd + " N\n";
        auto id = cmd == "/click" ? app.tracker.track_search_click(user, *index)
                                  : app.tracker.track_recommend_click(user, *index);
        if (!id) return "Invalid index (out of range or no results shown yet)\n";
        return "Recorded click: " + base_name(*id) + "\n";
    }
    if (cmd == "/recommend") return format_recommendation(app.recommend.recommend(user));
    if (cmd == "/history") return format_history(app.tracker.activity_history(user));
    if (cmd == "/clear") {
        uint32_t removed = app.tracker.clear_history(user);
        return "Deleted " + std::to_string(removed) + " events.\n";
    }
    if (cmd[0] != '/') return format_results(app.search.text_search(input, k, user));
    return "Unknown command: " + cmd + "\n";
}

} // namespace lookbook
