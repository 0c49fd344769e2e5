#include "app.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: lookbook [--config PATH] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  build [--force]                  Load indexes, or rebuild them all with --force\n"
              << "  search TEXT [-k N] [--user ID]   Search images by text\n"
              << "  image PATH [-k N] [--user ID]    Search images similar to an image\n"
              << "  describe PATH [-k N]             Rank catalog captions for an image\n"
              << "  recommend --user ID              Show recommendations\n"
              << "  history --user ID                Show a user's activity\n"
              << "  clear --user ID                  Delete a user's activity\n"
              << "  shell --user ID                  Interactive session\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.lookbook/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  LOOKBOOK_CONFIG            Config file path\n"
              << "  LOOKBOOK_EMBEDDER_URL      Embedding server base URL\n"
              << "  LOOKBOOK_EMBEDDER_API_KEY  Bearer token for the embedding server\n"
              << "  LOOKBOOK_INDEX_DIR         Index directory\n"
              << "  LOOKBOOK_DB_PATH           Behavior database path\n"
              << "  LOOKBOOK_IMAGE_DIR         Catalog image folder\n";
}

static int run_shell(lookbook::App& app, const std::string& user) {
    std::cout << "lookbook shell for " << user << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    bool quit = false;
    while (!quit) {
        std::cout << "lookbook> " << std::flush;
        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        std::cout << lookbook::run_shell_command(line, user, app, quit);
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> user;
    std::optional<int64_t> top_k;
    bool force = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user = lookbook::trim(argv[++i]);
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            top_k = lookbook::parse_index(argv[++i]);
            if (!top_k || *top_k < 1) {
                std::cerr << "Invalid -k value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--force") == 0) {
            force = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            positional.emplace_back(argv[i]);
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }
    if (user && user->empty()) user.reset();

    auto config = config_path.empty() ? lookbook::Config::load()
                                      : lookbook::Config::load_from(lookbook::expand_home(config_path));
    const int64_t k = top_k.value_or(config.search.default_top_k);

    auto need_user = [&user, &command]() {
        if (user) return true;
        std::cerr << command << " requires --user ID\n";
        return false;
    };
    auto need_arg = [&positional, &command]() {
        if (!positional.empty()) return true;
        std::cerr << command << " requires an argument\n";
        return false;
    };

    if (command != "build" && command != "search" && command != "image" &&
        command != "describe" && command != "recommend" && command != "history" &&
        command != "clear" && command != "shell") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    lookbook::App app(std::move(config));

    if (command == "build") {
        if (force) {
            app.indexes.rebuild();
        } else {
            app.indexes.load_or_build();
        }
        auto image = app.indexes.image_index();
        auto caption = app.indexes.caption_index();
        std::cout << "Images:   " << (image ? image->size() : 0) << "\n"
                  << "Captions: " << (caption ? caption->size() : 0) << "\n";
        for (const auto& key : app.indexes.partitions().keys()) {
            std::cout << "  " << key << ": " << app.indexes.partitions().partition_size(key) << "\n";
        }
        return 0;
    }

    if (command == "history") {
        if (!need_user()) return 1;
        std::cout << lookbook::format_history(app.tracker.activity_history(*user));
        return 0;
    }
    if (command == "clear") {
        if (!need_user()) return 1;
        std::cout << "Deleted " << app.tracker.clear_history(*user) << " events.\n";
        return 0;
    }

    app.indexes.load_or_build();

    if (command == "search") {
        if (!need_arg()) return 1;
        std::string query;
        for (const auto& word : positional) {
            if (!query.empty()) query += " ";
            query += word;
        }
        std::cout << lookbook::format_results(app.search.text_search(query, k, user));
    } else if (command == "image") {
        if (!need_arg()) return 1;
        std::cout << lookbook::format_results(
            app.search.image_search(lookbook::expand_home(positional.front()), k, user));
    } else if (command == "describe") {
        if (!need_arg()) return 1;
        std::cout << lookbook::format_results(
            app.search.describe_image(lookbook::expand_home(positional.front()), k));
    } else if (command == "recommend") {
        if (!need_user()) return 1;
        std::cout << lookbook::format_recommendation(app.recommend.recommend(user));
    } else if (command == "shell") {
        if (!need_user()) return 1;
        return run_shell(app, *user);
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
