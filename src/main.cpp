#include "core/Config.hpp"
#include "core/DateTime.hpp"
#include "core/FeedManager.hpp"
#include "core/Fetcher.hpp"
#include "core/Identity.hpp"
#include "core/JsonStore.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace corkboard::core;

void printHelp() {
    std::cout << "\nCorkboard: keep track of what you have read in your feeds\n"
              << "Usage: corkboard [--db <path>] <command> [arguments]\n\n"
              << "Feeds:\n"
              << "  add <url>              - Subscribe to an RSS or Atom feed\n"
              << "  remove <url>           - Unsubscribe from a feed\n"
              << "  feeds                  - List subscribed feeds\n"
              << "  up                     - Check every feed for new entries\n\n"
              << "Entries:\n"
              << "  new                    - List unread entries, numbered from 1\n"
              << "  mark <n|id>...         - Mark entries read by number or identity\n"
              << "  mark --all             - Mark every unread entry read\n"
              << "  markhash <id>...       - Mark entries read by identity\n\n"
              << "General:\n"
              << "  help, -h, --help       - Show this help\n\n"
              << "Options:\n"
              << "  --db <path>            - Store file (default: corkdb.json, or $CORKBOARD_DB)\n\n"
              << "Numbers shown by 'new' stay valid until the next 'new', even as\n"
              << "'add' and 'up' bring in more entries.\n\n";
}

void printEntry(const QuickmarkedEntry& marked) {
    std::cout << std::right << std::setw(4) << marked.position << "  ";
    if (marked.entry.publishedAt) {
        std::cout << formatTimestamp(*marked.entry.publishedAt) << "  ";
    }
    std::cout << marked.entry.primaryText;
    if (marked.entry.link) {
        std::cout << "  " << *marked.entry.link;
    }
    std::cout << "\n";
}

void printFeedList(const FeedManager& feedManager) {
    auto channels = feedManager.listFeeds();
    if (channels.empty()) {
        std::cout << "No feeds subscribed.\n";
        return;
    }

    for (const auto& channel : channels) {
        std::cout << std::left << std::setw(30) << channel.title << " | " << channel.link << "\n";
    }
}

// Unmarked targets are reported but never fail the command
void printMarkResults(const std::vector<MarkResult>& results) {
    for (const auto& result : results) {
        if (!result.marked()) {
            std::cerr << "Not marked " << result.target << ": " << toString(result.status) << "\n";
        }
    }
}

int handleCommand(FeedManager& feedManager, const std::string& command, const std::vector<std::string>& args) {
    if (command == "add") {
        if (args.empty()) {
            std::cout << "Usage: add <url>\n";
            return 1;
        }
        auto result = feedManager.addFeed(args[0]);
        std::cout << "Added feed: " << result.channel.title << " (" << result.channel.link << ")\n";
        for (const auto& marked : result.newEntries) {
            printEntry(marked);
        }
    }
    else if (command == "remove") {
        if (args.empty()) {
            std::cout << "Usage: remove <url>\n";
            return 1;
        }
        if (!feedManager.removeFeed(args[0])) {
            std::cerr << "Feed not found: " << args[0] << "\n";
            return 1;
        }
        std::cout << "Removed feed: " << args[0] << "\n";
    }
    else if (command == "feeds") {
        printFeedList(feedManager);
    }
    else if (command == "up") {
        for (const auto& report : feedManager.updateFeeds()) {
            if (!report.ok) {
                std::cerr << "Error updating feed " << report.title << " (" << report.link << "): " << report.error << "\n";
                continue;
            }
            if (report.newEntries.empty()) {
                continue;
            }
            std::cout << report.title << ": " << report.newEntries.size() << " new\n";
            for (const auto& marked : report.newEntries) {
                printEntry(marked);
            }
        }
    }
    else if (command == "new") {
        for (const auto& marked : feedManager.listUnread()) {
            printEntry(marked);
        }
    }
    else if (command == "mark" || command == "markhash") {
        if (args.empty()) {
            std::cout << "Usage: " << command << (command == "mark" ? " <n|id>... | --all\n" : " <id>...\n");
            return 1;
        }
        if (command == "mark" && args[0] == "--all") {
            std::cout << "Marked " << feedManager.markAll() << " entries as read\n";
            return 0;
        }

        std::vector<std::string> identities;
        std::vector<int> positions;
        for (const auto& arg : args) {
            if (command == "markhash" || isIdentity(arg)) {
                identities.push_back(arg);
                continue;
            }
            try {
                size_t consumed = 0;
                int position = std::stoi(arg, &consumed);
                if (consumed != arg.size() || position < 1) {
                    throw std::invalid_argument("not a positive number");
                }
                positions.push_back(position);
            } catch (const std::exception&) {
                std::cerr << "Not marked " << arg << ": neither a number nor an identity\n";
            }
        }

        if (!identities.empty()) {
            printMarkResults(feedManager.markByIdentity(identities));
        }
        if (!positions.empty()) {
            printMarkResults(feedManager.markByPosition(positions));
        }
    }
    else if (command == "help" || command == "-h" || command == "--help") {
        printHelp();
    }
    else {
        std::cerr << "Unknown command '" << command << "'. Run 'corkboard help' for available commands.\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        Config config = Config::fromEnvironment();

        // Command line argument parsing
        std::vector<std::string> commands;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--db" && i + 1 < argc && commands.empty()) {
                config.storageFile = argv[++i];
            } else {
                commands.push_back(arg);
            }
        }

        if (commands.empty()) {
            printHelp();
            return 1;
        }

        std::string command = commands[0];
        std::vector<std::string> args(commands.begin() + 1, commands.end());

        // Help needs no store
        if (command == "help" || command == "-h" || command == "--help") {
            printHelp();
            return 0;
        }

        JsonStore store(config.storageFile);
        HttpFetcher fetcher(config);
        FeedManager feedManager(store, fetcher);

        return handleCommand(feedManager, command, args);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
