#include <slotbook/BookingService.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

#include <iostream>
#include <sstream>
#include <string>

using namespace slotbook;

namespace {

    void print(const nlohmann::json& j) {
        std::cout << j.dump(2) << "\n";
    }

    void printError(const std::string& code, const std::string& message, bool retriable = false) {
        print({{"success", false}, {"code", code}, {"error", message}, {"retriable", retriable}});
    }

    std::string rest(std::istringstream& iss) {
        std::string out;
        std::getline(iss >> std::ws, out);
        return out;
    }

    CalendarDate requireDate(const std::string& text) {
        auto d = parseDate(text);
        if (!d) {
            throw std::invalid_argument("Invalid date: '" + text + "' (expected YYYY-MM-DD)");
        }
        return *d;
    }

    // Remaining "key=value" tokens: status=, city=, page=, limit=
    struct ListArgs {
        SubmissionFilter filter;
        std::size_t page = 1;
        std::size_t limit = 50;
    };

    ListArgs parseListArgs(std::istringstream& iss) {
        ListArgs args;
        std::string token;
        while (iss >> token) {
            auto eq = token.find('=');
            if (eq == std::string::npos) {
                throw std::invalid_argument("Expected key=value, got '" + token + "'");
            }
            std::string key = token.substr(0, eq);
            std::string value = token.substr(eq + 1);
            if (key == "status") {
                args.filter.status = parseStatus(value);
            } else if (key == "city") {
                args.filter.city = value;
            } else if (key == "page") {
                args.page = std::stoul(value);
            } else if (key == "limit") {
                args.limit = std::stoul(value);
            } else {
                throw std::invalid_argument("Unknown option '" + key + "'");
            }
        }
        return args;
    }

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path configPath;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0] << " [--config path]\n";
            return 2;
        }
    }

    StoreConfig config;
    try {
        config = loadConfig(configPath);
    } catch (const Error& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    log::init(config.logLevel, config.logPattern);

    BookingService service(config);

    std::cout << "Slotbook CLI. Store: " << config.storePath().string() << "\n"
              << "Commands:\n"
              << "  init                                  -- create the store file and start auto backup\n"
              << "  submit <json>                         -- new submission (bookingDate, name, upiNumber, ...)\n"
              << "  list [status=..] [city=..] [page=..] [limit=..]\n"
              << "  get <id>\n"
              << "  update <id> <json>                    -- partial update\n"
              << "  delete <id>\n"
              << "  search <query>\n"
              << "  stats\n"
              << "  export [status=..] [city=..]\n"
              << "  counts <from> <to>                    -- bookings per day\n"
              << "  available <date>\n"
              << "  next [from]                           -- next day with room\n"
              << "  validate <date>\n"
              << "  backup | backups | restore <name>\n"
              << "  archive [months]                      -- default 6\n"
              << "  health | locked\n"
              << "  exit\n";

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "init") {
                service.initialize();
                print({{"success", true}, {"path", service.store().path().string()}});
                continue;
            }

            if (cmd == "submit") {
                auto input = nlohmann::json::parse(rest(iss)).get<SubmissionInput>();
                if (input.ipAddress.empty()) {
                    input.ipAddress = "cli";
                }
                print(nlohmann::json(service.submit(input)));
                continue;
            }

            if (cmd == "list") {
                auto args = parseListArgs(iss);
                print(nlohmann::json(paginate(service.store().list(args.filter), args.page, args.limit)));
                continue;
            }

            if (cmd == "get") {
                std::string id;
                if (!(iss >> id)) {
                    std::cout << "Usage: get <id>\n";
                    continue;
                }
                auto s = service.store().getById(id);
                if (!s) {
                    printError("not_found", "Submission not found: " + id);
                } else {
                    print({{"success", true}, {"data", *s}});
                }
                continue;
            }

            if (cmd == "update") {
                std::string id;
                if (!(iss >> id)) {
                    std::cout << "Usage: update <id> <json>\n";
                    continue;
                }
                auto patch = nlohmann::json::parse(rest(iss)).get<SubmissionPatch>();
                if (patch.empty()) {
                    printError("invalid_argument", "No valid fields to update");
                    continue;
                }
                print({{"success", true}, {"data", service.update(id, patch)}});
                continue;
            }

            if (cmd == "delete") {
                std::string id;
                if (!(iss >> id)) {
                    std::cout << "Usage: delete <id>\n";
                    continue;
                }
                service.remove(id);
                print({{"success", true}, {"message", "Submission deleted successfully"}});
                continue;
            }

            if (cmd == "search") {
                auto query = rest(iss);
                if (query.empty()) {
                    std::cout << "Usage: search <query>\n";
                    continue;
                }
                print({{"success", true}, {"data", service.store().search(query)}});
                continue;
            }

            if (cmd == "stats") {
                print({{"success", true}, {"data", service.store().statistics()}});
                continue;
            }

            if (cmd == "export") {
                auto args = parseListArgs(iss);
                print({{"success", true}, {"path", service.store().exportFiltered(args.filter).string()}});
                continue;
            }

            if (cmd == "counts") {
                std::string from;
                std::string to;
                if (!(iss >> from >> to)) {
                    std::cout << "Usage: counts <from> <to>\n";
                    continue;
                }
                print({{"success", true}, {"data", service.store().bookingCountsByDateRange(requireDate(from), requireDate(to))}});
                continue;
            }

            if (cmd == "available") {
                std::string date;
                if (!(iss >> date)) {
                    std::cout << "Usage: available <date>\n";
                    continue;
                }
                print(nlohmann::json(service.scheduler().isAvailable(requireDate(date))));
                continue;
            }

            if (cmd == "next") {
                std::string from;
                CalendarDate start = (iss >> from) ? requireDate(from) : today();
                auto next = service.scheduler().nextAvailableDate(start);
                print({{"success", true}, {"data", next ? nlohmann::json(*next) : nlohmann::json(nullptr)}});
                continue;
            }

            if (cmd == "validate") {
                std::string date;
                if (!(iss >> date)) {
                    std::cout << "Usage: validate <date>\n";
                    continue;
                }
                print(nlohmann::json(service.scheduler().validate(requireDate(date))));
                continue;
            }

            if (cmd == "backup") {
                print({{"success", true}, {"path", service.manualBackup().string()}});
                continue;
            }

            if (cmd == "backups") {
                print({{"success", true}, {"data", service.backups().listBackups()}});
                continue;
            }

            if (cmd == "restore") {
                std::string name;
                if (!(iss >> name)) {
                    std::cout << "Usage: restore <name>\n";
                    continue;
                }
                print(nlohmann::json(service.restore(name)));
                continue;
            }

            if (cmd == "archive") {
                int months = 6;
                std::string arg;
                if (iss >> arg) {
                    months = std::stoi(arg);
                }
                print(nlohmann::json(service.archive(months)));
                continue;
            }

            if (cmd == "health") {
                print(nlohmann::json(service.health().healthCheck()));
                continue;
            }

            if (cmd == "locked") {
                print({{"locked", service.store().lock().isLocked()}});
                continue;
            }

            std::cout << "Unknown command\n";
        } catch (const Error& ex) {
            printError(toString(ex.kind()), ex.what(), ex.retriable());
        } catch (const nlohmann::json::exception& ex) {
            printError("invalid_json", ex.what());
        } catch (const std::exception& ex) {
            printError("invalid_argument", ex.what());
        }
    }

    return 0;
}
