#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <optional>
#include <reglib/config_file.hh>
#include <reglib/logger.hh>
#include <reglist/invariant_violation.hh>
#include <reglist/mysql/mysql.hh>
#include <reglist/report/build_registration_report.hh>
#include <reglist/report/registration_report.hh>
#include <string_view>

static void help(const char* program_name) {
    if (!program_name) {
        program_name = "registration-report";
    }

    printf("Usage: %s [--config <PATH>] <COMPETITION_ID>\n", program_name);
    puts("Prints the registration report of the competition <COMPETITION_ID> as JSON.");
    puts("Database credentials (host, user, password, db) are read from <PATH>, by default from "
         ".db.config");
}

static std::optional<uint64_t> parse_competition_id(std::string_view str) {
    uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), id);
    if (str.empty() or ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return id;
}

int main(int argc, char** argv) {
    const char* program_name = argc > 0 ? argv[0] : nullptr;
    const char* config_path = ".db.config";
    const char* competition_id_str = nullptr;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--help") == 0 or strcmp(argv[i], "-h") == 0) {
            help(program_name);
            return 0;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 == argc) {
                errlog("Missing path after --config");
                return 1;
            }
            config_path = argv[++i];
        } else if (competition_id_str) {
            help(program_name);
            return 1;
        } else {
            competition_id_str = argv[i];
        }
    }
    if (!competition_id_str) {
        help(program_name);
        return 1;
    }
    auto competition_id = parse_competition_id(competition_id_str);
    if (!competition_id) {
        errlog("Invalid competition id: ", competition_id_str);
        return 1;
    }

    try {
        auto mysql = reglist::mysql::Connection::from_credential_file(config_path);
        auto transaction = mysql.start_repeatable_read_transaction();
        auto report = reglist::report::build_registration_report(mysql, *competition_id);
        transaction.commit();
        if (report.is_err()) {
            errlog(report.err().message);
            return 2;
        }
        auto json = reglist::report::to_json(report.ok());
        json += '\n';
        if (fwrite(json.data(), 1, json.size(), stdout) != json.size() or fflush(stdout)) {
            errlog("Writing the report failed");
            return 1;
        }
    } catch (const ConfigFile::ParseError& e) {
        errlog(config_path, ": ", e.what(), '\n', e.diagnostics());
        return 1;
    } catch (const reglist::InvariantViolation& e) {
        errlog("Inconsistent data of competition ", *competition_id, ": ", e.what());
        return 1;
    } catch (const std::exception& e) {
        errlog("Generating report of competition ", *competition_id, " failed: ", e.what());
        return 1;
    }
    return 0;
}
