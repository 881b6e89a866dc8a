#include <charconv>
#include <cli/argument_parser.h>
#include <core/backup/identity_policy_kind.h>
#include <core/constant/transfer.h>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace wledbackup::cli {

namespace {

template<typename T>
T parseNumber(const std::string& flag, const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw std::runtime_error("Invalid number for " + flag + ": " + text);
    }
    return value;
}

} // namespace

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : i_(0) {
    for (int n = 1; n < argc; ++n) {
        args_.emplace_back(argv[n]);
    }
}

ArgumentParser::ArgumentParser(std::vector<std::string> args)
    : args_(std::move(args))
    , i_(0) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;
    i_ = 0;

    while (i_ < args_.size()) {
        const std::string& arg = args_[i_];
        if (arg.empty() || arg[0] != '-') {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
        parseOption(arg, options);
        ++i_;
    }

    validateOptions(options);
    return options;
}

std::string ArgumentParser::takeValue(const std::string& flag,
                                      std::optional<std::string>& inline_value) {
    if (inline_value) {
        return *std::exchange(inline_value, std::nullopt);
    }
    if (++i_ >= args_.size()) {
        throw std::runtime_error("Missing value for " + flag);
    }
    return args_[i_];
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    std::string flag = arg;
    std::optional<std::string> inline_value;
    if (auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
        flag = arg.substr(0, eq);
        inline_value = arg.substr(eq + 1);
    }

    if (flag == "-o" || flag == "--out-dir") {
        options.out_dir = takeValue(flag, inline_value);
    } else if (flag == "-s" || flag == "--search-secs") {
        options.search_secs = parseNumber<std::uint64_t>(flag, takeValue(flag, inline_value));
    } else if (flag == "-p" || flag == "--policy") {
        options.policy = takeValue(flag, inline_value);
    } else if (flag == "-j" || flag == "--jobs") {
        options.jobs = parseNumber<std::size_t>(flag, takeValue(flag, inline_value));
    } else if (flag == "-c" || flag == "--config") {
        options.config_path = takeValue(flag, inline_value);
    } else if (flag == "-l" || flag == "--log-level") {
        options.log_level = takeValue(flag, inline_value);
    } else if (flag == "-h" || flag == "--help") {
        options.show_help = true;
    } else if (flag == "-V" || flag == "--version") {
        options.show_version = true;
    } else {
        throw std::runtime_error("Unknown option: " + arg);
    }

    if (inline_value) {
        throw std::runtime_error("Option " + flag + " does not take a value");
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.out_dir && options.out_dir->empty()) {
        throw std::runtime_error("Output directory must not be empty");
    }
    if (options.search_secs && *options.search_secs > core::mdns::kMaxSearchSecs) {
        throw std::runtime_error("Search time must be at most "
                                 + std::to_string(core::mdns::kMaxSearchSecs) + " seconds");
    }
    if (options.jobs && *options.jobs == 0) {
        throw std::runtime_error("Jobs must be at least 1");
    }
    if (options.policy && !core::IdentityPolicyKindFromString(*options.policy)) {
        throw std::runtime_error("Invalid policy: " + *options.policy
                                 + " (expected config or hostname)");
    }
    if (options.log_level) {
        const auto& level = *options.log_level;
        if (level != "trace" && level != "debug" && level != "info" && level != "warn"
            && level != "warning" && level != "error" && level != "off") {
            throw std::runtime_error("Invalid log level: " + level);
        }
    }
}

void ArgumentParser::ShowHelp(std::ostream& os) {
    os << "Usage: wled-backup [options]\n\n"
       << "Discovers WLED controllers via mDNS and saves their configuration and presets.\n\n"
       << "Options:\n"
       << "  -o, --out-dir DIR       Directory to save backups in (default: .)\n"
       << "  -s, --search-secs N     Stop searching after N quiet seconds (default: 4)\n"
       << "  -p, --policy POLICY     File naming: config (cfg.json id.name, saves\n"
       << "                          <name>_cfg.json and <name>_presets.json) or hostname\n"
       << "                          (mDNS hostname, saves <name>.json) (default: config)\n"
       << "  -j, --jobs N            Back up N devices at a time (default: 1)\n"
       << "  -c, --config PATH       Read settings from a TOML file\n"
       << "  -l, --log-level LVL     trace|debug|info|warn|error|off (default: info)\n"
       << "  -V, --version           Print version and exit\n"
       << "  -h, --help              Show this help message\n\n"
       << "Exit status: 0 all devices backed up, 1 some device failed, 2 fatal error.\n";
}

} // namespace wledbackup::cli
