#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace wledbackup::cli {

// Only the flags given on the command line are set; everything else comes from config.
struct CliOptions {
    std::optional<std::string> out_dir;
    std::optional<std::uint64_t> search_secs;
    std::optional<std::string> policy;
    std::optional<std::size_t> jobs;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    bool show_help = false;
    bool show_version = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);
    explicit ArgumentParser(std::vector<std::string> args);

    // 解析命令行参数; throws std::runtime_error on invalid input
    CliOptions Parse();

    // 显示帮助信息
    static void ShowHelp(std::ostream& os);

private:
    std::vector<std::string> args_;
    std::size_t i_; // 当前解析的参数索引

    // 参数解析
    void parseOption(const std::string& arg, CliOptions& options);
    std::string takeValue(const std::string& flag, std::optional<std::string>& inline_value);

    // 参数验证
    static void validateOptions(const CliOptions& options);
};

} // namespace wledbackup::cli
