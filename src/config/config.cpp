#include "framecast/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "framecast/utils/logging.hpp"

namespace framecast::config {

namespace {

// Minimal INI reader: [section], key = value, '#' or ';' comments
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;
            trim(line);

            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                trim(current_section);
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);
            trim(key);
            trim(value);

            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }

            entries.push_back({current_section, key, value, line_number});
        }

        return entries;
    }

private:
    static void trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t\r\n"));
        s.erase(s.find_last_not_of(" \t\r\n") + 1);
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Whole-string unsigned integer; rejects signs, units and other trailing text
uint64_t parse_unsigned(const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument("not an unsigned integer");
    }
    size_t pos = 0;
    unsigned long long result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

double parse_number(const std::string& value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

uint16_t parse_port(const std::string& value) {
    uint64_t port = parse_unsigned(value);
    if (port > 65535) {
        throw std::out_of_range("port out of range");
    }
    return static_cast<uint16_t>(port);
}

// Apply one entry; false if the key is unknown. Throws on malformed numbers.
bool apply_entry(FramecastConfig& config, const std::string& section, const std::string& key,
                 const std::string& value) {
    if (section == "network") {
        if (key == "listen_host") {
            config.listen_address.host = value;
        } else if (key == "listen_port") {
            config.listen_address.port = parse_port(value);
        } else if (key == "target_host") {
            config.target_address.host = value;
        } else if (key == "target_port") {
            config.target_address.port = parse_port(value);
        } else {
            return false;
        }
    } else if (section == "fragmenter") {
        if (key == "chunk_size") {
            config.fragmenter.chunk_size = static_cast<size_t>(parse_unsigned(value));
        } else if (key == "fps") {
            config.fragmenter.fps = parse_number(value);
        } else {
            return false;
        }
    } else if (section == "reassembler") {
        if (key == "frame_timeout_ms") {
            config.reassembler.frame_timeout_ms = parse_unsigned(value);
        } else if (key == "sweep_interval_ms") {
            config.sweeper.sweep_interval_ms = parse_unsigned(value);
        } else {
            return false;
        }
    } else if (section == "watcher") {
        if (key == "source_dir") {
            config.watcher.source_dir = value;
        } else if (key == "pattern") {
            config.watcher.pattern = value;
        } else if (key == "poll_interval_ms") {
            config.watcher.poll_interval_ms = parse_unsigned(value);
        } else if (key == "cache_clear_interval_ms") {
            config.watcher.cache_clear_interval_ms = parse_unsigned(value);
        } else {
            return false;
        }
    } else if (section == "sink") {
        if (key == "output_dir") {
            config.sink.output_dir = value;
        } else if (key == "extension") {
            config.sink.extension = value;
        } else {
            return false;
        }
    } else if (section == "logging") {
        if (key == "level") {
            config.log_level = value;
        } else {
            return false;
        }
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::optional<FramecastConfig> load_config(const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file) {
        if (error) {
            *error = "cannot open '" + path + "'";
        }
        return std::nullopt;
    }

    FramecastConfig config;
    for (const auto& entry : IniParser::parse(file)) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            if (!apply_entry(config, section, key, entry.value)) {
                spdlog::warn("{}:{}: unknown key '{}' in section [{}]", path, entry.line,
                             entry.key, entry.section);
            }
        } catch (const std::exception& e) {
            if (error) {
                std::ostringstream msg;
                msg << path << ":" << entry.line << ": invalid value '" << entry.value
                    << "' for " << entry.key;
                *error = msg.str();
            }
            return std::nullopt;
        }
    }

    return config;
}

std::optional<FramecastConfig> parse_cli(Role role, int argc, char* argv[], int* exit_code,
                                         std::string* dump_path) {
    const bool sender = role == Role::SENDER;

    // First pass only looks for the configuration file
    std::string config_path;
    {
        CLI::App pre;
        pre.allow_extras();
        pre.set_help_flag();
        pre.add_option("-c,--config", config_path);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError&) {
            config_path.clear();
        }
    }

    FramecastConfig config;
    if (!config_path.empty()) {
        std::string error;
        auto loaded = load_config(config_path, &error);
        if (!loaded) {
            spdlog::error("Failed to load configuration: {}", error);
            if (exit_code) {
                *exit_code = 1;
            }
            return std::nullopt;
        }
        config = *loaded;
    }

    CLI::App app{sender ? "framecast sender - stream new files as UDP frames"
                        : "framecast receiver - reassemble UDP frames into files"};

    std::string dump;
    app.add_option("-c,--config", config_path, "INI configuration file");
    app.add_option("--dump-config", dump, "Write the effective configuration to a file and exit");
    app.add_option("-l,--log-level", config.log_level, "Log level: trace,debug,info,warn,error");

    if (sender) {
        app.add_option("-t,--target", config.target_address.host, "Target host");
        app.add_option("--target-port", config.target_address.port, "Target port");
        app.add_option("--chunk-size", config.fragmenter.chunk_size,
                       "Payload bytes per datagram");
        app.add_option("--fps", config.fragmenter.fps, "Chunk pacing rate (1/fps between chunks)");
        app.add_option("-s,--source-dir", config.watcher.source_dir, "Folder to watch");
        app.add_option("--pattern", config.watcher.pattern, "File name glob");
        app.add_option("--poll-interval", config.watcher.poll_interval_ms,
                       "Folder poll interval in ms");
        app.add_option("--cache-clear-interval", config.watcher.cache_clear_interval_ms,
                       "Sent-file cache clear interval in ms");
    } else {
        app.add_option("-b,--bind", config.listen_address.host, "Local bind address");
        app.add_option("-p,--port", config.listen_address.port, "Local port");
        app.add_option("--frame-timeout", config.reassembler.frame_timeout_ms,
                       "Discard incomplete frames idle for this many ms");
        app.add_option("--sweep-interval", config.sweeper.sweep_interval_ms,
                       "Incomplete frame sweep period in ms");
        app.add_option("-o,--output-dir", config.sink.output_dir, "Folder for received frames");
        app.add_option("--extension", config.sink.extension, "File extension for received frames");
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        if (exit_code) {
            *exit_code = code;
        }
        return std::nullopt;
    }

    if (dump_path) {
        *dump_path = dump;
    }
    return config;
}

bool save_config(const FramecastConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[network]\n";
    file << "listen_host = " << config.listen_address.host << "\n";
    file << "listen_port = " << config.listen_address.port << "\n";
    file << "target_host = " << config.target_address.host << "\n";
    file << "target_port = " << config.target_address.port << "\n";
    file << "\n";

    file << "[fragmenter]\n";
    file << "chunk_size = " << config.fragmenter.chunk_size << "\n";
    file << "fps = " << config.fragmenter.fps << "\n";
    file << "\n";

    file << "[reassembler]\n";
    file << "frame_timeout_ms = " << config.reassembler.frame_timeout_ms << "\n";
    file << "sweep_interval_ms = " << config.sweeper.sweep_interval_ms << "\n";
    file << "\n";

    file << "[watcher]\n";
    file << "source_dir = \"" << config.watcher.source_dir << "\"\n";
    file << "pattern = \"" << config.watcher.pattern << "\"\n";
    file << "poll_interval_ms = " << config.watcher.poll_interval_ms << "\n";
    file << "cache_clear_interval_ms = " << config.watcher.cache_clear_interval_ms << "\n";
    file << "\n";

    file << "[sink]\n";
    file << "output_dir = \"" << config.sink.output_dir << "\"\n";
    file << "extension = \"" << config.sink.extension << "\"\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << config.log_level << "\n";

    return static_cast<bool>(file);
}

ValidationResult validate_config(const FramecastConfig& config, Role role) {
    ValidationResult result;

    auto error = [&result](std::string msg) {
        result.errors.push_back(std::move(msg));
        result.valid = false;
    };

    if (!utils::parse_log_level(config.log_level)) {
        result.warnings.push_back("Unknown log level '" + config.log_level + "' - using info");
    }

    if (role == Role::SENDER) {
        if (config.target_address.host.empty()) {
            error("Target host is empty");
        }
        if (config.target_address.port == 0) {
            error("Target port is 0");
        }
        if (config.fragmenter.chunk_size == 0) {
            error("Chunk size must be positive");
        } else if (config.fragmenter.chunk_size > MAX_CHUNK_SIZE) {
            error("Chunk size too large (maximum " + std::to_string(MAX_CHUNK_SIZE) + ")");
        } else if (config.fragmenter.chunk_size > RECOMMENDED_MAX_CHUNK_SIZE) {
            result.warnings.push_back("Chunk size above " +
                                      std::to_string(RECOMMENDED_MAX_CHUNK_SIZE) +
                                      " bytes - datagrams will be IP-fragmented");
        }
        if (!(config.fragmenter.fps > 0.0)) {
            error("fps must be positive");
        }
        if (config.watcher.source_dir.empty()) {
            error("Source folder is empty");
        }
        if (config.watcher.pattern.empty()) {
            error("File pattern is empty");
        }
        if (config.watcher.poll_interval_ms == 0) {
            error("Poll interval must be positive");
        }
        if (config.watcher.cache_clear_interval_ms < config.watcher.poll_interval_ms) {
            result.warnings.push_back("Cache clear interval shorter than poll interval - "
                                      "files may be re-sent on every poll");
        }
    } else {
        if (config.listen_address.port == 0) {
            result.warnings.push_back("Listen port is 0 - will use ephemeral port");
        }
        if (config.reassembler.frame_timeout_ms == 0) {
            error("Frame timeout must be positive");
        }
        if (config.sweeper.sweep_interval_ms == 0) {
            error("Sweep interval must be positive");
        }
        if (config.sink.output_dir.empty()) {
            error("Output folder is empty");
        }
    }

    return result;
}

transport::ReceiverSessionConfig receiver_session_config(const FramecastConfig& config) {
    transport::ReceiverSessionConfig session;
    session.listen_address = config.listen_address;
    session.reassembler = config.reassembler;
    session.sweeper = config.sweeper;
    return session;
}

}  // namespace framecast::config
