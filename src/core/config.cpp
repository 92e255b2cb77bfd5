#include "chunkflow/core/config.hpp"
#include "chunkflow/core/utils.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <cctype>

namespace chunkflow::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

// Accepts flat "a.b = c" lines as well as "[a]" sections whose keys are
// stored as "a.<key>". Malformed lines are skipped with a warning.
bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string section;
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        
        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN("{}:{}: unterminated section header", filename, line_number);
                continue;
            }
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key = value", filename, line_number);
            continue;
        }
        
        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

// Keys are grouped under a section per leading component, so a saved file
// loads back to the same flat keys.
bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# ChunkFlow configuration\n";
    
    std::string current_section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        std::string section = dot == std::string::npos ? "" : key.substr(0, dot);
        std::string name = dot == std::string::npos ? key : key.substr(dot + 1);
        
        if (section != current_section) {
            file << "\n[" << section << "]\n";
            current_section = section;
        }
        file << name << " = " << value << "\n";
    }
    
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value || value->empty() || value->front() == '-') return default_value;
    
    auto parsed = get_as<std::uint64_t>(key);
    return parsed ? *parsed : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["broadcaster.tick_ms"] = "16";
    values_["broadcaster.max_bytes_per_sec"] = "6291456";
    values_["broadcaster.burst_bytes"] = "262144";
    values_["broadcaster.max_queue_bytes"] = "52428800";
    values_["analytics.retransmission_cost_bytes"] = "1024";
    values_["cache.max_entries"] = "50";
    values_["cache.max_bytes"] = "52428800";
    values_["cache.ttl_ms"] = "60000";
    values_["transfer.enforce_file_policy"] = "true";
    values_["recovery.max_retries"] = "5";
    values_["recovery.initial_delay_ms"] = "1000";
    values_["recovery.max_delay_ms"] = "30000";
    values_["recovery.backoff_multiplier"] = "2";
    values_["scheduler.default_priority"] = "5";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkflow.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

} // namespace chunkflow::core
