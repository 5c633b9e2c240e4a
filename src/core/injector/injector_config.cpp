#include "strand/core/injector/injector_config.h"
#include "strand/common/log/strand_log_manager.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace strand {
namespace core {
namespace injector {

bool InjectorConfig::LoadFromFile(const std::string& config_file) {
    try {
        if (!std::filesystem::exists(config_file)) {
            std::cerr << "Configuration file not found: " << config_file << std::endl;
            return false;
        }
        
        std::ifstream file(config_file);
        if (!file.is_open()) {
            std::cerr << "Failed to open configuration file: " << config_file << std::endl;
            return false;
        }
        
        std::string content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
        file.close();
        
        return LoadFromString(content);
        
    } catch (const std::exception& e) {
        std::cerr << "Error loading config file " << config_file << ": " << e.what() << std::endl;
        return false;
    }
}

bool InjectorConfig::LoadFromString(const std::string& json_content) {
    loaded_ = false;
    
    try {
        raw_config_ = nlohmann::json::parse(json_content);
        
        // 设置默认值
        settings_ = InjectorSettings{};
        
        if (!ParseInjectorSection(raw_config_)) return false;
        
        if (!Validate()) {
            std::cerr << "Configuration validation failed" << std::endl;
            return false;
        }
        
        loaded_ = true;
        return true;
        
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing configuration: " << e.what() << std::endl;
        return false;
    }
}

bool InjectorConfig::ParseInjectorSection(const nlohmann::json& json) {
    try {
        if (!json.contains("injector")) {
            return true;
        }
        
        const auto& injector_json = json["injector"];
        
        if (injector_json.contains("check_for_cycles")) {
            const auto mode_str = injector_json["check_for_cycles"].get<std::string>();
            auto mode = ParseCycleCheckMode(mode_str);
            if (!mode) {
                std::cerr << "Unknown check_for_cycles value: " << mode_str << std::endl;
                return false;
            }
            settings_.check_for_cycles = *mode;
        }
        
        if (injector_json.contains("log_events")) {
            settings_.log_events = injector_json["log_events"].get<bool>();
        }
        
        if (injector_json.contains("logger")) {
            settings_.logger = injector_json["logger"].get<std::string>();
        }
        
        if (injector_json.contains("log_level")) {
            const auto level_str = injector_json["log_level"].get<std::string>();
            auto level = common::log::ParseLogLevel(level_str);
            if (!level) {
                std::cerr << "Unknown log_level value: " << level_str << std::endl;
                return false;
            }
            settings_.log_level = *level;
        }
        
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing injector config: " << e.what() << std::endl;
        return false;
    }
}

bool InjectorConfig::Validate() const {
    if (settings_.log_events && settings_.logger.empty()) {
        std::cerr << "injector.logger must not be empty when log_events is enabled" << std::endl;
        return false;
    }
    return true;
}

std::optional<nlohmann::json> InjectorConfig::GetLoggingSection() const {
    if (raw_config_.is_object() && raw_config_.contains("logging")) {
        return raw_config_["logging"];
    }
    return std::nullopt;
}

InjectorOptions InjectorConfig::ToOptions() const {
    InjectorOptions options;
    options.check_for_cycles = settings_.check_for_cycles;
    if (settings_.log_events) {
        options.log = common::log::MakeLoggerSink(settings_.logger, settings_.log_level);
    }
    return options;
}

} // namespace injector
} // namespace core
} // namespace strand
