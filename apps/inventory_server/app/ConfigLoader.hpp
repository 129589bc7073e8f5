#pragma once
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

class ConfigLoader {
public:
    explicit ConfigLoader(const std::string& filePath) {
        try {
            config_ = std::make_shared<YAML::Node>(YAML::LoadFile(filePath));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config file: " + std::string(e.what()));
        }
    }

    // 直接从 YAML 文本构造（测试用）
    static ConfigLoader FromString(const std::string& yaml) {
        try {
            return ConfigLoader(YAML::Load(yaml));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to parse config: " + std::string(e.what()));
        }
    }

    // 获取标量值（支持默认值）
    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        YAML::Node node = (*config_)[key];
        if (!node.IsDefined() || node.IsNull())
            return defaultValue;
        return convert<T>(node, key);
    }

    // 分层路径读取；路径不存在时返回默认值，类型不匹配时抛出 runtime_error
    template <typename T>
    T getPath(const std::string& path, const T& defaultValue) const {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull())
            return defaultValue;
        return convert<T>(node, path);
    }

    YAML::Node operator[](const std::string& key) const { return (*config_)[key]; }
    bool has(const std::string& key) const { return (*config_)[key] && !(*config_)[key].IsNull(); }

    void dump(std::ostream& os = std::cout) const { os << YAML::Dump(*config_) << std::endl; }

private:
    explicit ConfigLoader(YAML::Node root) : config_(std::make_shared<YAML::Node>(std::move(root))) {}

    YAML::Node lookup(const std::string& path) const {
        YAML::Node node;
        node.reset(*config_);  // reset 只重绑引用；operator= 会改写原树
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '.')) {
            if (!node.IsMap())
                return YAML::Node(YAML::NodeType::Undefined);
            const YAML::Node& current = node;
            YAML::Node child = current[segment];
            if (!child.IsDefined())
                return child;
            node.reset(child);
        }
        return node;
    }

    template <typename T>
    static T convert(const YAML::Node& node, const std::string& path) {
        try {
            return node.as<T>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid value for config key '" + path + "': " + e.what());
        }
    }

    std::shared_ptr<YAML::Node> config_;
};
